#include "exact_mle.hpp"

#include <array>
#include <stdexcept>
#include <string>

Theta exact_mle(const std::vector<uint32_t> &successes,
                uint32_t trials,
                const std::vector<uint8_t> &assignment) {
    if (successes.size() != assignment.size()) {
        throw std::invalid_argument("Got " + std::to_string(successes.size())
                                    + " experiments, but " + std::to_string(assignment.size())
                                    + " coin assignments");
    }
    if (trials == 0) {
        throw std::invalid_argument("Number of trials must be positive");
    }
    std::array<uint64_t, 2> heads = { 0, 0 };
    std::array<uint64_t, 2> experiments = { 0, 0 };
    for (uint32_t i = 0; i < successes.size(); ++i) {
        if (assignment[i] > 1) {
            throw std::invalid_argument("Invalid coin " + std::to_string(assignment[i])
                                        + " for experiment " + std::to_string(i));
        }
        if (successes[i] > trials) {
            throw std::invalid_argument("Experiment " + std::to_string(i) + " has "
                                        + std::to_string(successes[i])
                                        + " successes, but only " + std::to_string(trials)
                                        + " trials");
        }
        heads[assignment[i]] += successes[i];
        experiments[assignment[i]]++;
    }
    if (experiments[0] == 0 || experiments[1] == 0) {
        throw std::invalid_argument(std::string("Coin ") + (experiments[0] == 0 ? 'A' : 'B')
                                    + " was not used in any experiment");
    }
    return { static_cast<double>(heads[0]) / (static_cast<double>(trials) * experiments[0]),
             static_cast<double>(heads[1]) / (static_cast<double>(trials) * experiments[1]) };
}
