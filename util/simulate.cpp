#include "util/simulate.hpp"

#include <stdexcept>

SimulatedData simulate_experiments(uint32_t num_experiments,
                                   uint32_t trials,
                                   const Theta &truth,
                                   std::mt19937 &rng) {
    if (trials == 0) {
        throw std::invalid_argument("Number of trials must be positive");
    }
    if (!(truth.a >= 0 && truth.a <= 1 && truth.b >= 0 && truth.b <= 1)) {
        throw std::invalid_argument("True coin parameters must be in [0,1]");
    }
    std::bernoulli_distribution pick_b(0.5);
    std::binomial_distribution<uint32_t> tosses_a(trials, truth.a);
    std::binomial_distribution<uint32_t> tosses_b(trials, truth.b);

    SimulatedData result;
    result.successes.reserve(num_experiments);
    result.assignment.reserve(num_experiments);
    for (uint32_t i = 0; i < num_experiments; ++i) {
        uint8_t coin = pick_b(rng) ? 1 : 0;
        result.assignment.push_back(coin);
        result.successes.push_back(coin == 0 ? tosses_a(rng) : tosses_b(rng));
    }
    return result;
}
