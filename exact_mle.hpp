#pragma once

#include "mixture_data.hpp"

#include <cstdint>
#include <vector>

/**
 * The maximum likelihood estimate of theta when it is known which coin was used in each
 * experiment: theta_c = (heads in experiments done with coin c) / (trials * number of experiments
 * done with coin c). Used as a reference when the hidden assignment is available (e.g. for
 * simulated data).
 * @param successes number of heads in each experiment
 * @param trials number of tosses in each experiment
 * @param assignment the coin used in each experiment, 0 for A and 1 for B
 * @throws std::invalid_argument if the sizes don't match, if an assignment is not 0 or 1, if an
 * experiment has more successes than trials, or if one of the coins wasn't used at all
 */
Theta exact_mle(const std::vector<uint32_t> &successes,
                uint32_t trials,
                const std::vector<uint8_t> &assignment);
