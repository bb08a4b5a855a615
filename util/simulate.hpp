#pragma once

#include "mixture_data.hpp"

#include <cstdint>
#include <random>
#include <vector>

/** Outcome of a simulated two-coin experiment, including the normally hidden coin assignment. */
struct SimulatedData {
    /** number of heads in each experiment */
    std::vector<uint32_t> successes;
    /** the coin used in each experiment, 0 for A, 1 for B */
    std::vector<uint8_t> assignment;
};

/**
 * Simulates #num_experiments experiments: for each one, a coin is chosen uniformly at random and
 * tossed #trials times.
 * @param truth the head probabilities of the two coins, each in [0,1]
 * @param rng the source of randomness; pass a seeded engine for reproducible data
 * @throws std::invalid_argument if trials is 0 or truth is not a valid pair of probabilities
 */
SimulatedData simulate_experiments(uint32_t num_experiments,
                                   uint32_t trials,
                                   const Theta &truth,
                                   std::mt19937 &rng);
