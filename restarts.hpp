#pragma once

#include "expectation_maximization.hpp"
#include "mixture_data.hpp"

#include <cstdint>
#include <functional>
#include <random>
#include <vector>

/** Parameters controlling the random restarts. */
struct RestartParams {
    /** number of EM runs, each from a different random starting point */
    uint32_t num_restarts = 1;
    /** seed of the generator used for drawing the starting points */
    uint32_t seed = 42;
    uint32_t num_threads = 1;
    /**
     * if true, runs that hit the iteration cap are included in the mean/variance of the final
     * estimates; failed runs are never included
     */
    bool include_unconverged = false;
    /** two final estimates at most this far apart (max-abs distance) are the same fixed point */
    double fixed_point_tolerance = 0.05;
};

/** A group of final estimates that ended up (almost) in the same place. */
struct FixedPoint {
    /** the mean of the estimates in the group */
    Theta theta;
    uint32_t count;
};

struct RestartSummary {
    /** the starting point of each run */
    std::vector<Theta> starts;
    /** the result of each run, in the same order as #starts */
    std::vector<EMResult> runs;
    uint32_t converged = 0;
    /** runs that hit the iteration cap */
    uint32_t not_converged = 0;
    /** runs that were rejected or ended with a degenerate likelihood or an empty coin */
    uint32_t failed = 0;
    /** mean of the final estimates of the included runs, NaN if there are none */
    Theta mean = { 0, 0 };
    /** sample variance of the final estimates of the included runs (0 for a single run) */
    Theta variance = { 0, 0 };
    /** the distinct final estimates of the included runs, in order of first appearance */
    std::vector<FixedPoint> fixed_points;
};

/** Draws a starting point for an EM run. */
using ThetaSampler = std::function<Theta(std::mt19937 &)>;

/** Draws theta_A and theta_B independently and uniformly from [0,1). */
Theta uniform_theta(std::mt19937 &rng);

/**
 * Runs EM #restart_params.num_restarts times from random starting points in order to find out
 * how sensitive the estimate is to the initialization. The starting points are drawn
 * sequentially from a single generator seeded with #restart_params.seed, so the result doesn't
 * depend on the number of threads. A run that fails (invalid starting point, degenerate
 * likelihood) is counted and reported, but doesn't affect the other runs.
 * @param successes number of heads in each experiment
 * @param trials number of tosses in each experiment
 * @param params parameters of each EM run
 * @throws std::invalid_argument if the data or the parameters (other than the randomly drawn
 * starting points) are invalid
 */
RestartSummary run_restarts(const std::vector<uint32_t> &successes,
                            uint32_t trials,
                            const EMParams &params,
                            const RestartParams &restart_params,
                            const ThetaSampler &sampler = uniform_theta);

/**
 * Groups estimates that are at most #tolerance apart (in max-abs distance) from the first
 * estimate of a group.
 */
std::vector<FixedPoint> find_fixed_points(const std::vector<Theta> &estimates, double tolerance);
