#pragma once

#include "convergence_monitor.hpp"
#include "mixture_data.hpp"

#include <cstdint>
#include <string>
#include <vector>

/*
 * Expectation-Maximization for a mixture of two coins. Each experiment consists of #trials tosses
 * of one of two coins, A or B, chosen at random; only the number of heads (successes) of each
 * experiment is observed, the coin is not. EM alternates between computing, for each experiment,
 * the probability that it was performed with coin A or B (the E step), and re-estimating the head
 * probabilities of the two coins from the resulting expected head/tail counts (the M step).
 * See e.g. Do & Batzoglou, "What is the expectation maximization algorithm?", Nature Biotech 2008.
 */

/**
 * The expected number of heads and tails attributed to each coin, summed over all experiments.
 */
struct ExpectedCounts {
    double successes_a = 0;
    double failures_a = 0;
    double successes_b = 0;
    double failures_b = 0;
};

/**
 * The E (expectation) step, see
 * https://en.wikipedia.org/wiki/Expectation%E2%80%93maximization_algorithm#E_step
 *
 * Computes the responsibility of coin A for each experiment, i.e. the probability that the
 * experiment was performed with coin A given the current estimate #theta (the responsibility of
 * coin B is 1 minus that), and accumulates the expected head and tail counts of each coin.
 * @param successes number of heads in each experiment
 * @param trials number of tosses in each experiment
 * @param theta the current estimate
 * @param prior if not null, the prior density at theta multiplies the likelihood of each coin
 * (the REWEIGHT approximation of MAP)
 * @param[out] weight_a the responsibility of coin A for each experiment
 * @param[out] counts the expected counts of heads and tails for each coin
 * @return false if for some experiment both coins have likelihood exactly 0, in which case
 * the responsibilities are undefined and the content of weight_a and counts must not be used
 */
bool expectation_step(const std::vector<uint32_t> &successes,
                      uint32_t trials,
                      const Theta &theta,
                      const Prior *prior,
                      std::vector<double> *weight_a,
                      ExpectedCounts *counts);

/**
 * The M (maximization) step: re-estimates theta from the expected counts. Without a prior, the
 * new estimate for each coin is its expected number of heads divided by its expected number of
 * tosses. With a prior (PENALIZED MAP), each coin parameter maximizes the expected
 * complete-data log-likelihood plus the log of its Gaussian prior.
 * @param[out] theta the new estimate
 * @return false if one of the coins has a zero expected number of tosses
 */
bool maximization_step(const ExpectedCounts &counts, const Prior *prior, Theta *theta);

/**
 * Maximizes s*log(x) + f*log(1-x) + log N(x; prior.mean, prior.stddev) over x in [0,1]. The
 * derivative of the objective is strictly decreasing on (0,1), so its root is found by bisection.
 * @VisibleForTesting
 */
double penalized_estimate(double successes, double failures, const GaussianParams &prior);

/**
 * The observed-data log-likelihood of #theta, assuming each experiment picks coin A or B with
 * probability 1/2: sum_i log(pmf(h_i; theta_A)/2 + pmf(h_i; theta_B)/2).
 */
double log_likelihood(const std::vector<uint32_t> &successes, uint32_t trials, const Theta &theta);

/**
 * Parses "REWEIGHT" or "PENALIZED".
 * @throws std::invalid_argument for any other value
 */
MapUpdate parse_map_update(const std::string &map_update);

std::string to_string(EMStatus status);

enum class EMState { INITIALIZED, ITERATING, TERMINATED };

/**
 * A single EM run for the two-coin mixture, starting from a given estimate.
 * The run is fully deterministic: the only inputs are the observed data, the initial estimate and
 * the parameters. Calling #step() advances the state INITIALIZED -> ITERATING -> TERMINATED, and
 * once TERMINATED, #status() tells whether the run converged, hit the iteration cap or failed.
 */
class ExpectationMaximization {
  private:
    std::vector<uint32_t> successes_;
    uint32_t trials_;
    EMParams params_;
    ConvergenceMonitor monitor_;
    EMState state_ = EMState::INITIALIZED;
    EMStatus status_ = EMStatus::MAX_ITERS_EXCEEDED;
    std::vector<double> weight_a_;
    std::vector<double> log_likelihoods_;

  public:
    /**
     * @param successes number of heads in each experiment, each at most #trials
     * @param trials number of tosses in each experiment
     * @param initial initial estimate, both components strictly inside (0,1)
     * @param params convergence threshold, iteration cap and optional prior
     * @throws std::invalid_argument if any of the parameters is invalid
     */
    ExpectationMaximization(const std::vector<uint32_t> &successes,
                            uint32_t trials,
                            const Theta &initial,
                            const EMParams &params = {});

    /**
     * Performs one E step followed by one M step.
     * @return true if the run continues, false if it terminated
     */
    bool step();

    /** Iterates until termination and returns the result. */
    EMResult run();

    EMState state() const { return state_; }

    /** How the run ended; only meaningful once #state() is TERMINATED. */
    EMStatus status() const { return status_; }

    /** The current estimate. */
    const Theta &theta() const { return monitor_.current(); }

    uint32_t iteration() const { return monitor_.iteration(); }

    /** The responsibilities of coin A computed in the last E step. */
    const std::vector<double> &responsibilities() const { return weight_a_; }

    /** Snapshot of the run so far. */
    EMResult result() const;
};
