#pragma once

#include "mixture_data.hpp"

#include <cstdint>
#include <optional>
#include <vector>

/**
 * Keeps track of the parameter estimates of one EM run and decides when the run is over.
 * The improvement of an iteration is the largest absolute change of a coin parameter,
 * max(|theta_A - theta_A'|, |theta_B - theta_B'|). The run converged as soon as the improvement
 * is at most epsilon; it is exhausted once max_iterations estimates were added.
 */
class ConvergenceMonitor {
  private:
    double epsilon_;
    uint32_t max_iterations_;
    double improvement_;
    std::vector<Theta> trajectory_;

  public:
    /**
     * @throws std::invalid_argument if epsilon <= 0 or max_iterations == 0
     */
    ConvergenceMonitor(double epsilon, uint32_t max_iterations);

    /** Starts tracking a new run beginning at #initial. */
    void reset(const Theta &initial);

    /**
     * Records the estimate produced by the next iteration.
     * @return the improvement with respect to the previous estimate
     * @throws std::logic_error if #reset() was never called
     */
    double add(const Theta &theta);

    bool converged() const;

    /** True if the iteration cap was reached without converging. */
    bool exhausted() const;

    bool done() const { return converged() || exhausted(); }

    /** Number of estimates added since the last #reset. */
    uint32_t iteration() const;

    /** Improvement of the last iteration, infinity before the first one. */
    double improvement() const { return improvement_; }

    /**
     * The last recorded estimate.
     * @throws std::logic_error if #reset() was never called
     */
    const Theta &current() const;

    const std::vector<Theta> &trajectory() const { return trajectory_; }

    double epsilon() const { return epsilon_; }
    uint32_t max_iterations() const { return max_iterations_; }

    /** The largest absolute component-wise difference between two estimates. */
    static double improvement(const Theta &previous, const Theta &current);
};

/**
 * Given the snapshots of a run (the initial estimate first), returns the first iteration at which
 * the improvement drops to or below #epsilon, or an empty optional if this doesn't happen within
 * the first #max_iterations iterations.
 */
std::optional<uint32_t> first_converged_iteration(const std::vector<Theta> &snapshots,
                                                  double epsilon,
                                                  uint32_t max_iterations);
