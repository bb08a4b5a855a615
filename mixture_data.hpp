#pragma once

#include <cstdint>
#include <optional>
#include <vector>

/**
 * The parameters of the two-coin mixture: the probability of success (heads) for coin A and for
 * coin B. Each iteration of the EM produces a new Theta; previous values are never modified.
 */
struct Theta {
    double a;
    double b;

    /** The same estimate with the roles of the two coins swapped. */
    Theta swapped() const { return { b, a }; }

    bool operator==(const Theta &other) const { return a == other.a && b == other.b; }
    bool operator!=(const Theta &other) const { return !(*this == other); }
};

/** Mean and standard deviation of a Gaussian prior placed on one of the coin parameters. */
struct GaussianParams {
    double mean;
    double stddev;
};

/** Independent Gaussian priors on theta_A and theta_B (MAP mode only). */
struct Prior {
    GaussianParams a;
    GaussianParams b;

    Prior swapped() const { return { b, a }; }
};

/**
 * How the prior is taken into account in MAP mode:
 *   REWEIGHT - the prior density at the current theta multiplies the likelihood of each coin in
 * the E-step; the M-step stays the plain ratio of expected counts. This is an approximation of
 * MAP (a biased EM), and it is the default.
 *   PENALIZED - the E-step ignores the prior, and the M-step maximizes the expected
 * complete-data log-likelihood plus the log prior (exact posterior-mode EM).
 */
enum class MapUpdate { REWEIGHT, PENALIZED };

/**
 * How a single EM run ended:
 *   CONVERGED - the largest parameter change dropped to or below epsilon
 *   MAX_ITERS_EXCEEDED - the iteration cap was reached first
 *   DEGENERATE_LIKELIHOOD - both coins assign probability exactly 0 to some experiment
 *   EMPTY_COMPONENT - one of the coins received no responsibility mass at all, so its parameter
 * can't be re-estimated
 *   INVALID_START - the initial parameters were rejected (only reported by the restart driver)
 */
enum class EMStatus {
    CONVERGED,
    MAX_ITERS_EXCEEDED,
    DEGENERATE_LIKELIHOOD,
    EMPTY_COMPONENT,
    INVALID_START
};

/** True for the statuses that indicate a failed run (as opposed to converged or capped). */
inline bool is_failure(EMStatus status) {
    return status != EMStatus::CONVERGED && status != EMStatus::MAX_ITERS_EXCEEDED;
}

/** Tuning parameters of an EM run. */
struct EMParams {
    /** stop when max(|Δtheta_A|, |Δtheta_B|) <= epsilon */
    double epsilon = 1e-3;
    uint32_t max_iterations = 100;
    /** if present, run in MAP mode with the given priors */
    std::optional<Prior> prior;
    MapUpdate map_update = MapUpdate::REWEIGHT;
};

/** The outcome of one EM run. */
struct EMResult {
    /** the last valid estimate */
    Theta theta = { 0, 0 };
    /** number of EM updates performed */
    uint32_t iterations = 0;
    EMStatus status = EMStatus::MAX_ITERS_EXCEEDED;
    /** theta before the first iteration followed by the estimate after each iteration */
    std::vector<Theta> trajectory;
    /** observed-data log-likelihood of each estimate in #trajectory */
    std::vector<double> log_likelihoods;
};
