#include "restarts.hpp"

#include "convergence_monitor.hpp"
#include "util/logger.hpp"

#include <armadillo>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

Theta uniform_theta(std::mt19937 &rng) {
    std::uniform_real_distribution<double> uniform(0, 1);
    double a = uniform(rng);
    double b = uniform(rng);
    return { a, b };
}

std::vector<FixedPoint> find_fixed_points(const std::vector<Theta> &estimates, double tolerance) {
    std::vector<Theta> representatives;
    std::vector<Theta> sums;
    std::vector<FixedPoint> result;
    for (const Theta &estimate : estimates) {
        uint32_t idx = 0;
        while (idx < representatives.size()
               && ConvergenceMonitor::improvement(representatives[idx], estimate) > tolerance) {
            idx++;
        }
        if (idx == representatives.size()) {
            representatives.push_back(estimate);
            sums.push_back({ 0, 0 });
            result.push_back({ estimate, 0 });
        }
        sums[idx].a += estimate.a;
        sums[idx].b += estimate.b;
        result[idx].count++;
    }
    for (uint32_t i = 0; i < result.size(); ++i) {
        result[i].theta = { sums[i].a / result[i].count, sums[i].b / result[i].count };
    }
    return result;
}

RestartSummary run_restarts(const std::vector<uint32_t> &successes,
                            uint32_t trials,
                            const EMParams &params,
                            const RestartParams &restart_params,
                            const ThetaSampler &sampler) {
    if (restart_params.num_restarts == 0) {
        throw std::invalid_argument("Number of restarts must be at least 1");
    }
    if (restart_params.num_threads == 0) {
        throw std::invalid_argument("Number of threads must be at least 1");
    }
    if (!(restart_params.fixed_point_tolerance > 0)) {
        throw std::invalid_argument("Fixed point tolerance must be positive");
    }
    // validate everything except the starting points up front, so that bad data fails the whole
    // batch instead of every single run
    ExpectationMaximization validator(successes, trials, { 0.5, 0.5 }, params);

    const uint32_t num_restarts = restart_params.num_restarts;
    RestartSummary summary;
    std::mt19937 rng(restart_params.seed);
    summary.starts.reserve(num_restarts);
    for (uint32_t i = 0; i < num_restarts; ++i) {
        summary.starts.push_back(sampler(rng));
    }

    summary.runs.resize(num_restarts);
#pragma omp parallel for num_threads(restart_params.num_threads) schedule(dynamic)
    for (uint32_t i = 0; i < num_restarts; ++i) {
        const Theta &start = summary.starts[i];
        try {
            ExpectationMaximization em(successes, trials, start, params);
            summary.runs[i] = em.run();
        } catch (const std::invalid_argument &e) {
            logger()->warn("Restart {} rejected: {}", i, e.what());
            summary.runs[i].theta = start;
            summary.runs[i].status = EMStatus::INVALID_START;
            summary.runs[i].trajectory = { start };
        }
    }

    std::vector<Theta> included;
    for (uint32_t i = 0; i < num_restarts; ++i) {
        const EMResult &run = summary.runs[i];
        logger()->debug("Restart {}: start=({:.4f}, {:.4f}) -> ({:.4f}, {:.4f}), {} after {} "
                        "iterations",
                        i, summary.starts[i].a, summary.starts[i].b, run.theta.a, run.theta.b,
                        to_string(run.status), run.iterations);
        if (is_failure(run.status)) {
            summary.failed++;
        } else if (run.status == EMStatus::CONVERGED) {
            summary.converged++;
            included.push_back(run.theta);
        } else {
            summary.not_converged++;
            if (restart_params.include_unconverged) {
                included.push_back(run.theta);
            }
        }
    }

    if (included.empty()) {
        constexpr double nan = std::numeric_limits<double>::quiet_NaN();
        summary.mean = { nan, nan };
        summary.variance = { nan, nan };
        logger()->warn("None of the {} restarts produced a usable estimate", num_restarts);
        return summary;
    }

    arma::mat estimates(included.size(), 2);
    for (uint32_t i = 0; i < included.size(); ++i) {
        estimates(i, 0) = included[i].a;
        estimates(i, 1) = included[i].b;
    }
    arma::rowvec mean = arma::mean(estimates, 0);
    arma::rowvec variance = arma::var(estimates, 0, 0);
    summary.mean = { mean(0), mean(1) };
    summary.variance = { variance(0), variance(1) };
    summary.fixed_points = find_fixed_points(included, restart_params.fixed_point_tolerance);

    logger()->debug("{} restarts: {} converged, {} not converged, {} failed, {} fixed points",
                    num_restarts, summary.converged, summary.not_converged, summary.failed,
                    summary.fixed_points.size());
    return summary;
}
