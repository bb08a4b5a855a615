#include "exact_mle.hpp"
#include "expectation_maximization.hpp"
#include "mixture_data.hpp"
#include "restarts.hpp"
#include "util/logger.hpp"
#include "util/simulate.hpp"
#include "util/util.hpp"

#include <gflags/gflags.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

static bool ValidatePositive(const char *flagname, int32_t value) {
    if (value <= 0) {
        printf("Invalid value for --%s: %d. Must be positive\n", flagname, value);
        return false;
    }
    return true;
}

static bool ValidatePositiveDouble(const char *flagname, double value) {
    if (!(value > 0)) {
        printf("Invalid value for --%s: %g. Must be positive\n", flagname, value);
        return false;
    }
    return true;
}

static bool ValidateOpenProbability(const char *flagname, double value) {
    if (!(value > 0 && value < 1)) {
        printf("Invalid value for --%s: %g. Must be strictly between 0 and 1\n", flagname, value);
        return false;
    }
    return true;
}

static bool ValidateProbability(const char *flagname, double value) {
    if (!(value >= 0 && value <= 1)) {
        printf("Invalid value for --%s: %g. Must be in [0,1]\n", flagname, value);
        return false;
    }
    return true;
}

DEFINE_int32(trial_count, 10, "Number of coin tosses in each experiment");
DEFINE_validator(trial_count, &ValidatePositive);

DEFINE_int32(num_experiments,
             5,
             "Number of experiments to simulate when no --outcomes or --outcomes_file is given");
DEFINE_validator(num_experiments, &ValidatePositive);

DEFINE_string(outcomes,
              "",
              "Comma separated number of heads observed in each experiment, e.g. 5,9,8,4,7");

DEFINE_string(outcomes_file, "", "File containing comma separated head counts");

DEFINE_string(assignment,
              "",
              "Comma separated coin (A/B) used in each experiment, if known. When given, the EM "
              "estimate is compared against the exact maximum likelihood estimate");

DEFINE_double(epsilon,
              0.001,
              "Stop when no coin parameter changes by more than this value in an iteration");
DEFINE_validator(epsilon, &ValidatePositiveDouble);

DEFINE_int32(max_iterations, 100, "Maximum number of EM iterations");
DEFINE_validator(max_iterations, &ValidatePositive);

DEFINE_double(initial_theta_a, 0.6, "Initial estimate for the head probability of coin A");
DEFINE_validator(initial_theta_a, &ValidateOpenProbability);
DEFINE_double(initial_theta_b, 0.5, "Initial estimate for the head probability of coin B");
DEFINE_validator(initial_theta_b, &ValidateOpenProbability);

DEFINE_bool(use_map,
            false,
            "If true, compute a maximum a posteriori estimate using Gaussian priors on the coin "
            "parameters");

static bool ValidateMapUpdate(const char *flagname, const std::string &value) {
    if (value != "REWEIGHT" && value != "PENALIZED") {
        printf("Invalid value for --%s: %s.\nShould be one of REWEIGHT, PENALIZED\n", flagname,
               value.c_str());
        return false;
    }
    return true;
}
DEFINE_string(map_update,
              "REWEIGHT",
              "How the priors are used in MAP mode. REWEIGHT multiplies the likelihoods in the E "
              "step by the prior densities (approximate MAP), PENALIZED adds the log priors to "
              "the objective of the M step (exact MAP)");
DEFINE_validator(map_update, &ValidateMapUpdate);

DEFINE_double(prior_mean_a, 0.5, "Mean of the Gaussian prior on theta_A (only with --use_map)");
DEFINE_double(prior_std_a, 0.1, "Standard deviation of the prior on theta_A");
DEFINE_validator(prior_std_a, &ValidatePositiveDouble);
DEFINE_double(prior_mean_b, 0.5, "Mean of the Gaussian prior on theta_B (only with --use_map)");
DEFINE_double(prior_std_b, 0.1, "Standard deviation of the prior on theta_B");
DEFINE_validator(prior_std_b, &ValidatePositiveDouble);

DEFINE_int32(num_restarts,
             1,
             "Number of EM runs. If larger than 1, each run starts from a random (uniform) "
             "initial estimate and the spread of the final estimates is reported");
DEFINE_validator(num_restarts, &ValidatePositive);

DEFINE_bool(include_unconverged,
            false,
            "If true, restarts that hit --max_iterations are included in the mean and variance "
            "of the final estimates");

DEFINE_double(true_theta_a, 0.8, "Head probability of coin A when simulating experiments");
DEFINE_validator(true_theta_a, &ValidateProbability);
DEFINE_double(true_theta_b, 0.45, "Head probability of coin B when simulating experiments");
DEFINE_validator(true_theta_b, &ValidateProbability);

DEFINE_uint32(seed, 42, "Seed for simulating experiments and drawing restart initial estimates");

DEFINE_uint32(num_threads, 8, "Number of threads to use for restarts");

DEFINE_string(log_level,
              "info",
              "The log verbosity: debug, trace, info, warn, error, critical, off");

/** Reads the observed data from the flags, or simulates it if none was given. */
static SimulatedData get_data(uint32_t trials) {
    if (!FLAGS_outcomes.empty() && !FLAGS_outcomes_file.empty()) {
        throw std::invalid_argument("Only one of --outcomes and --outcomes_file may be given");
    }
    SimulatedData data;
    if (!FLAGS_outcomes.empty()) {
        data.successes = int_split<uint32_t>(FLAGS_outcomes, ',');
    } else if (!FLAGS_outcomes_file.empty()) {
        logger()->info("Reading outcomes from {}", FLAGS_outcomes_file);
        data.successes = int_split<uint32_t>(read_file(FLAGS_outcomes_file), ',');
    } else {
        logger()->info("Simulating {} experiments of {} tosses with theta_A={}, theta_B={}",
                       FLAGS_num_experiments, trials, FLAGS_true_theta_a, FLAGS_true_theta_b);
        std::mt19937 rng(FLAGS_seed);
        return simulate_experiments(FLAGS_num_experiments, trials,
                                    { FLAGS_true_theta_a, FLAGS_true_theta_b }, rng);
    }
    if (!FLAGS_assignment.empty()) {
        data.assignment = parse_assignment(FLAGS_assignment);
    }
    return data;
}

static void report_single_run(const SimulatedData &data, uint32_t trials, const EMParams &params) {
    Theta initial = { FLAGS_initial_theta_a, FLAGS_initial_theta_b };
    ExpectationMaximization em(data.successes, trials, initial, params);
    EMResult result = em.run();
    for (uint32_t i = 0; i < result.trajectory.size(); ++i) {
        logger()->info("Iteration {}: theta_A={:.4f}, theta_B={:.4f}, log-likelihood={:.4f}", i,
                       result.trajectory[i].a, result.trajectory[i].b,
                       result.log_likelihoods[i]);
    }
    logger()->info("Status {} after {} iterations: theta_A={:.4f}, theta_B={:.4f}",
                   to_string(result.status), result.iterations, result.theta.a, result.theta.b);
}

static void report_restarts(const SimulatedData &data, uint32_t trials, const EMParams &params) {
    RestartParams restart_params;
    restart_params.num_restarts = FLAGS_num_restarts;
    restart_params.seed = FLAGS_seed;
    restart_params.num_threads = FLAGS_num_threads;
    restart_params.include_unconverged = FLAGS_include_unconverged;
    RestartSummary summary = run_restarts(data.successes, trials, params, restart_params);

    for (uint32_t i = 0; i < summary.runs.size(); ++i) {
        const EMResult &run = summary.runs[i];
        logger()->info("Restart {}: start=({:.4f}, {:.4f}), final=({:.4f}, {:.4f}), {} after {} "
                       "iterations",
                       i, summary.starts[i].a, summary.starts[i].b, run.theta.a, run.theta.b,
                       to_string(run.status), run.iterations);
    }
    logger()->info("{} converged, {} did not converge, {} failed", summary.converged,
                   summary.not_converged, summary.failed);
    logger()->info("Mean theta_A={:.4f} (variance {:.6f}), theta_B={:.4f} (variance {:.6f})",
                   summary.mean.a, summary.variance.a, summary.mean.b, summary.variance.b);
    for (const FixedPoint &fp : summary.fixed_points) {
        logger()->info("Fixed point theta_A={:.4f}, theta_B={:.4f} reached by {} runs",
                       fp.theta.a, fp.theta.b, fp.count);
    }
}

int main(int argc, char *argv[]) {
    gflags::SetUsageMessage("binomix [--outcomes=5,9,8,4,7 --trial_count=10] arguments");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    spdlog::set_level(spdlog::level::from_str(FLAGS_log_level));

    const uint32_t trials = FLAGS_trial_count;
    EMParams params;
    params.epsilon = FLAGS_epsilon;
    params.max_iterations = FLAGS_max_iterations;
    if (FLAGS_use_map) {
        params.prior = Prior { { FLAGS_prior_mean_a, FLAGS_prior_std_a },
                               { FLAGS_prior_mean_b, FLAGS_prior_std_b } };
        params.map_update = parse_map_update(FLAGS_map_update);
    }

    try {
        SimulatedData data = get_data(trials);
        logger()->info("Observed heads in {} experiments of {} tosses: {} ({} heads in total)",
                       data.successes.size(), trials, to_string(data.successes),
                       sum(data.successes));

        if (FLAGS_num_restarts > 1) {
            report_restarts(data, trials, params);
        } else {
            report_single_run(data, trials, params);
        }

        if (!data.assignment.empty()) {
            logger()->info("True coins: {}", to_string(data.assignment));
            if (std::count(data.assignment.begin(), data.assignment.end(), 0) == 0
                || std::count(data.assignment.begin(), data.assignment.end(), 1) == 0) {
                logger()->warn("Only one coin was used, the exact MLE is not defined");
            } else {
                Theta reference = exact_mle(data.successes, trials, data.assignment);
                logger()->info("Exact MLE with known coins: theta_A={:.4f}, theta_B={:.4f}",
                               reference.a, reference.b);
            }
        }
    } catch (const std::logic_error &e) { // std::invalid_argument or std::out_of_range
        logger()->error("{}", e.what());
        std::exit(1);
    }

    logger()->info("Done.");
}
