#include "expectation_maximization.hpp"

#include "util/logger.hpp"
#include "util/probability.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

MapUpdate parse_map_update(const std::string &map_update) {
    if (map_update == "REWEIGHT")
        return MapUpdate::REWEIGHT;
    else if (map_update == "PENALIZED")
        return MapUpdate::PENALIZED;
    else
        throw std::invalid_argument(map_update);
}

std::string to_string(EMStatus status) {
    switch (status) {
        case EMStatus::CONVERGED:
            return "CONVERGED";
        case EMStatus::MAX_ITERS_EXCEEDED:
            return "MAX_ITERS_EXCEEDED";
        case EMStatus::DEGENERATE_LIKELIHOOD:
            return "DEGENERATE_LIKELIHOOD";
        case EMStatus::EMPTY_COMPONENT:
            return "EMPTY_COMPONENT";
        case EMStatus::INVALID_START:
            return "INVALID_START";
    }
    return "UNKNOWN";
}

bool expectation_step(const std::vector<uint32_t> &successes,
                      uint32_t trials,
                      const Theta &theta,
                      const Prior *prior,
                      std::vector<double> *weight_a,
                      ExpectedCounts *counts) {
    constexpr double NEG_INF = -std::numeric_limits<double>::infinity();

    // the prior only depends on theta, so it's the same factor for all experiments
    double log_prior_a = 0;
    double log_prior_b = 0;
    if (prior) {
        log_prior_a = log_gaussian_pdf(theta.a, prior->a.mean, prior->a.stddev);
        log_prior_b = log_gaussian_pdf(theta.b, prior->b.mean, prior->b.stddev);
    }

    *counts = ExpectedCounts();
    weight_a->resize(successes.size());
    for (uint32_t i = 0; i < successes.size(); ++i) {
        uint32_t heads = successes[i];
        uint32_t tails = trials - heads;
        // work in log space, the likelihoods underflow quickly for large trial counts
        double log_score_a = log_binomial_pmf(heads, trials, theta.a) + log_prior_a;
        double log_score_b = log_binomial_pmf(heads, trials, theta.b) + log_prior_b;
        if (log_score_a == NEG_INF && log_score_b == NEG_INF) {
            logger()->warn("Experiment {} ({} heads out of {}) is impossible under both "
                           "theta_A={} and theta_B={}",
                           i, heads, trials, theta.a, theta.b);
            return false;
        }
        // w_A = l_A / (l_A + l_B) = 1 / (1 + l_B / l_A)
        double w_a = 1. / (1. + std::exp(log_score_b - log_score_a));
        double w_b = 1. - w_a;
        (*weight_a)[i] = w_a;

        counts->successes_a += w_a * heads;
        counts->failures_a += w_a * tails;
        counts->successes_b += w_b * heads;
        counts->failures_b += w_b * tails;
    }
    return true;
}

double penalized_estimate(double successes, double failures, const GaussianParams &prior) {
    const double inv_var = 1. / (prior.stddev * prior.stddev);
    // derivative of the penalized log-likelihood
    auto gradient = [&](double x) {
        return successes / x - failures / (1 - x) - (x - prior.mean) * inv_var;
    };
    double lo = 0;
    double hi = 1;
    for (uint32_t i = 0; i < 100; ++i) {
        double mid = 0.5 * (lo + hi);
        if (gradient(mid) > 0) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return 0.5 * (lo + hi);
}

bool maximization_step(const ExpectedCounts &counts, const Prior *prior, Theta *theta) {
    double tosses_a = counts.successes_a + counts.failures_a;
    double tosses_b = counts.successes_b + counts.failures_b;
    if (tosses_a == 0 || tosses_b == 0) {
        logger()->warn("Coin {} has no responsibility for any experiment", tosses_a == 0 ? 'A' : 'B');
        return false;
    }
    if (prior) {
        theta->a = penalized_estimate(counts.successes_a, counts.failures_a, prior->a);
        theta->b = penalized_estimate(counts.successes_b, counts.failures_b, prior->b);
    } else {
        theta->a = counts.successes_a / tosses_a;
        theta->b = counts.successes_b / tosses_b;
    }
    return true;
}

double log_likelihood(const std::vector<uint32_t> &successes, uint32_t trials, const Theta &theta) {
    const double log_half = std::log(0.5);
    double result = 0;
    for (uint32_t heads : successes) {
        result += log_half
                + log_sum_exp(log_binomial_pmf(heads, trials, theta.a),
                              log_binomial_pmf(heads, trials, theta.b));
    }
    return result;
}

static void check_probability(double p, const std::string &name) {
    if (!(p > 0 && p < 1)) {
        throw std::invalid_argument("Initial " + name + " must be strictly between 0 and 1, got "
                                    + std::to_string(p));
    }
}

static void check_prior(const GaussianParams &prior, const std::string &name) {
    if (!std::isfinite(prior.mean)) {
        throw std::invalid_argument("Prior mean for " + name + " must be finite");
    }
    if (!(prior.stddev > 0) || !std::isfinite(prior.stddev)) {
        throw std::invalid_argument("Prior standard deviation for " + name
                                    + " must be positive, got " + std::to_string(prior.stddev));
    }
}

ExpectationMaximization::ExpectationMaximization(const std::vector<uint32_t> &successes,
                                                 uint32_t trials,
                                                 const Theta &initial,
                                                 const EMParams &params)
    : successes_(successes),
      trials_(trials),
      params_(params),
      monitor_(params.epsilon, params.max_iterations) {
    if (trials == 0) {
        throw std::invalid_argument("Number of trials must be positive");
    }
    if (successes.empty()) {
        throw std::invalid_argument("At least one experiment is needed");
    }
    for (uint32_t i = 0; i < successes.size(); ++i) {
        if (successes[i] > trials) {
            throw std::invalid_argument("Experiment " + std::to_string(i) + " has "
                                        + std::to_string(successes[i])
                                        + " successes, but only " + std::to_string(trials)
                                        + " trials");
        }
    }
    check_probability(initial.a, "theta_A");
    check_probability(initial.b, "theta_B");
    if (params.prior) {
        check_prior(params.prior->a, "theta_A");
        check_prior(params.prior->b, "theta_B");
    }

    monitor_.reset(initial);
    log_likelihoods_.push_back(log_likelihood(successes_, trials_, initial));
}

bool ExpectationMaximization::step() {
    if (state_ == EMState::TERMINATED) {
        return false;
    }
    state_ = EMState::ITERATING;

    const Prior *prior = params_.prior ? &params_.prior.value() : nullptr;
    const bool penalized = params_.map_update == MapUpdate::PENALIZED;

    ExpectedCounts counts;
    if (!expectation_step(successes_, trials_, theta(), penalized ? nullptr : prior, &weight_a_,
                          &counts)) {
        status_ = EMStatus::DEGENERATE_LIKELIHOOD;
        state_ = EMState::TERMINATED;
        return false;
    }

    Theta next = theta();
    if (!maximization_step(counts, penalized ? prior : nullptr, &next)) {
        status_ = EMStatus::EMPTY_COMPONENT;
        state_ = EMState::TERMINATED;
        return false;
    }

    double improvement = monitor_.add(next);
    log_likelihoods_.push_back(log_likelihood(successes_, trials_, next));
    logger()->trace("Iteration {}: theta_A={:.4f}, theta_B={:.4f} (improvement {:.6f})",
                    monitor_.iteration(), next.a, next.b, improvement);

    if (monitor_.converged()) {
        status_ = EMStatus::CONVERGED;
        state_ = EMState::TERMINATED;
    } else if (monitor_.exhausted()) {
        status_ = EMStatus::MAX_ITERS_EXCEEDED;
        state_ = EMState::TERMINATED;
    }
    return state_ == EMState::ITERATING;
}

EMResult ExpectationMaximization::run() {
    while (step()) {
    }
    EMResult result = this->result();
    if (result.status == EMStatus::MAX_ITERS_EXCEEDED) {
        logger()->warn("EM did not converge after {} iterations (last improvement {}), "
                       "theta_A={:.4f}, theta_B={:.4f}",
                       result.iterations, monitor_.improvement(), result.theta.a, result.theta.b);
    } else {
        logger()->debug("EM finished with status {} after {} iterations: theta_A={:.4f}, "
                        "theta_B={:.4f}",
                        to_string(result.status), result.iterations, result.theta.a,
                        result.theta.b);
    }
    return result;
}

EMResult ExpectationMaximization::result() const {
    EMResult result;
    result.theta = theta();
    result.iterations = iteration();
    result.status = status_;
    result.trajectory = monitor_.trajectory();
    result.log_likelihoods = log_likelihoods_;
    return result;
}
