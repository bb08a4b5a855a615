#include "util/probability.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
// log(n!) is tabulated exactly (as a running sum of logs) up to this value
constexpr uint32_t LOG_FACT_TABLE_SIZE = 1024;

const std::vector<double> &log_factorial_table() {
    static const std::vector<double> table = [] {
        std::vector<double> result(LOG_FACT_TABLE_SIZE);
        result[0] = 0;
        for (uint32_t i = 1; i < LOG_FACT_TABLE_SIZE; ++i) {
            result[i] = result[i - 1] + std::log(static_cast<double>(i));
        }
        return result;
    }();
    return table;
}

const double LOG_SQRT_2PI = 0.5 * std::log(2 * M_PI);
} // namespace

double log_fact(uint32_t n) {
    if (n < LOG_FACT_TABLE_SIZE) {
        return log_factorial_table()[n];
    }
    // Stirling's series; the first two correction terms give full double precision for n >= 1024
    double x = n;
    return x * std::log(x) - x + 0.5 * std::log(2 * M_PI * x) + 1. / (12 * x)
            - 1. / (360 * x * x * x);
}

double log_choose(uint32_t n, uint32_t k) {
    return log_fact(n) - log_fact(k) - log_fact(n - k);
}

double log_binomial_pmf(uint32_t successes, uint32_t trials, double p) {
    if (trials == 0) {
        throw std::invalid_argument("Number of trials must be positive");
    }
    if (successes > trials) {
        throw std::invalid_argument("Number of successes (" + std::to_string(successes)
                                    + ") exceeds the number of trials (" + std::to_string(trials)
                                    + ")");
    }
    if (!(p >= 0 && p <= 1)) {
        throw std::invalid_argument("Probability must be in [0,1], got " + std::to_string(p));
    }
    uint32_t failures = trials - successes;
    double result = log_choose(trials, successes);
    // 0 * log(0) terms are skipped, which implements the 0^0 = 1 convention
    if (successes > 0) {
        result += successes * std::log(p);
    }
    if (failures > 0) {
        result += failures * std::log1p(-p);
    }
    return result;
}

double binomial_pmf(uint32_t successes, uint32_t trials, double p) {
    return std::exp(log_binomial_pmf(successes, trials, p));
}

double log_gaussian_pdf(double x, double mean, double stddev) {
    if (!(stddev > 0)) {
        throw std::invalid_argument("Standard deviation must be positive, got "
                                    + std::to_string(stddev));
    }
    double z = (x - mean) / stddev;
    return -0.5 * z * z - std::log(stddev) - LOG_SQRT_2PI;
}

double gaussian_pdf(double x, double mean, double stddev) {
    return std::exp(log_gaussian_pdf(x, mean, stddev));
}

double log_sum_exp(double a, double b) {
    if (a == -std::numeric_limits<double>::infinity()) {
        return b;
    }
    if (b == -std::numeric_limits<double>::infinity()) {
        return a;
    }
    double max = std::max(a, b);
    return max + std::log1p(std::exp(-std::abs(a - b)));
}
