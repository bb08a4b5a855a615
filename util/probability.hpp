#pragma once

#include <cstdint>

/**
 * Computes log(n!) using a table for small values or Stirling's series for larger values.
 * The table is built once and shared by all threads.
 */
double log_fact(uint32_t n);

/**
 * Log of the binomial coefficient C(n, k).
 */
double log_choose(uint32_t n, uint32_t k);

/**
 * The logarithm of the probability of observing #successes heads in #trials tosses of a coin
 * with head probability #p, i.e. log(C(trials, successes) p^successes (1-p)^(trials-successes)).
 * Uses the convention 0^0 = 1, so the result is 0 for (successes=0, p=0) and (successes=trials,
 * p=1), and -infinity whenever the observation is impossible.
 * @throws std::invalid_argument if trials == 0, successes > trials or p is outside [0,1]
 */
double log_binomial_pmf(uint32_t successes, uint32_t trials, double p);

/**
 * The binomial probability mass, exp(#log_binomial_pmf). Never raises a domain error for p in
 * {0, 1}.
 */
double binomial_pmf(uint32_t successes, uint32_t trials, double p);

/**
 * Log of the Gaussian density with the given mean and standard deviation, evaluated at x.
 * @throws std::invalid_argument if stddev <= 0
 */
double log_gaussian_pdf(double x, double mean, double stddev);

/**
 * Gaussian density exp(-0.5((x-mean)/stddev)^2) / (stddev sqrt(2π)). Strictly positive for any
 * finite x, except for underflow when x is hundreds of standard deviations away from the mean;
 * use #log_gaussian_pdf when the value is multiplied into a likelihood.
 */
double gaussian_pdf(double x, double mean, double stddev);

/**
 * Computes log(exp(a) + exp(b)) without overflow or underflow.
 */
double log_sum_exp(double a, double b);
