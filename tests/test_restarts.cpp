#include "restarts.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
using namespace ::testing;

const std::vector<uint32_t> heads20 = { 10, 8, 13, 14, 7 };

TEST(UniformTheta, Reproducible) {
    std::mt19937 rng1(42);
    std::mt19937 rng2(42);
    for (uint32_t i = 0; i < 10; ++i) {
        Theta t = uniform_theta(rng1);
        ASSERT_EQ(t, uniform_theta(rng2));
        ASSERT_GE(t.a, 0);
        ASSERT_LT(t.a, 1);
        ASSERT_GE(t.b, 0);
        ASSERT_LT(t.b, 1);
    }
}

TEST(FindFixedPoints, Groups) {
    std::vector<Theta> estimates
            = { { 0.6, 0.4 }, { 0.4, 0.6 }, { 0.62, 0.41 }, { 0.41, 0.61 }, { 0.9, 0.1 } };
    std::vector<FixedPoint> points = find_fixed_points(estimates, 0.05);
    ASSERT_EQ(3, points.size());
    ASSERT_EQ(2, points[0].count);
    ASSERT_NEAR(0.61, points[0].theta.a, 1e-12);
    ASSERT_NEAR(0.405, points[0].theta.b, 1e-12);
    ASSERT_EQ(2, points[1].count);
    ASSERT_NEAR(0.405, points[1].theta.a, 1e-12);
    ASSERT_NEAR(0.605, points[1].theta.b, 1e-12);
    ASSERT_EQ(1, points[2].count);
    ASSERT_EQ((Theta { 0.9, 0.1 }), points[2].theta);
}

TEST(FindFixedPoints, Empty) {
    ASSERT_TRUE(find_fixed_points({}, 0.05).empty());
}

/** The likelihood is symmetric under swapping the coins, so random starts find both labelings. */
TEST(RunRestarts, FindsBothLabelings) {
    RestartParams restart_params;
    restart_params.num_restarts = 20;
    restart_params.seed = 42;
    RestartSummary summary = run_restarts(heads20, 20, {}, restart_params);

    ASSERT_EQ(20, summary.starts.size());
    ASSERT_EQ(20, summary.runs.size());
    ASSERT_EQ(20, summary.converged);
    ASSERT_EQ(0, summary.not_converged);
    ASSERT_EQ(0, summary.failed);
    ASSERT_EQ(2, summary.fixed_points.size());

    const Theta &first = summary.fixed_points[0].theta;
    const Theta &second = summary.fixed_points[1].theta;
    ASSERT_EQ(20, summary.fixed_points[0].count + summary.fixed_points[1].count);
    ASSERT_NEAR(0.627, std::max(first.a, first.b), 0.005);
    ASSERT_NEAR(0.421, std::min(first.a, first.b), 0.005);
    ASSERT_NEAR(first.a, second.b, 0.01);
    ASSERT_NEAR(first.b, second.a, 0.01);

    for (const EMResult &run : summary.runs) {
        ASSERT_LE(run.iterations, 100);
    }
}

TEST(RunRestarts, MeanAndVariance) {
    RestartParams restart_params;
    restart_params.num_restarts = 20;
    RestartSummary summary = run_restarts(heads20, 20, {}, restart_params);

    double mean_a = 0, mean_b = 0;
    for (const EMResult &run : summary.runs) {
        mean_a += run.theta.a;
        mean_b += run.theta.b;
    }
    mean_a /= summary.runs.size();
    mean_b /= summary.runs.size();
    double var_a = 0, var_b = 0;
    for (const EMResult &run : summary.runs) {
        var_a += (run.theta.a - mean_a) * (run.theta.a - mean_a);
        var_b += (run.theta.b - mean_b) * (run.theta.b - mean_b);
    }
    var_a /= summary.runs.size() - 1;
    var_b /= summary.runs.size() - 1;

    ASSERT_NEAR(mean_a, summary.mean.a, 1e-12);
    ASSERT_NEAR(mean_b, summary.mean.b, 1e-12);
    ASSERT_NEAR(var_a, summary.variance.a, 1e-12);
    ASSERT_NEAR(var_b, summary.variance.b, 1e-12);
    // both labelings are present, so the spread is large
    ASSERT_GT(summary.variance.a, 1e-3);
}

TEST(RunRestarts, IndependentOfThreadCount) {
    RestartParams restart_params;
    restart_params.num_restarts = 16;
    restart_params.seed = 7;
    restart_params.num_threads = 1;
    RestartSummary sequential = run_restarts(heads20, 20, {}, restart_params);
    restart_params.num_threads = 4;
    RestartSummary parallel = run_restarts(heads20, 20, {}, restart_params);

    ASSERT_EQ(sequential.starts, parallel.starts);
    for (uint32_t i = 0; i < sequential.runs.size(); ++i) {
        ASSERT_EQ(sequential.runs[i].trajectory, parallel.runs[i].trajectory);
        ASSERT_EQ(sequential.runs[i].status, parallel.runs[i].status);
        ASSERT_EQ(sequential.runs[i].iterations, parallel.runs[i].iterations);
    }
    ASSERT_EQ(sequential.mean, parallel.mean);
}

TEST(RunRestarts, StartsDependOnSeed) {
    RestartParams restart_params;
    restart_params.num_restarts = 3;
    restart_params.seed = 1;
    RestartSummary first = run_restarts(heads20, 20, {}, restart_params);
    RestartSummary again = run_restarts(heads20, 20, {}, restart_params);
    restart_params.seed = 2;
    RestartSummary other = run_restarts(heads20, 20, {}, restart_params);

    ASSERT_EQ(first.starts, again.starts);
    ASSERT_NE(first.starts, other.starts);
    for (uint32_t i = 0; i < 3; ++i) {
        ASSERT_EQ(first.starts[i], first.runs[i].trajectory.front());
    }
}

/** A run that fails is reported, but the other runs and the summary are unaffected. */
TEST(RunRestarts, FailedRunsAreIsolated) {
    std::vector<Theta> starts = { { 0, 0.5 }, { 1 - 1e-15, 0.5 }, { 0.6, 0.5 } };
    uint32_t next = 0;
    ThetaSampler sampler = [&](std::mt19937 &) { return starts[next++]; };

    RestartParams restart_params;
    restart_params.num_restarts = 3;
    restart_params.num_threads = 2;
    RestartSummary summary = run_restarts({ 40, 50, 60 }, 100, {}, restart_params, sampler);

    ASSERT_EQ(starts, summary.starts);
    ASSERT_EQ(EMStatus::INVALID_START, summary.runs[0].status);
    ASSERT_EQ((Theta { 0, 0.5 }), summary.runs[0].theta);
    ASSERT_EQ(EMStatus::EMPTY_COMPONENT, summary.runs[1].status);
    ASSERT_EQ(EMStatus::CONVERGED, summary.runs[2].status);
    ASSERT_EQ(1, summary.converged);
    ASSERT_EQ(0, summary.not_converged);
    ASSERT_EQ(2, summary.failed);

    ASSERT_EQ(summary.runs[2].theta, summary.mean);
    ASSERT_EQ(0, summary.variance.a);
    ASSERT_EQ(0, summary.variance.b);
    ASSERT_EQ(1, summary.fixed_points.size());
    ASSERT_NEAR(0.5671, summary.mean.a, 1e-3);
    ASSERT_NEAR(0.4351, summary.mean.b, 1e-3);
}

TEST(RunRestarts, NothingUsable) {
    ThetaSampler sampler = [](std::mt19937 &) { return Theta { 1, 0.5 }; };
    RestartParams restart_params;
    restart_params.num_restarts = 4;
    RestartSummary summary = run_restarts(heads20, 20, {}, restart_params, sampler);

    ASSERT_EQ(4, summary.failed);
    ASSERT_TRUE(std::isnan(summary.mean.a));
    ASSERT_TRUE(std::isnan(summary.mean.b));
    ASSERT_TRUE(std::isnan(summary.variance.a));
    ASSERT_TRUE(summary.fixed_points.empty());
}

TEST(RunRestarts, IncludeUnconverged) {
    EMParams params;
    params.epsilon = 1e-12;
    params.max_iterations = 2;
    RestartParams restart_params;
    restart_params.num_restarts = 5;

    RestartSummary excluded = run_restarts(heads20, 20, params, restart_params);
    ASSERT_EQ(0, excluded.converged);
    ASSERT_EQ(5, excluded.not_converged);
    ASSERT_TRUE(std::isnan(excluded.mean.a));
    ASSERT_TRUE(excluded.fixed_points.empty());

    restart_params.include_unconverged = true;
    RestartSummary included = run_restarts(heads20, 20, params, restart_params);
    ASSERT_EQ(5, included.not_converged);
    ASSERT_TRUE(std::isfinite(included.mean.a));
    ASSERT_TRUE(std::isfinite(included.mean.b));
    ASSERT_FALSE(included.fixed_points.empty());
    for (const EMResult &run : included.runs) {
        ASSERT_EQ(2, run.iterations);
    }
}

TEST(RunRestarts, InvalidArguments) {
    RestartParams restart_params;
    restart_params.num_restarts = 3;
    ASSERT_THROW(run_restarts(heads20, 0, {}, restart_params), std::invalid_argument);
    ASSERT_THROW(run_restarts({}, 20, {}, restart_params), std::invalid_argument);
    ASSERT_THROW(run_restarts({ 21 }, 20, {}, restart_params), std::invalid_argument);

    restart_params.num_restarts = 0;
    ASSERT_THROW(run_restarts(heads20, 20, {}, restart_params), std::invalid_argument);

    restart_params.num_restarts = 3;
    restart_params.num_threads = 0;
    ASSERT_THROW(run_restarts(heads20, 20, {}, restart_params), std::invalid_argument);

    restart_params.num_threads = 1;
    restart_params.fixed_point_tolerance = 0;
    ASSERT_THROW(run_restarts(heads20, 20, {}, restart_params), std::invalid_argument);
}

} // namespace
