#include "convergence_monitor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace {
using namespace ::testing;

TEST(ConvergenceMonitor, Improvement) {
    ASSERT_DOUBLE_EQ(0.2, ConvergenceMonitor::improvement({ 0.5, 0.5 }, { 0.6, 0.3 }));
    ASSERT_DOUBLE_EQ(0.2, ConvergenceMonitor::improvement({ 0.6, 0.3 }, { 0.5, 0.5 }));
    ASSERT_EQ(0, ConvergenceMonitor::improvement({ 0.1, 0.9 }, { 0.1, 0.9 }));
}

TEST(ConvergenceMonitor, InvalidArguments) {
    ASSERT_THROW(ConvergenceMonitor(0, 100), std::invalid_argument);
    ASSERT_THROW(ConvergenceMonitor(-1e-3, 100), std::invalid_argument);
    ASSERT_THROW(ConvergenceMonitor(std::nan(""), 100), std::invalid_argument);
    ASSERT_THROW(ConvergenceMonitor(1e-3, 0), std::invalid_argument);
}

TEST(ConvergenceMonitor, Converges) {
    ConvergenceMonitor monitor(1e-3, 100);
    monitor.reset({ 0.6, 0.5 });
    ASSERT_EQ(0, monitor.iteration());
    ASSERT_FALSE(monitor.done());
    ASSERT_TRUE(std::isinf(monitor.improvement()));

    ASSERT_NEAR(0.1, monitor.add({ 0.7, 0.45 }), 1e-12);
    ASSERT_FALSE(monitor.converged());
    ASSERT_NEAR(0.01, monitor.add({ 0.71, 0.45 }), 1e-12);
    ASSERT_FALSE(monitor.converged());
    monitor.add({ 0.71, 0.4495 });
    ASSERT_TRUE(monitor.converged());
    ASSERT_FALSE(monitor.exhausted());
    ASSERT_TRUE(monitor.done());
    ASSERT_EQ(3, monitor.iteration());
    ASSERT_EQ((Theta { 0.71, 0.4495 }), monitor.current());
    ASSERT_EQ(4, monitor.trajectory().size());
    ASSERT_EQ((Theta { 0.6, 0.5 }), monitor.trajectory().front());
}

TEST(ConvergenceMonitor, Exhausted) {
    ConvergenceMonitor monitor(1e-3, 3);
    monitor.reset({ 0.2, 0.8 });
    monitor.add({ 0.3, 0.7 });
    monitor.add({ 0.2, 0.8 });
    ASSERT_FALSE(monitor.done());
    monitor.add({ 0.3, 0.7 });
    ASSERT_TRUE(monitor.exhausted());
    ASSERT_FALSE(monitor.converged());
    ASSERT_TRUE(monitor.done());
}

/** Converging on the very last allowed iteration counts as converged, not as exhausted. */
TEST(ConvergenceMonitor, ConvergedAtCap) {
    ConvergenceMonitor monitor(1e-3, 2);
    monitor.reset({ 0.2, 0.8 });
    monitor.add({ 0.3, 0.7 });
    monitor.add({ 0.3, 0.7 });
    ASSERT_TRUE(monitor.converged());
    ASSERT_FALSE(monitor.exhausted());
}

TEST(ConvergenceMonitor, Reset) {
    ConvergenceMonitor monitor(1e-3, 10);
    monitor.reset({ 0.2, 0.8 });
    monitor.add({ 0.2, 0.8 });
    ASSERT_TRUE(monitor.converged());

    monitor.reset({ 0.4, 0.5 });
    ASSERT_EQ(0, monitor.iteration());
    ASSERT_FALSE(monitor.converged());
    ASSERT_THAT(monitor.trajectory(), ElementsAre(Theta { 0.4, 0.5 }));
}

TEST(ConvergenceMonitor, UsedBeforeReset) {
    ConvergenceMonitor monitor(1e-3, 10);
    ASSERT_EQ(0, monitor.iteration());
    ASSERT_FALSE(monitor.done());
    ASSERT_THROW(monitor.current(), std::logic_error);
    ASSERT_THROW(monitor.add({ 0.5, 0.5 }), std::logic_error);
}

TEST(FirstConvergedIteration, Converges) {
    std::vector<Theta> snapshots
            = { { 0.6, 0.5 }, { 0.7, 0.4 }, { 0.75, 0.38 }, { 0.7505, 0.3801 }, { 0.7505, 0.3801 } };
    std::optional<uint32_t> result = first_converged_iteration(snapshots, 1e-3, 100);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(3, result.value());
}

TEST(FirstConvergedIteration, NotWithinCap) {
    std::vector<Theta> snapshots = { { 0.6, 0.5 }, { 0.7, 0.4 }, { 0.75, 0.38 }, { 0.75, 0.38 } };
    ASSERT_FALSE(first_converged_iteration(snapshots, 1e-3, 2).has_value());
    ASSERT_EQ(3, first_converged_iteration(snapshots, 1e-3, 3).value());
}

TEST(FirstConvergedIteration, LargestCap) {
    std::vector<Theta> snapshots = { { 0.6, 0.5 }, { 0.7, 0.55 }, { 0.7001, 0.5501 } };
    ASSERT_EQ(2, first_converged_iteration(snapshots, 1e-3, 100).value());
    std::optional<uint32_t> result
            = first_converged_iteration(snapshots, 1e-3, std::numeric_limits<uint32_t>::max());
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(2, result.value());
}

TEST(FirstConvergedIteration, TooFewSnapshots) {
    ASSERT_FALSE(first_converged_iteration({}, 1e-3, 10).has_value());
    ASSERT_FALSE(first_converged_iteration({ { 0.5, 0.5 } }, 1e-3, 10).has_value());
}

} // namespace
