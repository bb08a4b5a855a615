#include "convergence_monitor.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

ConvergenceMonitor::ConvergenceMonitor(double epsilon, uint32_t max_iterations)
    : epsilon_(epsilon),
      max_iterations_(max_iterations),
      improvement_(std::numeric_limits<double>::infinity()) {
    if (!(epsilon > 0)) {
        throw std::invalid_argument("Convergence threshold must be positive, got "
                                    + std::to_string(epsilon));
    }
    if (max_iterations == 0) {
        throw std::invalid_argument("The maximum number of iterations must be positive");
    }
}

void ConvergenceMonitor::reset(const Theta &initial) {
    trajectory_.clear();
    trajectory_.reserve(std::min(max_iterations_, 1024U) + 1);
    trajectory_.push_back(initial);
    improvement_ = std::numeric_limits<double>::infinity();
}

double ConvergenceMonitor::add(const Theta &theta) {
    if (trajectory_.empty()) {
        throw std::logic_error("ConvergenceMonitor::reset() must be called before add()");
    }
    improvement_ = improvement(trajectory_.back(), theta);
    trajectory_.push_back(theta);
    return improvement_;
}

bool ConvergenceMonitor::converged() const {
    return iteration() > 0 && improvement_ <= epsilon_;
}

bool ConvergenceMonitor::exhausted() const {
    return !converged() && iteration() >= max_iterations_;
}

const Theta &ConvergenceMonitor::current() const {
    if (trajectory_.empty()) {
        throw std::logic_error("ConvergenceMonitor::reset() must be called before current()");
    }
    return trajectory_.back();
}

uint32_t ConvergenceMonitor::iteration() const {
    return trajectory_.empty() ? 0 : trajectory_.size() - 1;
}

double ConvergenceMonitor::improvement(const Theta &previous, const Theta &current) {
    return std::max(std::abs(current.a - previous.a), std::abs(current.b - previous.b));
}

std::optional<uint32_t> first_converged_iteration(const std::vector<Theta> &snapshots,
                                                  double epsilon,
                                                  uint32_t max_iterations) {
    size_t last = std::min<size_t>(static_cast<size_t>(max_iterations) + 1, snapshots.size());
    for (size_t i = 1; i < last; ++i) {
        if (ConvergenceMonitor::improvement(snapshots[i - 1], snapshots[i]) <= epsilon) {
            return i;
        }
    }
    return {};
}
