#pragma once

#include <functional>

namespace isa_flight {
namespace core {

struct RootResult {
    bool bracketed = false;  // f changes sign (or vanishes) on [lower, upper]
    bool converged = false;  // half-width fell below tolerance within budget
    double root = 0.0;
    int iterations = 0;
};

// Bisection for a scalar f on [lower, upper].
// Never throws; callers decide what a missing or unconverged root means.
RootResult find_root_bisection(
    const std::function<double(double)> &f,
    double lower,
    double upper,
    int max_iter = 200,
    double x_tol = 1e-9
);

} // namespace core
} // namespace isa_flight
