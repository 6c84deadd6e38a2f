#include "isa_flight/core/root_finding.hpp"

#include <cmath>

namespace isa_flight {
namespace core {

RootResult find_root_bisection(
    const std::function<double(double)> &f,
    double lower,
    double upper,
    int max_iter,
    double x_tol
) {
    RootResult result;
    double fa = f(lower);
    double fb = f(upper);
    if (fa == 0.0) {
        result.bracketed = true;
        result.converged = true;
        result.root = lower;
        return result;
    }
    if (fb == 0.0) {
        result.bracketed = true;
        result.converged = true;
        result.root = upper;
        return result;
    }
    if (std::isnan(fa) || std::isnan(fb) || fa * fb > 0.0) {
        result.root = upper;
        return result;
    }
    result.bracketed = true;

    double a = lower;
    double b = upper;
    for (int i = 0; i < max_iter; ++i) {
        double m = 0.5 * (a + b);
        double fm = f(m);
        result.iterations = i + 1;
        result.root = m;
        if (fm == 0.0 || 0.5 * std::abs(b - a) < x_tol) {
            result.converged = true;
            return result;
        }
        if (fa * fm < 0.0) {
            b = m;
        } else {
            a = m;
            fa = fm;
        }
    }
    result.root = 0.5 * (a + b);
    return result;
}

} // namespace core
} // namespace isa_flight
