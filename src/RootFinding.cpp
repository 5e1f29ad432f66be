#include "RootFinding.hpp"
#include "PsychroError.hpp"
#include <cmath>
#include <sstream>

namespace MASE {
namespace RootFinding {

namespace {

void requireBracket(double flo, double fhi, double lo, double hi, const std::string& what) {
    if (!std::isfinite(flo) || !std::isfinite(fhi)) {
        throw InvalidInputError(what + ": residual is not finite on the search interval");
    }
    if (flo * fhi > 0.0) {
        std::ostringstream msg;
        msg << what << ": no solution in [" << lo << ", " << hi << "]";
        throw InvalidInputError(msg.str());
    }
}

[[noreturn]] void throwNotConverged(const std::string& what, int iterations, double residual) {
    std::ostringstream msg;
    msg << what << ": no convergence after " << iterations
        << " iterations (residual " << residual << ")";
    throw ConvergenceError(msg.str(), iterations, residual);
}

} // namespace

double bisect(const ScalarFunction& f, double lo, double hi,
              double x_tolerance, int max_iterations, const std::string& what) {
    double flo = f(lo);
    double fhi = f(hi);
    if (flo == 0.0) return lo;
    if (fhi == 0.0) return hi;
    requireBracket(flo, fhi, lo, hi, what);

    double fmid = flo;
    for (int iter = 1; iter <= max_iterations; ++iter) {
        double mid = 0.5 * (lo + hi);
        fmid = f(mid);
        if (fmid == 0.0 || 0.5 * (hi - lo) < x_tolerance) {
            return mid;
        }
        if ((fmid < 0.0) == (flo < 0.0)) {
            lo = mid;
            flo = fmid;
        } else {
            hi = mid;
        }
    }
    throwNotConverged(what, max_iterations, fmid);
}

double newtonBisect(const ScalarFunction& f, const ScalarFunction& df,
                    double lo, double hi, double x0,
                    double x_tolerance, int max_iterations, const std::string& what) {
    double flo = f(lo);
    double fhi = f(hi);
    if (flo == 0.0) return lo;
    if (fhi == 0.0) return hi;
    requireBracket(flo, fhi, lo, hi, what);

    double x = (x0 > lo && x0 < hi) ? x0 : 0.5 * (lo + hi);
    double fx = f(x);
    for (int iter = 1; iter <= max_iterations; ++iter) {
        if (fx == 0.0) return x;

        // Shrink the bracket around the root
        if ((fx < 0.0) == (flo < 0.0)) {
            lo = x;
            flo = fx;
        } else {
            hi = x;
        }

        double dfx = df(x);
        double x_new;
        if (dfx != 0.0 && std::isfinite(dfx)) {
            x_new = x - fx / dfx;
            if (!(x_new > lo && x_new < hi)) {
                x_new = 0.5 * (lo + hi);
            }
        } else {
            x_new = 0.5 * (lo + hi);
        }

        double step = std::abs(x_new - x);
        x = x_new;
        fx = f(x);
        if (step < x_tolerance || 0.5 * (hi - lo) < x_tolerance) {
            return x;
        }
    }
    throwNotConverged(what, max_iterations, fx);
}

} // namespace RootFinding
} // namespace MASE
