#ifndef ROOT_FINDING_HPP
#define ROOT_FINDING_HPP

#include <functional>
#include <string>

namespace MASE {

/**
 * @brief Bracketed scalar root finders used by the psychrometric solves
 *
 * Both solvers are bounded: running out of iterations throws
 * ConvergenceError carrying the iteration count and the last residual.
 * An unbracketed root is an InvalidInputError because it means the
 * requested state does not exist.
 */
namespace RootFinding {

using ScalarFunction = std::function<double(double)>;

/**
 * @brief Bisection on [lo, hi]
 *
 * @param f Function with a sign change on [lo, hi]
 * @param x_tolerance Stop when the bracket half-width falls below this
 * @param max_iterations Iteration budget
 * @param what Name of the solved quantity, used in error messages
 */
double bisect(const ScalarFunction& f, double lo, double hi,
              double x_tolerance, int max_iterations, const std::string& what);

/**
 * @brief Newton's method safeguarded by a bisection bracket
 *
 * Newton steps that leave the current bracket, or a vanishing derivative,
 * fall back to a bisection step. The bracket is tightened every iteration.
 */
double newtonBisect(const ScalarFunction& f, const ScalarFunction& df,
                    double lo, double hi, double x0,
                    double x_tolerance, int max_iterations, const std::string& what);

} // namespace RootFinding

} // namespace MASE

#endif // ROOT_FINDING_HPP
