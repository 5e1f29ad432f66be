#ifndef PSYCHRO_ERROR_HPP
#define PSYCHRO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace MASE {

/**
 * @brief Failure categories surfaced by the engine
 *
 * An empty iso-line is a valid result and has no error kind.
 */
enum class ErrorKind {
    INVALID_INPUT,          ///< Out-of-domain or physically inconsistent input
    CONVERGENCE_FAILURE     ///< Iterative solve exhausted its iteration budget
};

std::string toString(ErrorKind kind);

/**
 * @brief Base exception for all psychrometric failures
 *
 * Callers can catch PsychroError and switch on kind(), or catch the
 * concrete subclasses below.
 */
class PsychroError : public std::runtime_error {
public:
    PsychroError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidInputError : public PsychroError {
public:
    explicit InvalidInputError(const std::string& message)
        : PsychroError(ErrorKind::INVALID_INPUT, message) {}
};

class ConvergenceError : public PsychroError {
public:
    ConvergenceError(const std::string& message, int iterations, double residual)
        : PsychroError(ErrorKind::CONVERGENCE_FAILURE, message),
          iterations_(iterations), residual_(residual) {}

    int iterations() const noexcept { return iterations_; }
    double residual() const noexcept { return residual_; }

private:
    int iterations_;
    double residual_;
};

} // namespace MASE

#endif // PSYCHRO_ERROR_HPP
