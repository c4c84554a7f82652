#ifndef PSRISK_ERRORS_HPP
#define PSRISK_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace psrisk {

struct FieldError {
    std::string field;
    std::string message;
};

// Bad caller input. Carries one entry per offending field.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message, std::vector<FieldError> errors = {})
        : std::runtime_error(message), errors_(std::move(errors)) {}

    const std::vector<FieldError>& errors() const { return errors_; }

private:
    std::vector<FieldError> errors_;
};

class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised by access policies; the engine only propagates it.
class ForbiddenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Persisted data violates an invariant the engine depends on.
class ComputationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace psrisk

#endif  // PSRISK_ERRORS_HPP
