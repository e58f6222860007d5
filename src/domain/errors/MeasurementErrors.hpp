#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace qm::domain {

class InvalidValueError : public std::invalid_argument {
public:
    explicit InvalidValueError(double value);
    explicit InvalidValueError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Thrown when a category forbids the requested arithmetic (temperature
// add/subtract/divide) or a linear factor is requested for a non-linear unit.
class UnsupportedOperationError : public std::logic_error {
public:
    UnsupportedOperationError(std::string operation, const std::string& message)
        : std::logic_error(message)
        , operation_(std::move(operation)) {}

    const std::string& operation() const noexcept { return operation_; }

private:
    std::string operation_;
};

class DivisionByZeroError : public std::domain_error {
public:
    DivisionByZeroError()
        : std::domain_error("Cannot divide by zero quantity") {}
};

class NullArgumentError : public std::invalid_argument {
public:
    explicit NullArgumentError(const std::string& argument)
        : std::invalid_argument(argument + " cannot be null")
        , argument_(argument) {}

    const std::string& argument() const noexcept { return argument_; }

private:
    std::string argument_;
};

// Throws InvalidValueError for NaN and +/-infinity.
void require_finite(double value);

} // namespace qm::domain
