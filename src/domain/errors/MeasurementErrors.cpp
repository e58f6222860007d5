#include "domain/errors/MeasurementErrors.hpp"

#include <cmath>
#include <sstream>

namespace qm::domain {

namespace {

std::string describe(double value) {
    std::ostringstream out;
    out << value;
    return "Invalid value: " + out.str() + ". Value must be a finite number.";
}

} // namespace

InvalidValueError::InvalidValueError(double value)
    : std::invalid_argument(describe(value)) {}

void require_finite(double value) {
    if (!std::isfinite(value)) {
        throw InvalidValueError(value);
    }
}

} // namespace qm::domain
