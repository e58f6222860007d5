#pragma once

#include "domain/errors/MeasurementErrors.hpp"
#include "domain/units/LengthUnit.hpp"
#include "domain/units/MeasurableUnit.hpp"
#include "domain/units/TemperatureUnit.hpp"
#include "domain/units/VolumeUnit.hpp"
#include "domain/units/WeightUnit.hpp"

#include <cmath>
#include <concepts>
#include <sstream>
#include <string>

namespace qm::domain {

// A finite value tagged with a unit of one category. Immutable: every
// operation returns a new Quantity.
//
// Equality is tolerance based (|a - b| < 1e-6 in the base unit), so no
// std::hash is provided. Do not use quantities as unordered container keys.
template <MeasurableUnit U>
class Quantity {
public:
    using unit_type = U;

    static constexpr double tolerance = 1e-6;

    Quantity(double value, U unit) : value_(value), unit_(unit) {
        require_finite(value);
    }

    double value() const noexcept { return value_; }
    U unit() const noexcept { return unit_; }

    double base_value() const { return to_base(unit_, value_); }

    Quantity convert_to(U target) const {
        return Quantity(convert(unit_, target, value_), target);
    }

    double convert_to_scalar(U target) const {
        return convert_to(target).value();
    }

    // Additive results are rounded to two decimal places in the result unit.
    Quantity add(const Quantity& other) const { return add(other, unit_); }

    Quantity add(const Quantity& other, U target) const {
        validate_operation_support(unit_, "addition");
        return Quantity(round_result(from_base(target, base_value() + other.base_value())),
                        target);
    }

    Quantity subtract(const Quantity& other) const { return subtract(other, unit_); }

    Quantity subtract(const Quantity& other, U target) const {
        validate_operation_support(unit_, "subtraction");
        return Quantity(round_result(from_base(target, base_value() - other.base_value())),
                        target);
    }

    // Dimensionless ratio of the two base-unit values, unrounded.
    double divide(const Quantity& other) const {
        validate_operation_support(unit_, "division");
        double divisor = other.base_value();
        if (std::abs(divisor) < kZeroDivisorThreshold) {
            throw DivisionByZeroError();
        }
        return base_value() / divisor;
    }

    static Quantity sum(const Quantity& first, const Quantity& second, U target) {
        return first.add(second, target);
    }

    static Quantity difference(const Quantity& first, const Quantity& second, U target) {
        return first.subtract(second, target);
    }

    static double ratio(const Quantity& first, const Quantity& second) {
        return first.divide(second);
    }

    bool equals(const Quantity& other) const {
        return std::abs(base_value() - other.base_value()) < tolerance;
    }

    // Quantities of different categories are never equal.
    template <MeasurableUnit V>
        requires(!std::same_as<U, V>)
    bool equals(const Quantity<V>&) const noexcept {
        return false;
    }

    bool operator==(const Quantity& other) const { return equals(other); }

    // "3 yd"
    std::string to_string() const {
        std::ostringstream out;
        out << value_ << ' ' << unit_symbol(unit_);
        return out.str();
    }

private:
    static constexpr double kZeroDivisorThreshold = 1e-9;

    // Magnitudes too large to scale have no fractional part left to round.
    static double round_result(double value) {
        double scaled = value * 100.0;
        if (!std::isfinite(scaled)) return value;
        return std::round(scaled) / 100.0;
    }

    double value_;
    U unit_;
};

using LengthQuantity = Quantity<LengthUnit>;
using WeightQuantity = Quantity<WeightUnit>;
using VolumeQuantity = Quantity<VolumeUnit>;
using TemperatureQuantity = Quantity<TemperatureUnit>;

extern template class Quantity<LengthUnit>;
extern template class Quantity<WeightUnit>;
extern template class Quantity<VolumeUnit>;
extern template class Quantity<TemperatureUnit>;

} // namespace qm::domain
