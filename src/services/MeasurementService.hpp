#pragma once

#include "domain/errors/MeasurementErrors.hpp"
#include "domain/units/MeasurableUnit.hpp"
#include "domain/value_objects/Quantity.hpp"
#include "infrastructure/NumericInput.hpp"

#include <concepts>
#include <optional>
#include <string_view>

namespace qm::services {

// Stateless facade over Quantity, generic over the unit category.
// Absent operands (std::nullopt) model user input that failed to parse.
class MeasurementService {
public:
    template <typename U>
    using OptionalQuantity = std::optional<qm::domain::Quantity<U>>;

    // Returns std::nullopt for absent, blank or non-numeric input, and for
    // values a Quantity cannot hold ("nan", "inf").
    template <qm::domain::MeasurableUnit U>
    OptionalQuantity<U> parse_quantity(std::optional<std::string_view> input, U unit) const {
        if (!input) return std::nullopt;
        auto parsed = qm::infrastructure::try_parse_double(*input);
        if (!parsed) return std::nullopt;
        try {
            return qm::domain::Quantity<U>(*parsed, unit);
        } catch (const qm::domain::InvalidValueError&) {
            return std::nullopt;
        }
    }

    // Equality
    template <qm::domain::MeasurableUnit U>
    bool are_equal(const qm::domain::Quantity<U>& first,
                   const qm::domain::Quantity<U>& second) const {
        return first.equals(second);
    }

    template <qm::domain::MeasurableUnit U>
    bool are_equal(const OptionalQuantity<U>& first, const OptionalQuantity<U>& second) const {
        if (!first || !second) return false;
        return first->equals(*second);
    }

    template <qm::domain::MeasurableUnit U, qm::domain::MeasurableUnit V>
        requires(!std::same_as<U, V>)
    bool are_equal(const qm::domain::Quantity<U>&, const qm::domain::Quantity<V>&) const noexcept {
        return false;
    }

    template <qm::domain::MeasurableUnit U, qm::domain::MeasurableUnit V>
        requires(!std::same_as<U, V>)
    bool are_equal(const OptionalQuantity<U>&, const OptionalQuantity<V>&) const noexcept {
        return false;
    }

    // Conversion
    template <qm::domain::MeasurableUnit U>
    double convert_value(double value, U source, U target) const {
        return qm::domain::Quantity<U>(value, source).convert_to_scalar(target);
    }

    // Arithmetic. The optional overloads throw NullArgumentError for a
    // missing operand; UnsupportedOperationError propagates from Quantity.
    template <qm::domain::MeasurableUnit U>
    qm::domain::Quantity<U> add(const qm::domain::Quantity<U>& first,
                                const qm::domain::Quantity<U>& second) const {
        return first.add(second);
    }

    template <qm::domain::MeasurableUnit U>
    qm::domain::Quantity<U> add(const OptionalQuantity<U>& first,
                                const OptionalQuantity<U>& second) const {
        require_operands(first, second);
        return first->add(*second);
    }

    template <qm::domain::MeasurableUnit U>
    qm::domain::Quantity<U> add_with_target(const qm::domain::Quantity<U>& first,
                                            const qm::domain::Quantity<U>& second,
                                            U target) const {
        return first.add(second, target);
    }

    template <qm::domain::MeasurableUnit U>
    qm::domain::Quantity<U> add_with_target(const OptionalQuantity<U>& first,
                                            const OptionalQuantity<U>& second,
                                            U target) const {
        require_operands(first, second);
        return first->add(*second, target);
    }

    template <qm::domain::MeasurableUnit U>
    qm::domain::Quantity<U> subtract(const qm::domain::Quantity<U>& first,
                                     const qm::domain::Quantity<U>& second) const {
        return first.subtract(second);
    }

    template <qm::domain::MeasurableUnit U>
    qm::domain::Quantity<U> subtract(const OptionalQuantity<U>& first,
                                     const OptionalQuantity<U>& second) const {
        require_operands(first, second);
        return first->subtract(*second);
    }

    template <qm::domain::MeasurableUnit U>
    qm::domain::Quantity<U> subtract_with_target(const qm::domain::Quantity<U>& first,
                                                 const qm::domain::Quantity<U>& second,
                                                 U target) const {
        return first.subtract(second, target);
    }

    template <qm::domain::MeasurableUnit U>
    qm::domain::Quantity<U> subtract_with_target(const OptionalQuantity<U>& first,
                                                 const OptionalQuantity<U>& second,
                                                 U target) const {
        require_operands(first, second);
        return first->subtract(*second, target);
    }

    template <qm::domain::MeasurableUnit U>
    double divide(const qm::domain::Quantity<U>& first,
                  const qm::domain::Quantity<U>& second) const {
        return first.divide(second);
    }

    template <qm::domain::MeasurableUnit U>
    double divide(const OptionalQuantity<U>& first, const OptionalQuantity<U>& second) const {
        require_operands(first, second);
        return first->divide(*second);
    }

private:
    template <qm::domain::MeasurableUnit U>
    static void require_operands(const OptionalQuantity<U>& first,
                                 const OptionalQuantity<U>& second) {
        if (!first) throw qm::domain::NullArgumentError("First quantity");
        if (!second) throw qm::domain::NullArgumentError("Second quantity");
    }
};

} // namespace qm::services
