#pragma once

#include "domain/errors/MeasurementErrors.hpp"
#include "domain/units/UnitCategory.hpp"

#include <cctype>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace qm::domain {

// Specialized once per category enum (LengthUnit, WeightUnit, ...).
// A specialization provides:
//   category, base_unit, supports_arithmetic, units (all variants in order),
//   id(u), name(u), symbol(u), conversion_factor(u),
//   to_base(u, v), from_base(u, v)
template <typename U>
struct UnitTraits;

template <typename U>
concept MeasurableUnit = std::is_enum_v<U> && requires(U unit, double value) {
    { UnitTraits<U>::category } -> std::convertible_to<UnitCategory>;
    { UnitTraits<U>::base_unit } -> std::convertible_to<U>;
    { UnitTraits<U>::supports_arithmetic } -> std::convertible_to<bool>;
    { UnitTraits<U>::units.size() } -> std::convertible_to<std::size_t>;
    { UnitTraits<U>::id(unit) } -> std::convertible_to<std::string_view>;
    { UnitTraits<U>::name(unit) } -> std::convertible_to<std::string_view>;
    { UnitTraits<U>::symbol(unit) } -> std::convertible_to<std::string_view>;
    { UnitTraits<U>::conversion_factor(unit) } -> std::same_as<double>;
    { UnitTraits<U>::to_base(unit, value) } -> std::same_as<double>;
    { UnitTraits<U>::from_base(unit, value) } -> std::same_as<double>;
};

// Conversion law shared by the categories that scale by a fixed factor.
template <typename U>
struct LinearConversion {
    static constexpr bool supports_arithmetic = true;

    static double to_base(U unit, double value) {
        return value * UnitTraits<U>::conversion_factor(unit);
    }

    static double from_base(U unit, double value_in_base) {
        return value_in_base / UnitTraits<U>::conversion_factor(unit);
    }
};

template <MeasurableUnit U>
double to_base(U unit, double value) {
    require_finite(value);
    return UnitTraits<U>::to_base(unit, value);
}

template <MeasurableUnit U>
double from_base(U unit, double value_in_base) {
    require_finite(value_in_base);
    return UnitTraits<U>::from_base(unit, value_in_base);
}

template <MeasurableUnit U>
double convert(U source, U target, double value) {
    return from_base(target, to_base(source, value));
}

template <MeasurableUnit U>
constexpr bool supports_arithmetic(U) noexcept {
    return UnitTraits<U>::supports_arithmetic;
}

template <MeasurableUnit U>
constexpr UnitCategory unit_category(U) noexcept {
    return UnitTraits<U>::category;
}

template <MeasurableUnit U>
void validate_operation_support(U, const std::string& operation) {
    if (UnitTraits<U>::supports_arithmetic) return;

    auto category = to_string(UnitTraits<U>::category);
    category[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(category[0])));
    throw UnsupportedOperationError(
        operation,
        category + " units do not support " + operation + " operations. "
        "Only equality comparison and unit conversion are supported.");
}

// Throws UnsupportedOperationError for categories with a non-linear law.
template <MeasurableUnit U>
double conversion_factor(U unit) {
    return UnitTraits<U>::conversion_factor(unit);
}

template <MeasurableUnit U>
std::string_view unit_name(U unit) {
    return UnitTraits<U>::name(unit);
}

template <MeasurableUnit U>
std::string_view unit_symbol(U unit) {
    return UnitTraits<U>::symbol(unit);
}

// "feet (ft)"
template <MeasurableUnit U>
std::string to_string(U unit) {
    return std::string(unit_name(unit)) + " (" + std::string(unit_symbol(unit)) + ")";
}

template <MeasurableUnit U>
constexpr const auto& all_units() noexcept {
    return UnitTraits<U>::units;
}

// Matches the enumerator id ("FEET"), the name ("feet") or the symbol ("ft"),
// ignoring case.
template <MeasurableUnit U>
std::optional<U> unit_from_string(std::string_view str) {
    for (auto unit : UnitTraits<U>::units) {
        if (detail::iequals(str, UnitTraits<U>::id(unit)) ||
            detail::iequals(str, UnitTraits<U>::name(unit)) ||
            detail::iequals(str, UnitTraits<U>::symbol(unit))) {
            return unit;
        }
    }
    return std::nullopt;
}

} // namespace qm::domain
