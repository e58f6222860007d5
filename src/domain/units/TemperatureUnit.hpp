#pragma once

#include "domain/units/MeasurableUnit.hpp"

#include <array>
#include <string_view>

namespace qm::domain {

enum class TemperatureUnit { CELSIUS, FAHRENHEIT, KELVIN };

// Base unit: Celsius. Conversions are affine, so there is no scalar factor
// and the category takes no part in arithmetic.
template <>
struct UnitTraits<TemperatureUnit> {
    static constexpr UnitCategory category = UnitCategory::TEMPERATURE;
    static constexpr TemperatureUnit base_unit = TemperatureUnit::CELSIUS;
    static constexpr bool supports_arithmetic = false;
    static constexpr std::array<TemperatureUnit, 3> units = {
        TemperatureUnit::CELSIUS, TemperatureUnit::FAHRENHEIT, TemperatureUnit::KELVIN};

    static std::string_view id(TemperatureUnit unit);
    static std::string_view name(TemperatureUnit unit);
    static std::string_view symbol(TemperatureUnit unit);
    static double conversion_factor(TemperatureUnit unit);
    static double to_base(TemperatureUnit unit, double value);
    static double from_base(TemperatureUnit unit, double value_in_base);
};

} // namespace qm::domain
