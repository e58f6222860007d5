#pragma once

#include "domain/units/MeasurableUnit.hpp"

#include <array>
#include <string_view>

namespace qm::domain {

enum class LengthUnit { FEET, INCH, YARD, CENTIMETER };

// Base unit: feet.
template <>
struct UnitTraits<LengthUnit> : LinearConversion<LengthUnit> {
    static constexpr UnitCategory category = UnitCategory::LENGTH;
    static constexpr LengthUnit base_unit = LengthUnit::FEET;
    static constexpr std::array<LengthUnit, 4> units = {
        LengthUnit::FEET, LengthUnit::INCH, LengthUnit::YARD, LengthUnit::CENTIMETER};

    static std::string_view id(LengthUnit unit);
    static std::string_view name(LengthUnit unit);
    static std::string_view symbol(LengthUnit unit);
    static double conversion_factor(LengthUnit unit);
};

} // namespace qm::domain
