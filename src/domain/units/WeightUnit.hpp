#pragma once

#include "domain/units/MeasurableUnit.hpp"

#include <array>
#include <string_view>

namespace qm::domain {

enum class WeightUnit { KILOGRAM, GRAM, POUND };

// Base unit: kilogram.
template <>
struct UnitTraits<WeightUnit> : LinearConversion<WeightUnit> {
    static constexpr UnitCategory category = UnitCategory::WEIGHT;
    static constexpr WeightUnit base_unit = WeightUnit::KILOGRAM;
    static constexpr std::array<WeightUnit, 3> units = {
        WeightUnit::KILOGRAM, WeightUnit::GRAM, WeightUnit::POUND};

    static std::string_view id(WeightUnit unit);
    static std::string_view name(WeightUnit unit);
    static std::string_view symbol(WeightUnit unit);
    static double conversion_factor(WeightUnit unit);
};

} // namespace qm::domain
