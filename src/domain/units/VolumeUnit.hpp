#pragma once

#include "domain/units/MeasurableUnit.hpp"

#include <array>
#include <string_view>

namespace qm::domain {

enum class VolumeUnit { LITRE, MILLILITRE, GALLON };

// Base unit: litre.
template <>
struct UnitTraits<VolumeUnit> : LinearConversion<VolumeUnit> {
    static constexpr UnitCategory category = UnitCategory::VOLUME;
    static constexpr VolumeUnit base_unit = VolumeUnit::LITRE;
    static constexpr std::array<VolumeUnit, 3> units = {
        VolumeUnit::LITRE, VolumeUnit::MILLILITRE, VolumeUnit::GALLON};

    static std::string_view id(VolumeUnit unit);
    static std::string_view name(VolumeUnit unit);
    static std::string_view symbol(VolumeUnit unit);
    static double conversion_factor(VolumeUnit unit);
};

} // namespace qm::domain
