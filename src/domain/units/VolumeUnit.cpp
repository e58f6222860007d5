#include "domain/units/VolumeUnit.hpp"

namespace qm::domain {

std::string_view UnitTraits<VolumeUnit>::id(VolumeUnit unit) {
    switch (unit) {
        case VolumeUnit::LITRE: return "LITRE";
        case VolumeUnit::MILLILITRE: return "MILLILITRE";
        case VolumeUnit::GALLON: return "GALLON";
    }
    return "UNKNOWN";
}

std::string_view UnitTraits<VolumeUnit>::name(VolumeUnit unit) {
    switch (unit) {
        case VolumeUnit::LITRE: return "litres";
        case VolumeUnit::MILLILITRE: return "millilitres";
        case VolumeUnit::GALLON: return "gallons";
    }
    return "unknown";
}

std::string_view UnitTraits<VolumeUnit>::symbol(VolumeUnit unit) {
    switch (unit) {
        case VolumeUnit::LITRE: return "L";
        case VolumeUnit::MILLILITRE: return "mL";
        case VolumeUnit::GALLON: return "gal";
    }
    return "?";
}

double UnitTraits<VolumeUnit>::conversion_factor(VolumeUnit unit) {
    switch (unit) {
        case VolumeUnit::LITRE: return 1.0;
        case VolumeUnit::MILLILITRE: return 0.001;
        case VolumeUnit::GALLON: return 3.78541;
    }
    throw std::invalid_argument("Invalid volume unit");
}

} // namespace qm::domain
