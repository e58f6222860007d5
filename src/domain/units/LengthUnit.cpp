#include "domain/units/LengthUnit.hpp"

namespace qm::domain {

std::string_view UnitTraits<LengthUnit>::id(LengthUnit unit) {
    switch (unit) {
        case LengthUnit::FEET: return "FEET";
        case LengthUnit::INCH: return "INCH";
        case LengthUnit::YARD: return "YARD";
        case LengthUnit::CENTIMETER: return "CENTIMETER";
    }
    return "UNKNOWN";
}

std::string_view UnitTraits<LengthUnit>::name(LengthUnit unit) {
    switch (unit) {
        case LengthUnit::FEET: return "feet";
        case LengthUnit::INCH: return "inches";
        case LengthUnit::YARD: return "yards";
        case LengthUnit::CENTIMETER: return "centimeters";
    }
    return "unknown";
}

std::string_view UnitTraits<LengthUnit>::symbol(LengthUnit unit) {
    switch (unit) {
        case LengthUnit::FEET: return "ft";
        case LengthUnit::INCH: return "in";
        case LengthUnit::YARD: return "yd";
        case LengthUnit::CENTIMETER: return "cm";
    }
    return "?";
}

double UnitTraits<LengthUnit>::conversion_factor(LengthUnit unit) {
    switch (unit) {
        case LengthUnit::FEET: return 1.0;
        case LengthUnit::INCH: return 1.0 / 12.0;
        case LengthUnit::YARD: return 3.0;
        case LengthUnit::CENTIMETER: return 1.0 / (2.54 * 12.0);
    }
    throw std::invalid_argument("Invalid length unit");
}

} // namespace qm::domain
