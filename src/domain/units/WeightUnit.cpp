#include "domain/units/WeightUnit.hpp"

namespace qm::domain {

std::string_view UnitTraits<WeightUnit>::id(WeightUnit unit) {
    switch (unit) {
        case WeightUnit::KILOGRAM: return "KILOGRAM";
        case WeightUnit::GRAM: return "GRAM";
        case WeightUnit::POUND: return "POUND";
    }
    return "UNKNOWN";
}

std::string_view UnitTraits<WeightUnit>::name(WeightUnit unit) {
    switch (unit) {
        case WeightUnit::KILOGRAM: return "kilograms";
        case WeightUnit::GRAM: return "grams";
        case WeightUnit::POUND: return "pounds";
    }
    return "unknown";
}

std::string_view UnitTraits<WeightUnit>::symbol(WeightUnit unit) {
    switch (unit) {
        case WeightUnit::KILOGRAM: return "kg";
        case WeightUnit::GRAM: return "g";
        case WeightUnit::POUND: return "lb";
    }
    return "?";
}

double UnitTraits<WeightUnit>::conversion_factor(WeightUnit unit) {
    switch (unit) {
        case WeightUnit::KILOGRAM: return 1.0;
        case WeightUnit::GRAM: return 0.001;
        case WeightUnit::POUND: return 0.45359237;
    }
    throw std::invalid_argument("Invalid weight unit");
}

} // namespace qm::domain
