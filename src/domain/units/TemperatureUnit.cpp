#include "domain/units/TemperatureUnit.hpp"

namespace qm::domain {

namespace {

constexpr double kKelvinOffset = 273.15;

} // namespace

std::string_view UnitTraits<TemperatureUnit>::id(TemperatureUnit unit) {
    switch (unit) {
        case TemperatureUnit::CELSIUS: return "CELSIUS";
        case TemperatureUnit::FAHRENHEIT: return "FAHRENHEIT";
        case TemperatureUnit::KELVIN: return "KELVIN";
    }
    return "UNKNOWN";
}

std::string_view UnitTraits<TemperatureUnit>::name(TemperatureUnit unit) {
    switch (unit) {
        case TemperatureUnit::CELSIUS: return "Celsius";
        case TemperatureUnit::FAHRENHEIT: return "Fahrenheit";
        case TemperatureUnit::KELVIN: return "Kelvin";
    }
    return "unknown";
}

std::string_view UnitTraits<TemperatureUnit>::symbol(TemperatureUnit unit) {
    switch (unit) {
        case TemperatureUnit::CELSIUS: return "°C";
        case TemperatureUnit::FAHRENHEIT: return "°F";
        case TemperatureUnit::KELVIN: return "K";
    }
    return "?";
}

double UnitTraits<TemperatureUnit>::conversion_factor(TemperatureUnit) {
    throw UnsupportedOperationError(
        "conversion factor",
        "Temperature conversions are non-linear. Use to_base/from_base instead.");
}

double UnitTraits<TemperatureUnit>::to_base(TemperatureUnit unit, double value) {
    switch (unit) {
        case TemperatureUnit::CELSIUS: return value;
        case TemperatureUnit::FAHRENHEIT: return (value - 32.0) * 5.0 / 9.0;
        case TemperatureUnit::KELVIN: return value - kKelvinOffset;
    }
    throw std::invalid_argument("Invalid temperature unit");
}

double UnitTraits<TemperatureUnit>::from_base(TemperatureUnit unit, double value_in_base) {
    switch (unit) {
        case TemperatureUnit::CELSIUS: return value_in_base;
        case TemperatureUnit::FAHRENHEIT: return (value_in_base * 9.0 / 5.0) + 32.0;
        case TemperatureUnit::KELVIN: return value_in_base + kKelvinOffset;
    }
    throw std::invalid_argument("Invalid temperature unit");
}

} // namespace qm::domain
