#include "domain/units/TemperatureUnit.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>

using namespace qm::domain;

constexpr double kEps = 1e-6;

TEST(TemperatureUnit, CelsiusIsIdentity) {
    EXPECT_DOUBLE_EQ(to_base(TemperatureUnit::CELSIUS, 37.5), 37.5);
    EXPECT_DOUBLE_EQ(from_base(TemperatureUnit::CELSIUS, -12.0), -12.0);
}

TEST(TemperatureUnit, FahrenheitToCelsius) {
    EXPECT_NEAR(to_base(TemperatureUnit::FAHRENHEIT, 212.0), 100.0, kEps);
    EXPECT_NEAR(to_base(TemperatureUnit::FAHRENHEIT, 32.0), 0.0, kEps);
}

TEST(TemperatureUnit, CelsiusToFahrenheit) {
    EXPECT_NEAR(from_base(TemperatureUnit::FAHRENHEIT, 100.0), 212.0, kEps);
    EXPECT_NEAR(from_base(TemperatureUnit::FAHRENHEIT, 37.0), 98.6, kEps);
}

TEST(TemperatureUnit, KelvinOffset) {
    EXPECT_NEAR(to_base(TemperatureUnit::KELVIN, 273.15), 0.0, kEps);
    EXPECT_NEAR(from_base(TemperatureUnit::KELVIN, -273.15), 0.0, kEps);
}

TEST(TemperatureUnit, MinusFortyIsSharedByCelsiusAndFahrenheit) {
    EXPECT_NEAR(convert(TemperatureUnit::CELSIUS, TemperatureUnit::FAHRENHEIT, -40.0), -40.0,
                kEps);
}

TEST(TemperatureUnit, FahrenheitToKelvin) {
    EXPECT_NEAR(convert(TemperatureUnit::FAHRENHEIT, TemperatureUnit::KELVIN, 32.0), 273.15,
                kEps);
}

TEST(TemperatureUnit, DoesNotSupportArithmetic) {
    EXPECT_FALSE(supports_arithmetic(TemperatureUnit::CELSIUS));
    static_assert(!UnitTraits<TemperatureUnit>::supports_arithmetic);
}

TEST(TemperatureUnit, ValidateOperationSupportThrowsWithOperationName) {
    try {
        validate_operation_support(TemperatureUnit::KELVIN, "addition");
        FAIL() << "Expected UnsupportedOperationError";
    } catch (const UnsupportedOperationError& e) {
        EXPECT_EQ(e.operation(), "addition");
        EXPECT_NE(std::string(e.what()).find("Temperature units do not support addition"),
                  std::string::npos);
    }
}

TEST(TemperatureUnit, ConversionFactorIsUnsupported) {
    EXPECT_THROW(conversion_factor(TemperatureUnit::FAHRENHEIT), UnsupportedOperationError);
}

TEST(TemperatureUnit, NamesAndSymbols) {
    EXPECT_EQ(unit_name(TemperatureUnit::CELSIUS), "Celsius");
    EXPECT_EQ(unit_symbol(TemperatureUnit::FAHRENHEIT), "°F");
    EXPECT_EQ(to_string(TemperatureUnit::KELVIN), "Kelvin (K)");
}

TEST(TemperatureUnit, ThrowsOnNaN) {
    EXPECT_THROW(to_base(TemperatureUnit::KELVIN, std::numeric_limits<double>::quiet_NaN()),
                 InvalidValueError);
}
