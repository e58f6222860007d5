#include "domain/units/WeightUnit.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace qm::domain;

TEST(WeightUnit, KilogramIsBaseUnit) {
    EXPECT_EQ(UnitTraits<WeightUnit>::base_unit, WeightUnit::KILOGRAM);
    EXPECT_EQ(unit_category(WeightUnit::GRAM), UnitCategory::WEIGHT);
}

TEST(WeightUnit, ConversionFactors) {
    EXPECT_DOUBLE_EQ(conversion_factor(WeightUnit::KILOGRAM), 1.0);
    EXPECT_DOUBLE_EQ(conversion_factor(WeightUnit::GRAM), 0.001);
    EXPECT_DOUBLE_EQ(conversion_factor(WeightUnit::POUND), 0.45359237);
}

TEST(WeightUnit, ConvertGramToKilogram) {
    EXPECT_NEAR(convert(WeightUnit::GRAM, WeightUnit::KILOGRAM, 2000.0), 2.0, 1e-9);
}

TEST(WeightUnit, ConvertKilogramToPound) {
    EXPECT_NEAR(convert(WeightUnit::KILOGRAM, WeightUnit::POUND, 1.0), 2.20462262, 1e-6);
}

TEST(WeightUnit, ConvertPoundToGram) {
    EXPECT_NEAR(convert(WeightUnit::POUND, WeightUnit::GRAM, 1.0), 453.59237, 1e-6);
}

TEST(WeightUnit, SupportsArithmetic) {
    EXPECT_TRUE(supports_arithmetic(WeightUnit::POUND));
}

TEST(WeightUnit, NamesAndSymbols) {
    EXPECT_EQ(to_string(WeightUnit::KILOGRAM), "kilograms (kg)");
    EXPECT_EQ(unit_symbol(WeightUnit::GRAM), "g");
    EXPECT_EQ(unit_symbol(WeightUnit::POUND), "lb");
}

TEST(WeightUnit, ThrowsOnInfinity) {
    EXPECT_THROW(to_base(WeightUnit::GRAM, std::numeric_limits<double>::infinity()),
                 InvalidValueError);
}
