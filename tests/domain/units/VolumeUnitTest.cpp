#include "domain/units/VolumeUnit.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace qm::domain;

TEST(VolumeUnit, LitreIsBaseUnit) {
    EXPECT_EQ(UnitTraits<VolumeUnit>::base_unit, VolumeUnit::LITRE);
    EXPECT_DOUBLE_EQ(to_base(VolumeUnit::LITRE, 4.2), 4.2);
}

TEST(VolumeUnit, ConversionFactors) {
    EXPECT_DOUBLE_EQ(conversion_factor(VolumeUnit::MILLILITRE), 0.001);
    EXPECT_DOUBLE_EQ(conversion_factor(VolumeUnit::GALLON), 3.78541);
}

TEST(VolumeUnit, ConvertMillilitreToLitre) {
    EXPECT_NEAR(convert(VolumeUnit::MILLILITRE, VolumeUnit::LITRE, 1000.0), 1.0, 1e-9);
}

TEST(VolumeUnit, ConvertGallonToMillilitre) {
    EXPECT_NEAR(convert(VolumeUnit::GALLON, VolumeUnit::MILLILITRE, 1.0), 3785.41, 1e-6);
}

TEST(VolumeUnit, NamesAndSymbols) {
    EXPECT_EQ(to_string(VolumeUnit::LITRE), "litres (L)");
    EXPECT_EQ(unit_symbol(VolumeUnit::MILLILITRE), "mL");
    EXPECT_EQ(unit_name(VolumeUnit::GALLON), "gallons");
}

TEST(VolumeUnit, ThrowsOnNaN) {
    EXPECT_THROW(from_base(VolumeUnit::GALLON, std::numeric_limits<double>::quiet_NaN()),
                 InvalidValueError);
}
