#include "domain/units/UnitCategory.hpp"

#include <gtest/gtest.h>

using namespace qm::domain;

TEST(UnitCategory, ToString) {
    EXPECT_EQ(to_string(UnitCategory::LENGTH), "length");
    EXPECT_EQ(to_string(UnitCategory::WEIGHT), "weight");
    EXPECT_EQ(to_string(UnitCategory::VOLUME), "volume");
    EXPECT_EQ(to_string(UnitCategory::TEMPERATURE), "temperature");
}

TEST(UnitCategory, FromStringIgnoresCase) {
    EXPECT_EQ(category_from_string("length"), UnitCategory::LENGTH);
    EXPECT_EQ(category_from_string("Weight"), UnitCategory::WEIGHT);
    EXPECT_EQ(category_from_string("VOLUME"), UnitCategory::VOLUME);
    EXPECT_EQ(category_from_string("temperature"), UnitCategory::TEMPERATURE);
}

TEST(UnitCategory, FromStringRejectsUnknown) {
    EXPECT_FALSE(category_from_string("area").has_value());
    EXPECT_FALSE(category_from_string("").has_value());
    EXPECT_FALSE(category_from_string("lengths").has_value());
}

TEST(UnitCategory, AllCategories) {
    auto categories = all_categories();
    ASSERT_EQ(categories.size(), 4);
    EXPECT_EQ(categories[0], UnitCategory::LENGTH);
    EXPECT_EQ(categories[3], UnitCategory::TEMPERATURE);
}
