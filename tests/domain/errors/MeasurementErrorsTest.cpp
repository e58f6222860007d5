#include "domain/errors/MeasurementErrors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

using namespace qm::domain;

TEST(MeasurementErrors, RequireFiniteAcceptsFiniteValues) {
    EXPECT_NO_THROW(require_finite(0.0));
    EXPECT_NO_THROW(require_finite(-1e300));
    EXPECT_NO_THROW(require_finite(std::numeric_limits<double>::denorm_min()));
}

TEST(MeasurementErrors, RequireFiniteRejectsNaNAndInfinity) {
    EXPECT_THROW(require_finite(std::nan("")), InvalidValueError);
    EXPECT_THROW(require_finite(std::numeric_limits<double>::infinity()), InvalidValueError);
    EXPECT_THROW(require_finite(-std::numeric_limits<double>::infinity()), InvalidValueError);
}

TEST(MeasurementErrors, InvalidValueMessageNamesTheValue) {
    InvalidValueError error(std::numeric_limits<double>::infinity());
    EXPECT_EQ(std::string(error.what()), "Invalid value: inf. Value must be a finite number.");
}

TEST(MeasurementErrors, UnsupportedOperationCarriesOperation) {
    UnsupportedOperationError error("division", "no division");
    EXPECT_EQ(error.operation(), "division");
    EXPECT_STREQ(error.what(), "no division");
}

TEST(MeasurementErrors, NullArgumentNamesTheArgument) {
    NullArgumentError error("First quantity");
    EXPECT_EQ(error.argument(), "First quantity");
    EXPECT_STREQ(error.what(), "First quantity cannot be null");
}

TEST(MeasurementErrors, ErrorsDeriveFromStandardExceptions) {
    EXPECT_THROW(throw InvalidValueError(1.0), std::invalid_argument);
    EXPECT_THROW(throw UnsupportedOperationError("op", "msg"), std::logic_error);
    EXPECT_THROW(throw DivisionByZeroError(), std::domain_error);
    EXPECT_THROW(throw NullArgumentError("x"), std::invalid_argument);
}
