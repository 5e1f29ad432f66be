/**
 * @file test_atmospheric_model.cpp
 * @brief Unit tests for the standard atmosphere and AtmosphericContext
 */

#include <gtest/gtest.h>
#include "AtmosphericModel.hpp"
#include "PsychroError.hpp"
#include <cmath>

using namespace MASE;

class AtmosphericModelTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

// ============================================================================
// Standard Atmosphere Tests
// ============================================================================

TEST_F(AtmosphericModelTest, SeaLevelPressure) {
    EXPECT_NEAR(AtmosphereUtils::standardPressure(0.0), 101325.0, 1e-9);
}

TEST_F(AtmosphericModelTest, PressureAtAltitude) {
    EXPECT_NEAR(AtmosphereUtils::standardPressure(1000.0), 89874.5, 1.0);
    EXPECT_NEAR(AtmosphereUtils::standardPressure(1694.0), 82562.0, 5.0);
}

TEST_F(AtmosphericModelTest, PressureDecreasesWithAltitude) {
    double previous = AtmosphereUtils::standardPressure(-500.0);
    for (double z = 0.0; z <= 11000.0; z += 500.0) {
        double p = AtmosphereUtils::standardPressure(z);
        EXPECT_LT(p, previous) << "at " << z << " m";
        previous = p;
    }
}

TEST_F(AtmosphericModelTest, PressureAltitudeInvertsStandardPressure) {
    for (double z : {-300.0, 0.0, 22.0, 612.0, 1694.0, 5000.0}) {
        double p = AtmosphereUtils::standardPressure(z);
        EXPECT_NEAR(AtmosphereUtils::pressureAltitude(p), z, 1e-6) << "at " << z << " m";
    }
}

TEST_F(AtmosphericModelTest, IsothermalBarometricFormula) {
    double p = AtmosphereUtils::barometricFormula(1000.0, 288.15, 101325.0, 0.0);
    double expected = 101325.0 * std::exp(-AtmosphereConstants::G0 * 1000.0 /
                                          (AtmosphereConstants::R_AIR_DRY * 288.15));
    EXPECT_NEAR(p, expected, 1e-9);
}

// ============================================================================
// AtmosphericContext Tests
// ============================================================================

TEST_F(AtmosphericModelTest, DefaultContextIsSeaLevel) {
    AtmosphericContext context;
    EXPECT_DOUBLE_EQ(context.pressure(), 101325.0);
    EXPECT_DOUBLE_EQ(context.altitude(), 0.0);
    EXPECT_FALSE(context.hasPressureOverride());
}

TEST_F(AtmosphericModelTest, ContextFromAltitude) {
    AtmosphericContext context = AtmosphericContext::fromAltitude(1000.0);
    EXPECT_NEAR(context.pressure(), 89874.5, 1.0);
    EXPECT_DOUBLE_EQ(context.altitude(), 1000.0);
    EXPECT_FALSE(context.hasPressureOverride());
}

TEST_F(AtmosphericModelTest, PressureOverrideWins) {
    AtmosphericContext context = AtmosphericContext::fromPressure(95000.0);
    EXPECT_DOUBLE_EQ(context.pressure(), 95000.0);
    EXPECT_TRUE(context.hasPressureOverride());
    EXPECT_NEAR(context.altitude(), AtmosphereUtils::pressureAltitude(95000.0), 1e-9);
    EXPECT_GT(context.altitude(), 0.0);
}

TEST_F(AtmosphericModelTest, AltitudeOutOfRangeThrows) {
    EXPECT_THROW(AtmosphericContext::fromAltitude(-600.0), InvalidInputError);
    EXPECT_THROW(AtmosphericContext::fromAltitude(12000.0), InvalidInputError);
    EXPECT_THROW(AtmosphericContext::fromAltitude(NAN), InvalidInputError);
}

TEST_F(AtmosphericModelTest, BadPressureThrows) {
    EXPECT_THROW(AtmosphericContext::fromPressure(0.0), InvalidInputError);
    EXPECT_THROW(AtmosphericContext::fromPressure(-1.0), InvalidInputError);
    EXPECT_THROW(AtmosphericContext::fromPressure(INFINITY), InvalidInputError);
}

TEST_F(AtmosphericModelTest, DescribeMentionsSource) {
    EXPECT_NE(AtmosphericContext::fromAltitude(22.0).describe().find("standard atmosphere"),
              std::string::npos);
    EXPECT_NE(AtmosphericContext::fromPressure(90000.0).describe().find("override"),
              std::string::npos);
}
