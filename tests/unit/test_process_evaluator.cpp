/**
 * @file test_process_evaluator.cpp
 * @brief Unit tests for process loads, mixing and flow conversion
 */

#include <gtest/gtest.h>
#include "ProcessEvaluator.hpp"
#include "PsychroError.hpp"
#include <cmath>

using namespace MASE;

class ProcessEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        room = AirState::fromDryBulbRelativeHumidity(24.0, 0.5, p_std);
        coil = AirState::fromDryBulbRelativeHumidity(14.0, 0.95, p_std);
    }

    ProcessEvaluator evaluator;
    const double p_std = 101325.0;
    std::optional<AirState> room;
    std::optional<AirState> coil;
};

// ============================================================================
// Load Tests
// ============================================================================

TEST_F(ProcessEvaluatorTest, CoolingCoilLoads) {
    ProcessResult r = evaluator.evaluate("Coil", *room, *coil, 1.0);

    EXPECT_EQ(r.name, "Coil");
    EXPECT_DOUBLE_EQ(r.mass_flow, 1.0);
    EXPECT_NEAR(r.total_heat, -9814.65, 1.5);
    EXPECT_NEAR(r.sensible_heat, -10232.95, 0.5);
    EXPECT_NEAR(r.latent_heat, 418.30, 1.5);
    EXPECT_NEAR(r.latent_heat, r.total_heat - r.sensible_heat, 1e-9);
    EXPECT_NEAR(r.moisture_rate, coil->humidityRatio() - room->humidityRatio(), 1e-15);
    ASSERT_TRUE(r.sensible_heat_ratio.has_value());
    EXPECT_NEAR(*r.sensible_heat_ratio, r.sensible_heat / r.total_heat, 1e-12);
    ASSERT_TRUE(r.entering_state.has_value());
    ASSERT_TRUE(r.leaving_state.has_value());
    EXPECT_DOUBLE_EQ(r.leaving_state->dryBulb(), 14.0);
}

TEST_F(ProcessEvaluatorTest, LoadsScaleWithMassFlow) {
    ProcessResult one = evaluator.evaluate("Coil", *room, *coil, 1.0);
    ProcessResult ten = evaluator.evaluate("Coil", *room, *coil, 10.0);
    EXPECT_NEAR(ten.total_heat, 10.0 * one.total_heat, 1e-6);
    EXPECT_NEAR(ten.sensible_heat, 10.0 * one.sensible_heat, 1e-6);
    EXPECT_NEAR(*ten.sensible_heat_ratio, *one.sensible_heat_ratio, 1e-12);
}

TEST_F(ProcessEvaluatorTest, ReverseProcessFlipsSigns) {
    ProcessResult forward = evaluator.evaluate("Forward", *room, *coil, 1.0);
    ProcessResult reverse = evaluator.evaluate("Reverse", *coil, *room, 1.0);
    EXPECT_NEAR(reverse.total_heat, -forward.total_heat, 1e-6);
    EXPECT_NEAR(reverse.moisture_rate, -forward.moisture_rate, 1e-15);
}

TEST_F(ProcessEvaluatorTest, NoChangeHasNoHeatRatio) {
    ProcessResult r = evaluator.evaluate("Idle", *room, *room, 5.0);
    EXPECT_DOUBLE_EQ(r.total_heat, 0.0);
    EXPECT_DOUBLE_EQ(r.sensible_heat, 0.0);
    EXPECT_FALSE(r.sensible_heat_ratio.has_value());
}

TEST_F(ProcessEvaluatorTest, ZeroMassFlowIsAllowed) {
    ProcessResult r = evaluator.evaluate("Off", *room, *coil, 0.0);
    EXPECT_DOUBLE_EQ(r.total_heat, 0.0);
    EXPECT_FALSE(r.sensible_heat_ratio.has_value());
}

TEST_F(ProcessEvaluatorTest, SensibleHeatingIsAllSensible) {
    ProcessResult r = evaluator.sensibleHeating("Reheat", *coil, 22.0, 2.0);
    EXPECT_NEAR(r.leaving_state->humidityRatio(), coil->humidityRatio(), 1e-15);
    EXPECT_NEAR(r.latent_heat, 0.0, 1e-6);
    EXPECT_NEAR(*r.sensible_heat_ratio, 1.0, 1e-9);
    EXPECT_GT(r.sensible_heat, 0.0);
    EXPECT_NEAR(r.moisture_rate, 0.0, 1e-15);
}

TEST_F(ProcessEvaluatorTest, ToStateResolvesAtEnteringPressure) {
    AirState site = AirState::fromDryBulbRelativeHumidity(30.0, 0.4, 90000.0);
    ProcessResult r = evaluator.toState("Cool", site, StateInput::dryBulbRelativeHumidity(15.0, 0.9), 1.0);
    EXPECT_DOUBLE_EQ(r.leaving_state->pressure(), 90000.0);
    EXPECT_LT(r.total_heat, 0.0);
}

TEST_F(ProcessEvaluatorTest, InvalidMassFlowThrows) {
    EXPECT_THROW(evaluator.evaluate("Bad", *room, *coil, -5.0), InvalidInputError);
    EXPECT_THROW(evaluator.evaluate("Bad", *room, *coil, -1.0), InvalidInputError);
    EXPECT_THROW(evaluator.evaluate("Bad", *room, *coil, NAN), InvalidInputError);
    EXPECT_THROW(evaluator.sensibleHeating("Bad", *room, 30.0, -0.5), InvalidInputError);
}

TEST_F(ProcessEvaluatorTest, MismatchedPressureThrows) {
    AirState other = AirState::fromDryBulbRelativeHumidity(14.0, 0.95, 90000.0);
    EXPECT_THROW(evaluator.evaluate("Bad", *room, other, 1.0), InvalidInputError);
}

// ============================================================================
// Mixing Tests
// ============================================================================

TEST_F(ProcessEvaluatorTest, EqualMassMixing) {
    AirState outdoor = AirState::fromDryBulbWetBulb(35.0, 25.0, p_std);
    AirState mixed = evaluator.mix(*room, 1.0, outdoor, 1.0);

    EXPECT_NEAR(mixed.humidityRatio(), 0.0125704, 2e-6);
    EXPECT_NEAR(mixed.enthalpy(), 61838.86, 2.0);
    EXPECT_NEAR(mixed.dryBulb(), 29.5325, 2e-3);
    EXPECT_NEAR(mixed.humidityRatio(), 0.5 * (room->humidityRatio() + outdoor.humidityRatio()), 1e-15);
    EXPECT_NEAR(mixed.enthalpy(), 0.5 * (room->enthalpy() + outdoor.enthalpy()), 1e-6);
}

TEST_F(ProcessEvaluatorTest, MixingWithZeroFlowReturnsOtherStream) {
    AirState outdoor = AirState::fromDryBulbWetBulb(35.0, 25.0, p_std);
    AirState mixed = evaluator.mix(*room, 0.0, outdoor, 3.0);
    EXPECT_TRUE(mixed.isConsistentWith(outdoor));
}

TEST_F(ProcessEvaluatorTest, FogMixingThrows) {
    AirState cold = AirState::fromDryBulbRelativeHumidity(0.0, 1.0, p_std);
    AirState hot = AirState::fromDryBulbRelativeHumidity(40.0, 1.0, p_std);
    EXPECT_THROW(evaluator.mix(cold, 1.0, hot, 1.0), InvalidInputError);
}

TEST_F(ProcessEvaluatorTest, MixingNeedsFlow) {
    EXPECT_THROW(evaluator.mix(*room, 0.0, *coil, 0.0), InvalidInputError);
    AirState other = AirState::fromDryBulbRelativeHumidity(24.0, 0.5, 90000.0);
    EXPECT_THROW(evaluator.mix(*room, 1.0, other, 1.0), InvalidInputError);
}

// ============================================================================
// Flow Conversion Tests
// ============================================================================

TEST_F(ProcessEvaluatorTest, VolumeToMassFlow) {
    double m = ProcessEvaluator::massFlowFromVolumeFlow(1.0, *room);
    EXPECT_NEAR(m, 1.0 / 0.854377, 2e-5);
    EXPECT_NEAR(ProcessEvaluator::volumeFlowFromMassFlow(m, *room), 1.0, 1e-12);
    EXPECT_THROW(ProcessEvaluator::massFlowFromVolumeFlow(-1.0, *room), InvalidInputError);
    EXPECT_THROW(ProcessEvaluator::volumeFlowFromMassFlow(-1.0, *room), InvalidInputError);
}
