/**
 * @file test_derivation_rules.cpp
 * @brief Unit tests for off-coil, SHR back-solve, setpoint and flow rules
 */

#include <gtest/gtest.h>
#include "DerivationRules.hpp"
#include "ProcessEvaluator.hpp"
#include "PsychroError.hpp"
#include <cmath>

using namespace MASE;

class DerivationRulesTest : public ::testing::Test {
protected:
    void SetUp() override {}

    OffCoilRequest offCoilRequest(double dew_point) const {
        OffCoilRequest request;
        request.coil_dew_point = dew_point;
        request.pressure = p_std;
        return request;
    }

    DerivationRules rules;
    ProcessEvaluator evaluator;
    const double p_std = 101325.0;
};

// ============================================================================
// Off-Coil Tests
// ============================================================================

TEST_F(DerivationRulesTest, OffCoilFromRelativeHumidity) {
    OffCoilRequest request = offCoilRequest(10.0);
    request.relative_humidity = 0.9;

    AirState s = rules.offCoil(request);
    EXPECT_NEAR(s.dryBulb(), 11.5825, 2e-3);
    EXPECT_NEAR(s.humidityRatio(), 0.0076301, 1e-6);
    EXPECT_NEAR(s.relativeHumidity(), 0.9, 1e-6);
    EXPECT_NEAR(s.dewPoint(), 10.0, 1e-4);
}

TEST_F(DerivationRulesTest, OffCoilFromApproach) {
    OffCoilRequest request = offCoilRequest(10.0);
    request.approach = 2.0;

    AirState s = rules.offCoil(request);
    EXPECT_DOUBLE_EQ(s.dryBulb(), 12.0);
    EXPECT_NEAR(s.humidityRatio(), Psychrometrics::saturationHumidityRatio(10.0, p_std), 1e-12);
}

TEST_F(DerivationRulesTest, OffCoilSaturated) {
    OffCoilRequest request = offCoilRequest(10.0);
    request.relative_humidity = 1.0;
    AirState s = rules.offCoil(request);
    EXPECT_DOUBLE_EQ(s.dryBulb(), 10.0);
    EXPECT_NEAR(s.relativeHumidity(), 1.0, 1e-9);
}

TEST_F(DerivationRulesTest, OffCoilConsistentDescriptorsAccepted) {
    OffCoilRequest request = offCoilRequest(10.0);
    request.relative_humidity = 0.9;
    AirState by_rh = rules.offCoil(request);

    request.approach = by_rh.dryBulb() - 10.0;
    AirState both = rules.offCoil(request);
    EXPECT_TRUE(both.isConsistentWith(by_rh));
}

TEST_F(DerivationRulesTest, OffCoilConflictingDescriptorsThrow) {
    OffCoilRequest request = offCoilRequest(10.0);
    request.relative_humidity = 0.9;
    request.approach = 5.0;
    EXPECT_THROW(rules.offCoil(request), InvalidInputError);
}

TEST_F(DerivationRulesTest, OffCoilInvalidInputsThrow) {
    OffCoilRequest request = offCoilRequest(10.0);
    EXPECT_THROW(rules.offCoil(request), InvalidInputError);

    request.relative_humidity = 0.0;
    EXPECT_THROW(rules.offCoil(request), InvalidInputError);

    request.relative_humidity.reset();
    request.approach = -1.0;
    EXPECT_THROW(rules.offCoil(request), InvalidInputError);

    request.approach = 1.0;
    request.coil_dew_point = NAN;
    EXPECT_THROW(rules.offCoil(request), InvalidInputError);
}

// ============================================================================
// Sensible Heat Ratio Back-Solve Tests
// ============================================================================

TEST_F(DerivationRulesTest, BackSolveLeavingState) {
    AirState room = AirState::fromDryBulbRelativeHumidity(24.0, 0.5, p_std);
    AirState leaving = rules.backSolveSensibleHeatRatio(
        SensibleHeatRatioRequest(room, KnownStateRole::ENTERING, 14.0, 0.8));

    EXPECT_DOUBLE_EQ(leaving.dryBulb(), 14.0);
    EXPECT_NEAR(leaving.humidityRatio(), 0.0082862, 2e-6);

    ProcessResult r = evaluator.evaluate("Check", room, leaving, 1.0);
    ASSERT_TRUE(r.sensible_heat_ratio.has_value());
    EXPECT_NEAR(*r.sensible_heat_ratio, 0.8, 1e-5);
}

TEST_F(DerivationRulesTest, BackSolveEnteringState) {
    AirState supply = AirState::fromDryBulbRelativeHumidity(14.0, 0.9, p_std);
    AirState entering = rules.backSolveSensibleHeatRatio(
        SensibleHeatRatioRequest(supply, KnownStateRole::LEAVING, 26.0, 0.8));

    EXPECT_DOUBLE_EQ(entering.dryBulb(), 26.0);
    ProcessResult r = evaluator.evaluate("Check", entering, supply, 1.0);
    EXPECT_NEAR(*r.sensible_heat_ratio, 0.8, 1e-5);
}

TEST_F(DerivationRulesTest, UnitHeatRatioKeepsMoisture) {
    AirState room = AirState::fromDryBulbRelativeHumidity(24.0, 0.5, p_std);
    AirState leaving = rules.backSolveSensibleHeatRatio(
        SensibleHeatRatioRequest(room, KnownStateRole::ENTERING, 30.0, 1.0));
    EXPECT_NEAR(leaving.humidityRatio(), room.humidityRatio(), 1e-8);
}

TEST_F(DerivationRulesTest, BackSolveInvalidInputsThrow) {
    AirState room = AirState::fromDryBulbRelativeHumidity(24.0, 0.5, p_std);
    EXPECT_THROW(rules.backSolveSensibleHeatRatio(
                     SensibleHeatRatioRequest(room, KnownStateRole::ENTERING, 14.0, 0.0)),
                 InvalidInputError);
    EXPECT_THROW(rules.backSolveSensibleHeatRatio(
                     SensibleHeatRatioRequest(room, KnownStateRole::ENTERING, 14.0, 1.2)),
                 InvalidInputError);
    EXPECT_THROW(rules.backSolveSensibleHeatRatio(
                     SensibleHeatRatioRequest(room, KnownStateRole::ENTERING, 24.0, 0.8)),
                 InvalidInputError);
}

TEST_F(DerivationRulesTest, UnattainableHeatRatioThrows) {
    // Heating by 1 K with SHR 0.01 needs more moisture than saturation holds
    AirState room = AirState::fromDryBulbRelativeHumidity(24.0, 0.5, p_std);
    EXPECT_THROW(rules.backSolveSensibleHeatRatio(
                     SensibleHeatRatioRequest(room, KnownStateRole::ENTERING, 25.0, 0.01)),
                 InvalidInputError);
}

// ============================================================================
// Saturation Helper Tests
// ============================================================================

TEST_F(DerivationRulesTest, SaturatedAtEnthalpy) {
    AirState s = rules.saturatedAtEnthalpy(44000.0, p_std);
    EXPECT_NEAR(s.dryBulb(), 15.7016, 2e-3);
    EXPECT_NEAR(s.relativeHumidity(), 1.0, 1e-9);
    EXPECT_NEAR(s.enthalpy(), 44000.0, 5.0);
}

TEST_F(DerivationRulesTest, SaturatedAt) {
    AirState s = rules.saturatedAt(20.0, p_std);
    EXPECT_NEAR(s.wetBulb(), 20.0, 1e-4);
    EXPECT_NEAR(s.dewPoint(), 20.0, 1e-4);
    EXPECT_NEAR(s.relativeHumidity(), 1.0, 1e-9);
}

TEST_F(DerivationRulesTest, HeatingForHumidificationKeepsMoisture) {
    AirState winter = AirState::fromDryBulbWetBulb(7.3, 3.6, p_std);
    AirState heated = rules.heatingForHumidification(36.0, winter);
    EXPECT_DOUBLE_EQ(heated.dryBulb(), 36.0);
    EXPECT_NEAR(heated.humidityRatio(), 0.0033901, 2e-6);
    EXPECT_NEAR(heated.wetBulb(), 16.2107, 2e-3);
}

// ============================================================================
// AHU Off-Coil Setpoint Tests
// ============================================================================

TEST_F(DerivationRulesTest, OffCoilSetpoints) {
    AirState crah_off = AirState::fromDryBulbWetBulb(25.0, 16.5, p_std);
    AirState winter = AirState::fromDryBulbWetBulb(7.3, 3.6, p_std);

    OffCoilSetpoints sp = rules.deriveOffCoilSetpoints(OffCoilSetpointRequest(crah_off, 36.0, winter));

    EXPECT_NEAR(sp.crah_dew_point, 11.0951, 2e-3);
    EXPECT_NEAR(sp.max_cooling.dryBulb(), sp.crah_dew_point + 2.0, 1e-12);
    EXPECT_NEAR(sp.dehumidification.dryBulb(), sp.crah_dew_point + 4.0, 1e-12);
    EXPECT_NEAR(sp.max_cooling.relativeHumidity(), 1.0, 1e-9);
    EXPECT_NEAR(sp.dehumidification.relativeHumidity(), 1.0, 1e-9);
    EXPECT_NEAR(sp.enthalpy_cooling.dryBulb(), 15.7016, 2e-3);
    EXPECT_DOUBLE_EQ(sp.humidification_heating.dryBulb(), 36.0);
    EXPECT_NEAR(sp.humidification_heating.humidityRatio(), winter.humidityRatio(), 1e-15);
}

TEST_F(DerivationRulesTest, OffCoilSetpointMargins) {
    AirState crah_off = AirState::fromDryBulbWetBulb(25.0, 16.5, p_std);
    AirState winter = AirState::fromDryBulbWetBulb(7.3, 3.6, p_std);

    OffCoilSetpointRequest request(crah_off, 30.0, winter);
    request.cool_margin = 1.0;
    request.dehumidification_margin = 3.0;
    request.target_enthalpy = 40000.0;
    OffCoilSetpoints sp = rules.deriveOffCoilSetpoints(request);

    EXPECT_NEAR(sp.max_cooling.dryBulb() - sp.crah_dew_point, 1.0, 1e-12);
    EXPECT_NEAR(sp.dehumidification.dryBulb() - sp.crah_dew_point, 3.0, 1e-12);
    EXPECT_NEAR(sp.enthalpy_cooling.enthalpy(), 40000.0, 5.0);
    EXPECT_DOUBLE_EQ(sp.humidification_heating.dryBulb(), 30.0);
}

// ============================================================================
// System Flow Tests
// ============================================================================

TEST_F(DerivationRulesTest, SystemFlows) {
    AirState on = AirState::fromDryBulbWetBulb(36.0, 19.8, p_std);
    AirState off = AirState::fromDryBulbWetBulb(25.0, 16.5, p_std);
    AirState ahu_off = rules.saturatedAt(15.0951, p_std);

    SystemFlows flows = rules.computeSystemFlows(SystemFlowRequest(1.5e6, on, off, ahu_off));

    EXPECT_NEAR(flows.sensible_load, 1.5e6 * 1.055, 1e-6);
    EXPECT_NEAR(flows.crah_mass_flow * on.specificHeat() * 11.0, flows.sensible_load, 1e-6);
    EXPECT_NEAR(flows.crah_volume_flow,
                flows.crah_mass_flow * 0.5 * (on.specificVolume() + off.specificVolume()), 1e-9);
    EXPECT_NEAR(flows.ahu_volume_flow, 0.011 * flows.crah_volume_flow, 1e-12);
    EXPECT_NEAR(flows.ahu_mass_flow, flows.ahu_volume_flow / ahu_off.specificVolume(), 1e-12);
    EXPECT_NEAR(flows.fan_power, 600.0 * flows.ahu_volume_flow, 1e-9);
    EXPECT_NEAR(flows.fan_temperature_rise,
                flows.fan_power / (flows.ahu_mass_flow * ahu_off.specificHeat()), 1e-12);

    // The CRAH loop evaluated at this flow carries the sensible load
    ProcessResult loop = evaluator.evaluate("Loop", on, off, flows.crah_mass_flow);
    EXPECT_NEAR(-loop.sensible_heat, flows.sensible_load, 1e-3);
}

TEST_F(DerivationRulesTest, SystemFlowsVolumeOverride) {
    AirState on = AirState::fromDryBulbWetBulb(36.0, 19.8, p_std);
    AirState off = AirState::fromDryBulbWetBulb(25.0, 16.5, p_std);

    SystemFlowRequest request(1.0e6, on, off, off);
    request.ahu_volume_flow = 2.5;
    request.ahu_pressure_drop = 0.0;
    SystemFlows flows = rules.computeSystemFlows(request);

    EXPECT_DOUBLE_EQ(flows.ahu_volume_flow, 2.5);
    EXPECT_DOUBLE_EQ(flows.fan_power, 0.0);
    EXPECT_DOUBLE_EQ(flows.fan_temperature_rise, 0.0);
}

TEST_F(DerivationRulesTest, SystemFlowsInvalidInputsThrow) {
    AirState on = AirState::fromDryBulbWetBulb(36.0, 19.8, p_std);
    AirState off = AirState::fromDryBulbWetBulb(25.0, 16.5, p_std);

    EXPECT_THROW(rules.computeSystemFlows(SystemFlowRequest(1e6, off, on, off)), InvalidInputError);
    EXPECT_THROW(rules.computeSystemFlows(SystemFlowRequest(-1.0, on, off, off)), InvalidInputError);

    SystemFlowRequest request(1e6, on, off, off);
    request.ahu_volume_flow = 0.0;
    EXPECT_THROW(rules.computeSystemFlows(request), InvalidInputError);
}
