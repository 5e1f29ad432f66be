/**
 * @file DerivationRules.hpp
 * @brief Named rules that derive design states from partial specifications
 *
 * Each rule states which inputs are independent and which are derived.
 * Over-determined inputs must agree within ConsistencyTolerance, otherwise
 * the rule throws InvalidInputError; conflicting values are never averaged.
 */

#ifndef DERIVATION_RULES_HPP
#define DERIVATION_RULES_HPP

#include "AirState.hpp"
#include <optional>
#include <string>

namespace MASE {

// =============================================================================
// Off-coil state from coil dew point
// =============================================================================

/**
 * @brief Coil leaving state from the coil dew point
 *
 * Independent: coil_dew_point and at least one of relative_humidity or
 * approach (off-coil dry-bulb minus dew point). Derived: W = Wsat(Tdp)
 * and the off-coil dry-bulb.
 */
struct OffCoilRequest {
    double coil_dew_point = 0.0;                // degC
    std::optional<double> relative_humidity;    // (0, 1]
    std::optional<double> approach;             // K, >= 0
    double pressure = 101325.0;                 // Pa
};

// =============================================================================
// Sensible heat ratio back-solve
// =============================================================================

enum class KnownStateRole {
    ENTERING,
    LEAVING
};

/**
 * @brief Unknown state's humidity ratio from a target sensible heat ratio
 *
 * Independent: the known state and its role, the unknown state's dry-bulb,
 * and the target SHR in (0, 1]. Derived: the unknown state's W.
 */
struct SensibleHeatRatioRequest {
    SensibleHeatRatioRequest(const AirState& known, KnownStateRole known_role,
                             double t_unknown, double shr)
        : known_state(known), role(known_role), unknown_dry_bulb(t_unknown),
          sensible_heat_ratio(shr) {}

    AirState known_state;
    KnownStateRole role = KnownStateRole::ENTERING;
    double unknown_dry_bulb = 0.0;              // degC
    double sensible_heat_ratio = 1.0;
};

// =============================================================================
// AHU off-coil setpoints
// =============================================================================

/**
 * @brief Control setpoints from which the AHU off-coil states are derived
 */
struct OffCoilSetpointRequest {
    OffCoilSetpointRequest(const AirState& crah_off, double crah_on_dry_bulb,
                           const AirState& winter)
        : crah_off_coil(crah_off), crah_on_coil_dry_bulb(crah_on_dry_bulb),
          winter_outdoor(winter) {}

    AirState crah_off_coil;                     // defines the CRAH dew point
    double crah_on_coil_dry_bulb = 36.0;        // degC, heating target
    AirState winter_outdoor;                    // supplies the winter W
    double cool_margin = 2.0;                   // K above CRAH dew point
    double dehumidification_margin = 4.0;       // K above CRAH dew point
    double target_enthalpy = 44000.0;           // J/kg
};

struct OffCoilSetpoints {
    double crah_dew_point;                      // degC
    AirState max_cooling;                       // saturated at Tdp + cool margin
    AirState dehumidification;                  // saturated at Tdp + dehum margin
    AirState enthalpy_cooling;                  // saturated at target enthalpy
    AirState humidification_heating;            // CRAH on-coil Tdb at winter W
};

// =============================================================================
// System flows
// =============================================================================

/**
 * @brief Inputs for CRAH / AHU airflow sizing
 */
struct SystemFlowRequest {
    SystemFlowRequest(double it_load_w, const AirState& crah_on, const AirState& crah_off,
                      const AirState& ahu_off)
        : it_load(it_load_w), crah_on_coil(crah_on), crah_off_coil(crah_off),
          ahu_off_coil(ahu_off) {}

    double it_load = 0.0;                           // W
    double auxiliary_load_factor = 1.055;           // lighting, UPS losses, people
    AirState crah_on_coil;
    AirState crah_off_coil;
    AirState ahu_off_coil;
    std::optional<double> ahu_volume_flow;          // m³/s override
    double ahu_flow_fraction = 0.011;               // of CRAH volume flow
    double ahu_pressure_drop = 600.0;               // Pa
};

struct SystemFlows {
    double sensible_load = 0.0;                     // W
    double crah_mass_flow = 0.0;                    // kg/s dry air
    double crah_volume_flow = 0.0;                  // m³/s
    double ahu_volume_flow = 0.0;                   // m³/s
    double ahu_mass_flow = 0.0;                     // kg/s dry air
    double fan_power = 0.0;                         // W
    double fan_temperature_rise = 0.0;              // K
};

// =============================================================================
// Rules
// =============================================================================

class DerivationRules {
public:
    DerivationRules();
    explicit DerivationRules(const PropertyConverter& converter);

    AirState offCoil(const OffCoilRequest& request) const;

    AirState backSolveSensibleHeatRatio(const SensibleHeatRatioRequest& request) const;

    // Saturated state whose enthalpy equals the target (J/kg)
    AirState saturatedAtEnthalpy(double enthalpy, double pressure) const;

    // Saturated state at a given dry-bulb
    AirState saturatedAt(double t_dry_bulb, double pressure) const;

    // State at the target dry-bulb carrying the moisture of the source state
    AirState heatingForHumidification(double target_dry_bulb, const AirState& source) const;

    OffCoilSetpoints deriveOffCoilSetpoints(const OffCoilSetpointRequest& request) const;

    SystemFlows computeSystemFlows(const SystemFlowRequest& request) const;

    const PropertyConverter& converter() const { return converter_; }

private:
    PropertyConverter converter_;
};

} // namespace MASE

#endif // DERIVATION_RULES_HPP
