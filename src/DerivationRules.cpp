/**
 * @file DerivationRules.cpp
 * @brief Off-coil, SHR, saturation and system-flow derivations
 */

#include "DerivationRules.hpp"
#include "PsychroError.hpp"
#include "RootFinding.hpp"
#include <cmath>
#include <sstream>

namespace MASE {

namespace {

// Humidity-ratio resolution of the SHR back-solve (kg/kg)
constexpr double HUM_RATIO_SOLVE_TOLERANCE = 1e-10;

void requireFinite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw InvalidInputError(std::string(name) + " must be finite");
    }
}

void requireSamePressure(const AirState& a, const AirState& b, const char* what) {
    if (std::abs(a.pressure() - b.pressure()) > 1e-6 * a.pressure()) {
        throw InvalidInputError(std::string(what) + ": states at different pressures");
    }
}

} // namespace

DerivationRules::DerivationRules() : converter_() {}

DerivationRules::DerivationRules(const PropertyConverter& converter) : converter_(converter) {}

// =============================================================================
// Off-coil from coil dew point
// =============================================================================

AirState DerivationRules::offCoil(const OffCoilRequest& request) const {
    requireFinite(request.coil_dew_point, "Coil dew point");
    if (!request.relative_humidity && !request.approach) {
        throw InvalidInputError("Off-coil rule needs a target relative humidity or an approach");
    }

    // Coil leaves air at the saturation humidity ratio of its dew point
    const PropertySet coil = converter_.resolve(
        StateInput::dryBulbRelativeHumidity(request.coil_dew_point, 1.0), request.pressure);
    const double w = coil.humidity_ratio;

    std::optional<double> t_from_rh;
    if (request.relative_humidity) {
        const double rh = *request.relative_humidity;
        if (!std::isfinite(rh) || rh <= 0.0 || rh > 1.0) {
            throw InvalidInputError("Off-coil relative humidity must be within (0, 1]");
        }
        if (rh == 1.0) {
            t_from_rh = request.coil_dew_point;
        } else {
            // Pws(Tdb) = Pw / RH inverts through the dew-point solve
            const double p_w = Psychrometrics::vaporPressureFromHumidityRatio(w, request.pressure);
            t_from_rh = Psychrometrics::dewPointFromVaporPressure(p_w / rh, converter_.settings());
        }
    }

    std::optional<double> t_from_approach;
    if (request.approach) {
        const double approach = *request.approach;
        if (!std::isfinite(approach) || approach < 0.0) {
            throw InvalidInputError("Off-coil approach must be finite and non-negative");
        }
        t_from_approach = request.coil_dew_point + approach;
    }

    if (t_from_rh && t_from_approach &&
        std::abs(*t_from_rh - *t_from_approach) > ConsistencyTolerance::TEMPERATURE) {
        std::ostringstream msg;
        msg << "Off-coil relative humidity implies Tdb=" << *t_from_rh
            << " degC but approach implies Tdb=" << *t_from_approach << " degC";
        throw InvalidInputError(msg.str());
    }

    const double tdb = t_from_rh ? *t_from_rh : *t_from_approach;
    return AirState::create(StateInput::dryBulbHumidityRatio(tdb, w), request.pressure, converter_);
}

// =============================================================================
// Sensible heat ratio back-solve
// =============================================================================

AirState DerivationRules::backSolveSensibleHeatRatio(const SensibleHeatRatioRequest& request) const {
    const double shr = request.sensible_heat_ratio;
    if (!std::isfinite(shr) || shr <= 0.0 || shr > 1.0) {
        throw InvalidInputError("Target sensible heat ratio must be within (0, 1]");
    }
    requireFinite(request.unknown_dry_bulb, "Unknown dry-bulb");

    const AirState& known = request.known_state;
    const double t_unknown = request.unknown_dry_bulb;
    const double pressure = known.pressure();
    if (std::abs(t_unknown - known.dryBulb()) <= ConsistencyTolerance::TEMPERATURE) {
        throw InvalidInputError("Sensible heat ratio back-solve needs a dry-bulb change");
    }

    // Upper bound of the unknown W; also validates the unknown dry-bulb
    const double w_max = converter_.resolve(
        StateInput::dryBulbRelativeHumidity(t_unknown, 1.0), pressure).humidity_ratio;

    const bool known_enters = (request.role == KnownStateRole::ENTERING);
    auto residual = [&](double w) {
        const double h_unknown = Psychrometrics::moistAirEnthalpy(t_unknown, w);
        double t_in, w_in, h_in, t_out, h_out;
        if (known_enters) {
            t_in = known.dryBulb(); w_in = known.humidityRatio(); h_in = known.enthalpy();
            t_out = t_unknown; h_out = h_unknown;
        } else {
            t_in = t_unknown; w_in = w; h_in = h_unknown;
            t_out = known.dryBulb(); h_out = known.enthalpy();
        }
        const double q_sensible = Psychrometrics::moistAirSpecificHeat(w_in) * (t_out - t_in);
        const double q_total = h_out - h_in;
        return q_sensible - shr * q_total;
    };

    const double g_lo = residual(0.0);
    const double g_hi = residual(w_max);
    if (g_lo * g_hi > 0.0) {
        std::ostringstream msg;
        msg << "Sensible heat ratio " << shr << " unattainable at Tdb=" << t_unknown
            << " degC between dry air and saturation";
        throw InvalidInputError(msg.str());
    }

    const double w = RootFinding::bisect(residual, 0.0, w_max, HUM_RATIO_SOLVE_TOLERANCE,
                                         converter_.settings().max_iterations,
                                         "sensible heat ratio back-solve");
    return AirState::create(StateInput::dryBulbHumidityRatio(t_unknown, w), pressure, converter_);
}

// =============================================================================
// Saturation helpers
// =============================================================================

AirState DerivationRules::saturatedAt(double t_dry_bulb, double pressure) const {
    return AirState::create(StateInput::dryBulbRelativeHumidity(t_dry_bulb, 1.0), pressure,
                            converter_);
}

AirState DerivationRules::saturatedAtEnthalpy(double enthalpy, double pressure) const {
    requireFinite(enthalpy, "Target enthalpy");
    if (!std::isfinite(pressure) || pressure <= 0.0) {
        throw InvalidInputError("Pressure must be finite and positive");
    }

    // Stay below the boiling point where Wsat diverges
    double t_hi = PsychroConstants::MAX_TEMPERATURE;
    if (pressure < Psychrometrics::saturationVaporPressure(t_hi)) {
        t_hi = Psychrometrics::dewPointFromVaporPressure(pressure, converter_.settings()) - 1e-3;
    }

    auto residual = [&](double t) {
        return Psychrometrics::moistAirEnthalpy(
                   t, Psychrometrics::saturationHumidityRatio(t, pressure)) - enthalpy;
    };

    const double t = RootFinding::bisect(residual, PsychroConstants::MIN_TEMPERATURE, t_hi,
                                         converter_.settings().tolerance,
                                         converter_.settings().max_iterations,
                                         "saturated state at enthalpy");
    return saturatedAt(t, pressure);
}

AirState DerivationRules::heatingForHumidification(double target_dry_bulb,
                                                   const AirState& source) const {
    requireFinite(target_dry_bulb, "Heating target dry-bulb");
    return AirState::create(StateInput::dryBulbHumidityRatio(target_dry_bulb,
                                                             source.humidityRatio()),
                            source.pressure(), converter_);
}

// =============================================================================
// AHU off-coil setpoints
// =============================================================================

OffCoilSetpoints DerivationRules::deriveOffCoilSetpoints(const OffCoilSetpointRequest& request) const {
    requireFinite(request.cool_margin, "Cooling margin");
    requireFinite(request.dehumidification_margin, "Dehumidification margin");
    requireSamePressure(request.crah_off_coil, request.winter_outdoor, "Off-coil setpoints");

    const double pressure = request.crah_off_coil.pressure();
    const double t_dew = request.crah_off_coil.dewPoint();
    requireFinite(t_dew, "CRAH off-coil dew point");

    return OffCoilSetpoints{
        t_dew,
        saturatedAt(t_dew + request.cool_margin, pressure),
        saturatedAt(t_dew + request.dehumidification_margin, pressure),
        saturatedAtEnthalpy(request.target_enthalpy, pressure),
        heatingForHumidification(request.crah_on_coil_dry_bulb, request.winter_outdoor)
    };
}

// =============================================================================
// System flows
// =============================================================================

SystemFlows DerivationRules::computeSystemFlows(const SystemFlowRequest& request) const {
    if (!std::isfinite(request.it_load) || request.it_load < 0.0) {
        throw InvalidInputError("IT load must be finite and non-negative");
    }
    if (!std::isfinite(request.auxiliary_load_factor) || request.auxiliary_load_factor <= 0.0) {
        throw InvalidInputError("Auxiliary load factor must be positive");
    }
    if (!std::isfinite(request.ahu_flow_fraction) || request.ahu_flow_fraction < 0.0) {
        throw InvalidInputError("AHU flow fraction must be non-negative");
    }
    if (!std::isfinite(request.ahu_pressure_drop) || request.ahu_pressure_drop < 0.0) {
        throw InvalidInputError("AHU pressure drop must be non-negative");
    }
    if (request.ahu_volume_flow &&
        (!std::isfinite(*request.ahu_volume_flow) || *request.ahu_volume_flow <= 0.0)) {
        throw InvalidInputError("AHU volume flow override must be positive");
    }
    requireSamePressure(request.crah_on_coil, request.crah_off_coil, "System flows");

    const AirState& on = request.crah_on_coil;
    const AirState& off = request.crah_off_coil;
    const double delta_t = on.dryBulb() - off.dryBulb();
    if (delta_t <= 0.0) {
        throw InvalidInputError("CRAH on-coil dry-bulb must exceed off-coil dry-bulb");
    }

    SystemFlows flows;
    flows.sensible_load = request.it_load * request.auxiliary_load_factor;

    // Same sensible-heat basis as ProcessEvaluator: cp of the entering air
    flows.crah_mass_flow = flows.sensible_load / (on.specificHeat() * delta_t);
    flows.crah_volume_flow = flows.crah_mass_flow
                           * 0.5 * (on.specificVolume() + off.specificVolume());

    flows.ahu_volume_flow = request.ahu_volume_flow
                          ? *request.ahu_volume_flow
                          : request.ahu_flow_fraction * flows.crah_volume_flow;
    flows.ahu_mass_flow = flows.ahu_volume_flow / request.ahu_off_coil.specificVolume();

    flows.fan_power = flows.ahu_volume_flow * request.ahu_pressure_drop;
    flows.fan_temperature_rise = (flows.ahu_mass_flow > 0.0)
        ? flows.fan_power / (flows.ahu_mass_flow * request.ahu_off_coil.specificHeat())
        : 0.0;
    return flows;
}

} // namespace MASE
