#include "ProcessEvaluator.hpp"
#include "PsychroError.hpp"
#include <cmath>
#include <sstream>

namespace MASE {

ProcessEvaluator::ProcessEvaluator() : converter_() {}

ProcessEvaluator::ProcessEvaluator(const PropertyConverter& converter) : converter_(converter) {}

void ProcessEvaluator::checkMassFlow(double mass_flow) {
    if (!std::isfinite(mass_flow) || mass_flow < 0.0) {
        std::ostringstream msg;
        msg << "Mass flow must be finite and non-negative, got " << mass_flow;
        throw InvalidInputError(msg.str());
    }
}

ProcessResult ProcessEvaluator::evaluate(const std::string& name, const AirState& entering,
                                         const AirState& leaving, double mass_flow) const {
    checkMassFlow(mass_flow);
    if (std::abs(entering.pressure() - leaving.pressure()) > 1e-6 * entering.pressure()) {
        throw InvalidInputError("Process '" + name + "' joins states at different pressures");
    }

    ProcessResult result;
    result.name = name;
    result.mass_flow = mass_flow;

    // cp of the entering air is the exact slope of h at constant W
    result.sensible_heat = mass_flow * entering.specificHeat()
                         * (leaving.dryBulb() - entering.dryBulb());
    result.total_heat = mass_flow * (leaving.enthalpy() - entering.enthalpy());
    result.latent_heat = result.total_heat - result.sensible_heat;
    result.moisture_rate = mass_flow * (leaving.humidityRatio() - entering.humidityRatio());

    if (std::abs(result.total_heat) >= SHR_MIN_TOTAL_HEAT) {
        result.sensible_heat_ratio = result.sensible_heat / result.total_heat;
    }

    result.entering_state = entering;
    result.leaving_state = leaving;
    return result;
}

ProcessResult ProcessEvaluator::sensibleHeating(const std::string& name, const AirState& entering,
                                                double target_dry_bulb, double mass_flow) const {
    checkMassFlow(mass_flow);
    AirState leaving = AirState::create(
        StateInput::dryBulbHumidityRatio(target_dry_bulb, entering.humidityRatio()),
        entering.pressure(), converter_);
    return evaluate(name, entering, leaving, mass_flow);
}

ProcessResult ProcessEvaluator::toState(const std::string& name, const AirState& entering,
                                        const StateInput& target, double mass_flow) const {
    checkMassFlow(mass_flow);
    AirState leaving = AirState::create(target, entering.pressure(), converter_);
    return evaluate(name, entering, leaving, mass_flow);
}

AirState ProcessEvaluator::mix(const AirState& a, double mass_flow_a,
                               const AirState& b, double mass_flow_b) const {
    checkMassFlow(mass_flow_a);
    checkMassFlow(mass_flow_b);
    const double total = mass_flow_a + mass_flow_b;
    if (total <= 0.0) {
        throw InvalidInputError("Mixing needs a positive total mass flow");
    }
    if (std::abs(a.pressure() - b.pressure()) > 1e-6 * a.pressure()) {
        throw InvalidInputError("Cannot mix streams at different pressures");
    }

    const double w = (mass_flow_a * a.humidityRatio() + mass_flow_b * b.humidityRatio()) / total;
    const double h = (mass_flow_a * a.enthalpy() + mass_flow_b * b.enthalpy()) / total;
    const double tdb = Psychrometrics::dryBulbFromEnthalpy(h, w);

    const double w_sat = Psychrometrics::saturationHumidityRatio(tdb, a.pressure());
    if (w > w_sat * (1.0 + PsychroConstants::SUPERSATURATION_TOLERANCE)) {
        std::ostringstream msg;
        msg << "Mixed state lies in the fog region (Tdb=" << tdb << " degC, W=" << w
            << " > Wsat=" << w_sat << ")";
        throw InvalidInputError(msg.str());
    }
    return AirState::create(StateInput::dryBulbHumidityRatio(tdb, w), a.pressure(), converter_);
}

double ProcessEvaluator::massFlowFromVolumeFlow(double volume_flow, const AirState& state) {
    if (!std::isfinite(volume_flow) || volume_flow < 0.0) {
        throw InvalidInputError("Volume flow must be finite and non-negative");
    }
    return volume_flow / state.specificVolume();
}

double ProcessEvaluator::volumeFlowFromMassFlow(double mass_flow, const AirState& state) {
    checkMassFlow(mass_flow);
    return mass_flow * state.specificVolume();
}

} // namespace MASE
