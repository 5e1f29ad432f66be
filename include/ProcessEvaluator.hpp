#ifndef PROCESS_EVALUATOR_HPP
#define PROCESS_EVALUATOR_HPP

#include "AirState.hpp"
#include <optional>
#include <string>

namespace MASE {

/**
 * @brief Heat and moisture exchanged between an entering and a leaving state
 *
 * Signs: positive values are added to the air stream. All heats in W,
 * moisture in kg/s, mass flow in kg/s of dry air.
 */
struct ProcessResult {
    std::string name;
    double mass_flow = 0.0;
    double sensible_heat = 0.0;
    double latent_heat = 0.0;
    double total_heat = 0.0;
    double moisture_rate = 0.0;
    std::optional<double> sensible_heat_ratio;  // absent when |total| < SHR_MIN_TOTAL_HEAT
    std::optional<AirState> entering_state;
    std::optional<AirState> leaving_state;
};

/**
 * @brief Evaluates process loads between air states
 */
class ProcessEvaluator {
public:
    // Below this |total heat| (W) the sensible heat ratio is undefined
    static constexpr double SHR_MIN_TOTAL_HEAT = 1e-3;

    ProcessEvaluator();
    explicit ProcessEvaluator(const PropertyConverter& converter);

    /**
     * @brief Loads for a known entering and leaving state
     *
     * sensible = m * cp(W_in) * (T_out - T_in), total = m * (h_out - h_in),
     * latent = total - sensible, moisture = m * (W_out - W_in).
     * @throws InvalidInputError for a negative or non-finite mass flow, or
     *         states at different pressures
     */
    ProcessResult evaluate(const std::string& name, const AirState& entering,
                           const AirState& leaving, double mass_flow) const;

    // Constant-W heating or cooling to a target dry-bulb
    ProcessResult sensibleHeating(const std::string& name, const AirState& entering,
                                  double target_dry_bulb, double mass_flow) const;

    // Process to a target state resolved at the entering pressure
    ProcessResult toState(const std::string& name, const AirState& entering,
                          const StateInput& target, double mass_flow) const;

    /**
     * @brief Adiabatic mixing of two streams at the same pressure
     *
     * W and h are mass-weighted; the mixed dry-bulb follows from h and W.
     * @throws InvalidInputError if the mixture falls in the fog region
     */
    AirState mix(const AirState& a, double mass_flow_a,
                 const AirState& b, double mass_flow_b) const;

    // Dry-air mass flow (kg/s) carried by a volumetric flow (m³/s) of this air
    static double massFlowFromVolumeFlow(double volume_flow, const AirState& state);
    static double volumeFlowFromMassFlow(double mass_flow, const AirState& state);

    const PropertyConverter& converter() const { return converter_; }

private:
    static void checkMassFlow(double mass_flow);

    PropertyConverter converter_;
};

} // namespace MASE

#endif // PROCESS_EVALUATOR_HPP
