/**
 * @file MoistAirProperties.hpp
 * @brief Moist-air property correlations and the property converter
 *
 * Correlations follow ASHRAE Handbook - Fundamentals (2017), chapter 1, in
 * SI units. Temperatures are in degC, pressures in Pa, humidity ratio in
 * kg water / kg dry air, enthalpy in J / kg dry air.
 *
 * The free functions in Psychrometrics evaluate single correlations and
 * assume their arguments are inside the valid domain. PropertyConverter
 * validates inputs and resolves a complete, consistent PropertySet.
 */

#ifndef MOIST_AIR_PROPERTIES_HPP
#define MOIST_AIR_PROPERTIES_HPP

#include "MASE.hpp"
#include <limits>
#include <optional>
#include <string>

namespace MASE {

class AtmosphericContext;

// =============================================================================
// Psychrometric Constants
// =============================================================================
namespace PsychroConstants {
    constexpr double ZERO_CELSIUS = 273.15;          // K
    constexpr double TRIPLE_POINT = 0.01;            // degC, ice/liquid branch switch

    // Validity of the Hyland-Wexler saturation correlation (degC)
    constexpr double MIN_TEMPERATURE = -100.0;
    constexpr double MAX_TEMPERATURE = 200.0;

    constexpr double R_DA = 287.042;                 // J/(kg·K) dry air
    constexpr double EPSILON = 0.621945;             // Mw / Mda
    constexpr double VOLUME_FACTOR = 1.607858;       // 1 / EPSILON

    constexpr double CP_DRY_AIR = 1006.0;            // J/(kg·K)
    constexpr double CP_WATER_VAPOR = 1860.0;        // J/(kg·K)
    constexpr double LATENT_HEAT_0C = 2501000.0;     // J/kg at 0 degC

    // Reported dew point when Pw is below Pws(MIN_TEMPERATURE), dry air
    // included. As a dew-point input it denotes dry air (W = 0).
    constexpr double DRY_AIR_DEW_POINT = -std::numeric_limits<double>::infinity();

    // Relative tolerance on Pw > Pws before a state counts as supersaturated
    constexpr double SUPERSATURATION_TOLERANCE = 1e-9;
}

// =============================================================================
// Correlations
// =============================================================================
namespace Psychrometrics {
    // Saturation vapor pressure over ice (t <= 0.01) or liquid water (Pa)
    double saturationVaporPressure(double t_dry_bulb);

    // d(ln Pws)/dT, used by the dew-point Newton iteration (1/K)
    double saturationVaporPressureLogSlope(double t_dry_bulb);

    double humidityRatioFromVaporPressure(double vapor_pressure, double pressure);
    double vaporPressureFromHumidityRatio(double humidity_ratio, double pressure);
    double saturationHumidityRatio(double t_dry_bulb, double pressure);

    double moistAirEnthalpy(double t_dry_bulb, double humidity_ratio);
    double humidityRatioFromEnthalpy(double t_dry_bulb, double enthalpy);
    double dryBulbFromEnthalpy(double enthalpy, double humidity_ratio);

    double moistAirVolume(double t_dry_bulb, double humidity_ratio, double pressure);
    double moistAirDensity(double t_dry_bulb, double humidity_ratio, double pressure);

    // Slope of h with respect to T at constant W, J/(kg·K)
    double moistAirSpecificHeat(double humidity_ratio);

    // Psychrometer equation, ice branch for t_wet_bulb < 0
    double humidityRatioFromWetBulb(double t_dry_bulb, double t_wet_bulb, double pressure);

    // Bisection on [t_dew_point, t_dry_bulb]; the bracket opens at
    // MIN_TEMPERATURE when the dew point lies below the correlation range
    double wetBulbFromHumidityRatio(double t_dry_bulb, double humidity_ratio, double pressure,
                                    const NumericSettings& settings);

    // Safeguarded Newton on ln Pws over the correlation range
    double dewPointFromVaporPressure(double vapor_pressure, const NumericSettings& settings);
}

// =============================================================================
// Converter inputs and outputs
// =============================================================================

/**
 * @brief One supported independent pair: dry-bulb plus one secondary value
 */
struct StateInput {
    InputPair pair = InputPair::DRY_BULB_RELATIVE_HUMIDITY;
    double dry_bulb = 0.0;          // degC
    double value = 0.0;             // fraction, degC, kg/kg or J/kg depending on pair

    static StateInput dryBulbRelativeHumidity(double t_dry_bulb, double relative_humidity);
    static StateInput dryBulbWetBulb(double t_dry_bulb, double t_wet_bulb);
    static StateInput dryBulbDewPoint(double t_dry_bulb, double t_dew_point);
    static StateInput dryBulbHumidityRatio(double t_dry_bulb, double humidity_ratio);
    static StateInput dryBulbEnthalpy(double t_dry_bulb, double enthalpy);

    std::string describe() const;
};

/**
 * @brief Dry-bulb plus any number of secondary descriptors
 *
 * The first descriptor present in the order RH, wet-bulb, dew-point, W, h
 * resolves the state; every other one must agree with it.
 */
struct DescriptorSet {
    double dry_bulb = 0.0;
    std::optional<double> relative_humidity;
    std::optional<double> wet_bulb;
    std::optional<double> dew_point;
    std::optional<double> humidity_ratio;
    std::optional<double> enthalpy;

    int count() const;
};

/**
 * @brief Complete, mutually consistent moist-air property set
 */
struct PropertySet {
    double dry_bulb = 0.0;                  // degC
    double humidity_ratio = 0.0;            // kg/kg
    double relative_humidity = 0.0;         // 0-1
    double wet_bulb = 0.0;                  // degC
    double dew_point = 0.0;                 // degC, DRY_AIR_DEW_POINT below range
    double enthalpy = 0.0;                  // J/kg dry air
    double specific_volume = 0.0;           // m³/kg dry air
    double density = 0.0;                   // kg/m³ moist air
    double specific_heat = 0.0;             // J/(kg·K)
    double pressure = 0.0;                  // Pa
    double vapor_pressure = 0.0;            // Pa
    double saturation_vapor_pressure = 0.0; // Pa
};

// =============================================================================
// Property Converter
// =============================================================================

/**
 * @brief Maps a supported input pair plus pressure to the full property set
 *
 * Stateless apart from its numeric settings; safe to share between threads.
 * Every failure throws: InvalidInputError for out-of-domain or inconsistent
 * inputs, ConvergenceError when an iterative solve runs out of iterations.
 */
class PropertyConverter {
public:
    PropertyConverter();
    explicit PropertyConverter(const NumericSettings& settings);

    PropertySet resolve(const StateInput& input, double pressure) const;
    PropertySet resolve(const StateInput& input, const AtmosphericContext& context) const;

    // Over-determined input; disagreement beyond ConsistencyTolerance throws
    PropertySet resolveDescriptors(const DescriptorSet& descriptors, double pressure) const;

    const NumericSettings& settings() const { return settings_; }

private:
    double resolveHumidityRatio(const StateInput& input, double pressure,
                                double p_ws_dry_bulb) const;

    NumericSettings settings_;
};

} // namespace MASE

#endif // MOIST_AIR_PROPERTIES_HPP
