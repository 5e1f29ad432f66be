/**
 * @file AtmosphericModel.hpp
 * @brief Standard-atmosphere pressure model for psychrometric states
 *
 * The engine only needs the barometric pressure at a site. It is taken
 * either from the standard atmosphere (troposphere layer of the ISA /
 * US Standard Atmosphere 1976) at a given altitude, or from an explicit
 * pressure override supplied by the caller.
 */

#ifndef ATMOSPHERIC_MODEL_HPP
#define ATMOSPHERIC_MODEL_HPP

#include <string>

namespace MASE {

// =============================================================================
// Physical Constants for Atmospheric Modeling
// =============================================================================
namespace AtmosphereConstants {
    // Earth parameters
    constexpr double G0 = 9.80665;                    // m/s² standard gravity

    // Standard atmosphere reference values (sea level)
    constexpr double P0_STD = 101325.0;              // Pa
    constexpr double T0_STD = 288.15;                // K (15°C)
    constexpr double LAPSE_RATE_STD = -0.0065;       // K/m (troposphere)

    // Specific gas constant of dry air (J/(kg·K))
    constexpr double R_AIR_DRY = 287.05287;

    // Validity of the single-layer model (geopotential altitude, m)
    constexpr double MIN_ALTITUDE = -500.0;
    constexpr double TROPOPAUSE_HEIGHT = 11000.0;
}

// =============================================================================
// Atmospheric Context
// =============================================================================

/**
 * @brief Where a state lives: an altitude or an explicit barometric pressure
 *
 * Owned by the caller. Only the resolved pressure is ever stored in an
 * AirState; the altitude is kept for reporting.
 */
class AtmosphericContext {
public:
    // Sea-level standard atmosphere
    AtmosphericContext();

    /**
     * @brief Context at a site altitude, pressure from the standard atmosphere
     * @throws InvalidInputError if the altitude is non-finite or outside
     *         [MIN_ALTITUDE, TROPOPAUSE_HEIGHT]
     */
    static AtmosphericContext fromAltitude(double altitude_m);

    /**
     * @brief Context with an explicit barometric pressure override
     *
     * The equivalent pressure altitude is computed for reporting.
     * @throws InvalidInputError if the pressure is non-finite or <= 0
     */
    static AtmosphericContext fromPressure(double pressure_pa);

    double pressure() const { return pressure_; }
    double altitude() const { return altitude_; }
    bool hasPressureOverride() const { return pressure_override_; }

    std::string describe() const;

private:
    AtmosphericContext(double altitude, double pressure, bool pressure_override);

    double altitude_;           // m
    double pressure_;           // Pa
    bool pressure_override_;
};

// =============================================================================
// Utility Functions
// =============================================================================

namespace AtmosphereUtils {
    // Pressure/altitude conversions
    double barometricFormula(double altitude, double T0, double P0, double lapse_rate);

    // Standard-atmosphere pressure at a site altitude (Pa)
    double standardPressure(double altitude);

    // Altitude at which the standard atmosphere has the given pressure (m)
    double pressureAltitude(double pressure);
}

} // namespace MASE

#endif // ATMOSPHERIC_MODEL_HPP
