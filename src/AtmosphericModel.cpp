/**
 * @file AtmosphericModel.cpp
 * @brief Implementation of the standard-atmosphere pressure model
 */

#include "AtmosphericModel.hpp"
#include "PsychroError.hpp"
#include <cmath>
#include <sstream>

namespace MASE {

// =============================================================================
// AtmosphereUtils Implementation
// =============================================================================

namespace AtmosphereUtils {

double barometricFormula(double altitude, double T0, double P0, double lapse_rate) {
    const double g = AtmosphereConstants::G0;
    const double R = AtmosphereConstants::R_AIR_DRY;

    if (std::abs(lapse_rate) < 1e-10) {
        // Isothermal layer
        return P0 * std::exp(-g * altitude / (R * T0));
    } else {
        // Non-isothermal layer
        double T = T0 + lapse_rate * altitude;
        return P0 * std::pow(T / T0, -g / (lapse_rate * R));
    }
}

double standardPressure(double altitude) {
    return barometricFormula(altitude, AtmosphereConstants::T0_STD,
                             AtmosphereConstants::P0_STD,
                             AtmosphereConstants::LAPSE_RATE_STD);
}

double pressureAltitude(double pressure) {
    // Closed-form inverse of the troposphere barometric formula
    const double T0 = AtmosphereConstants::T0_STD;
    const double L = AtmosphereConstants::LAPSE_RATE_STD;
    const double exponent = -L * AtmosphereConstants::R_AIR_DRY / AtmosphereConstants::G0;
    return (T0 / L) * (std::pow(pressure / AtmosphereConstants::P0_STD, exponent) - 1.0);
}

} // namespace AtmosphereUtils

// =============================================================================
// AtmosphericContext Implementation
// =============================================================================

AtmosphericContext::AtmosphericContext()
    : altitude_(0.0), pressure_(AtmosphereConstants::P0_STD), pressure_override_(false) {}

AtmosphericContext::AtmosphericContext(double altitude, double pressure, bool pressure_override)
    : altitude_(altitude), pressure_(pressure), pressure_override_(pressure_override) {}

AtmosphericContext AtmosphericContext::fromAltitude(double altitude_m) {
    if (!std::isfinite(altitude_m)) {
        throw InvalidInputError("Altitude must be finite");
    }
    if (altitude_m < AtmosphereConstants::MIN_ALTITUDE ||
        altitude_m > AtmosphereConstants::TROPOPAUSE_HEIGHT) {
        std::ostringstream msg;
        msg << "Altitude " << altitude_m << " m outside standard-atmosphere range ["
            << AtmosphereConstants::MIN_ALTITUDE << ", "
            << AtmosphereConstants::TROPOPAUSE_HEIGHT << "] m";
        throw InvalidInputError(msg.str());
    }
    return AtmosphericContext(altitude_m, AtmosphereUtils::standardPressure(altitude_m), false);
}

AtmosphericContext AtmosphericContext::fromPressure(double pressure_pa) {
    if (!std::isfinite(pressure_pa) || pressure_pa <= 0.0) {
        throw InvalidInputError("Barometric pressure must be finite and positive");
    }
    return AtmosphericContext(AtmosphereUtils::pressureAltitude(pressure_pa), pressure_pa, true);
}

std::string AtmosphericContext::describe() const {
    std::ostringstream ss;
    ss << "P = " << pressure_ << " Pa";
    if (pressure_override_) {
        ss << " (override, pressure altitude " << altitude_ << " m)";
    } else {
        ss << " (standard atmosphere at " << altitude_ << " m)";
    }
    return ss.str();
}

} // namespace MASE
