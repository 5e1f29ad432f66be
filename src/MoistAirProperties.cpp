/**
 * @file MoistAirProperties.cpp
 * @brief ASHRAE moist-air correlations and property resolution
 */

#include "MoistAirProperties.hpp"
#include "AtmosphericModel.hpp"
#include "PsychroError.hpp"
#include "RootFinding.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace MASE {

// =============================================================================
// Correlations
// =============================================================================

namespace Psychrometrics {

double saturationVaporPressure(double t_dry_bulb) {
    const double T = t_dry_bulb + PsychroConstants::ZERO_CELSIUS;
    double ln_pws;

    if (t_dry_bulb <= PsychroConstants::TRIPLE_POINT) {
        // Over ice, -100 to 0.01 degC
        ln_pws = -5.6745359E+03 / T + 6.3925247 - 9.677843E-03 * T
               + 6.2215701E-07 * T * T + 2.0747825E-09 * std::pow(T, 3)
               - 9.484024E-13 * std::pow(T, 4) + 4.1635019 * std::log(T);
    } else {
        // Over liquid water, 0.01 to 200 degC
        ln_pws = -5.8002206E+03 / T + 1.3914993 - 4.8640239E-02 * T
               + 4.1764768E-05 * T * T - 1.4452093E-08 * std::pow(T, 3)
               + 6.5459673 * std::log(T);
    }
    return std::exp(ln_pws);
}

double saturationVaporPressureLogSlope(double t_dry_bulb) {
    const double T = t_dry_bulb + PsychroConstants::ZERO_CELSIUS;

    if (t_dry_bulb <= PsychroConstants::TRIPLE_POINT) {
        return 5.6745359E+03 / (T * T) - 9.677843E-03 + 2.0 * 6.2215701E-07 * T
             + 3.0 * 2.0747825E-09 * T * T - 4.0 * 9.484024E-13 * std::pow(T, 3)
             + 4.1635019 / T;
    }
    return 5.8002206E+03 / (T * T) - 4.8640239E-02 + 2.0 * 4.1764768E-05 * T
         - 3.0 * 1.4452093E-08 * T * T + 6.5459673 / T;
}

double humidityRatioFromVaporPressure(double vapor_pressure, double pressure) {
    return PsychroConstants::EPSILON * vapor_pressure / (pressure - vapor_pressure);
}

double vaporPressureFromHumidityRatio(double humidity_ratio, double pressure) {
    return pressure * humidity_ratio / (PsychroConstants::EPSILON + humidity_ratio);
}

double saturationHumidityRatio(double t_dry_bulb, double pressure) {
    return humidityRatioFromVaporPressure(saturationVaporPressure(t_dry_bulb), pressure);
}

double moistAirEnthalpy(double t_dry_bulb, double humidity_ratio) {
    return PsychroConstants::CP_DRY_AIR * t_dry_bulb
         + humidity_ratio * (PsychroConstants::LATENT_HEAT_0C
                             + PsychroConstants::CP_WATER_VAPOR * t_dry_bulb);
}

double humidityRatioFromEnthalpy(double t_dry_bulb, double enthalpy) {
    return (enthalpy - PsychroConstants::CP_DRY_AIR * t_dry_bulb)
         / (PsychroConstants::LATENT_HEAT_0C + PsychroConstants::CP_WATER_VAPOR * t_dry_bulb);
}

double dryBulbFromEnthalpy(double enthalpy, double humidity_ratio) {
    return (enthalpy - PsychroConstants::LATENT_HEAT_0C * humidity_ratio)
         / (PsychroConstants::CP_DRY_AIR + PsychroConstants::CP_WATER_VAPOR * humidity_ratio);
}

double moistAirVolume(double t_dry_bulb, double humidity_ratio, double pressure) {
    return PsychroConstants::R_DA * (t_dry_bulb + PsychroConstants::ZERO_CELSIUS)
         * (1.0 + PsychroConstants::VOLUME_FACTOR * humidity_ratio) / pressure;
}

double moistAirDensity(double t_dry_bulb, double humidity_ratio, double pressure) {
    return (1.0 + humidity_ratio) / moistAirVolume(t_dry_bulb, humidity_ratio, pressure);
}

double moistAirSpecificHeat(double humidity_ratio) {
    return PsychroConstants::CP_DRY_AIR + PsychroConstants::CP_WATER_VAPOR * humidity_ratio;
}

double humidityRatioFromWetBulb(double t_dry_bulb, double t_wet_bulb, double pressure) {
    const double ws_star = saturationHumidityRatio(t_wet_bulb, pressure);

    // ASHRAE 2017 ch. 1 eq. 33 (wet bulb above freezing) and eq. 35 (below)
    if (t_wet_bulb >= 0.0) {
        return ((2501.0 - 2.326 * t_wet_bulb) * ws_star - 1.006 * (t_dry_bulb - t_wet_bulb))
             / (2501.0 + 1.86 * t_dry_bulb - 4.186 * t_wet_bulb);
    }
    return ((2830.0 - 0.24 * t_wet_bulb) * ws_star - 1.006 * (t_dry_bulb - t_wet_bulb))
         / (2830.0 + 1.86 * t_dry_bulb - 2.1 * t_wet_bulb);
}

double wetBulbFromHumidityRatio(double t_dry_bulb, double humidity_ratio, double pressure,
                                const NumericSettings& settings) {
    // Without a dew point in range (dry air) the bracket opens at the range floor
    const double p_w = vaporPressureFromHumidityRatio(humidity_ratio, pressure);
    double t_lo = PsychroConstants::MIN_TEMPERATURE;
    if (p_w >= saturationVaporPressure(t_lo)) {
        t_lo = std::min(dewPointFromVaporPressure(p_w, settings), t_dry_bulb);
    }

    auto residual = [&](double t_wet_bulb) {
        return humidityRatioFromWetBulb(t_dry_bulb, t_wet_bulb, pressure) - humidity_ratio;
    };

    // The wet bulb lies between the dew point and the dry bulb
    if (residual(t_dry_bulb) <= 0.0) return t_dry_bulb;
    if (residual(t_lo) >= 0.0) return t_lo;

    double t_wet_bulb = RootFinding::bisect(residual, t_lo, t_dry_bulb,
                                            settings.tolerance, settings.max_iterations,
                                            "wet-bulb temperature");
    // Settle on the side of the root that maps back to at least W, so dry air
    // never re-derives to a negative humidity ratio
    if (residual(t_wet_bulb) < 0.0) {
        t_wet_bulb = std::min(t_dry_bulb, t_wet_bulb + settings.tolerance);
    }
    return t_wet_bulb;
}

double dewPointFromVaporPressure(double vapor_pressure, const NumericSettings& settings) {
    const double t_lo = PsychroConstants::MIN_TEMPERATURE;
    const double t_hi = PsychroConstants::MAX_TEMPERATURE;

    if (!std::isfinite(vapor_pressure) ||
        vapor_pressure < saturationVaporPressure(t_lo) ||
        vapor_pressure > saturationVaporPressure(t_hi)) {
        std::ostringstream msg;
        msg << "Vapor pressure " << vapor_pressure
            << " Pa has no dew point in [" << t_lo << ", " << t_hi << "] degC";
        throw InvalidInputError(msg.str());
    }

    const double ln_pw = std::log(vapor_pressure);
    auto residual = [&](double t) { return std::log(saturationVaporPressure(t)) - ln_pw; };
    auto slope = [](double t) { return saturationVaporPressureLogSlope(t); };

    // Magnus approximation as the starting guess
    const double gamma = std::log(vapor_pressure / 611.2);
    const double t_guess = 243.12 * gamma / (17.62 - gamma);

    return RootFinding::newtonBisect(residual, slope, t_lo, t_hi, t_guess,
                                     settings.tolerance, settings.max_iterations,
                                     "dew-point temperature");
}

} // namespace Psychrometrics

// =============================================================================
// StateInput / DescriptorSet
// =============================================================================

StateInput StateInput::dryBulbRelativeHumidity(double t_dry_bulb, double relative_humidity) {
    return StateInput{InputPair::DRY_BULB_RELATIVE_HUMIDITY, t_dry_bulb, relative_humidity};
}

StateInput StateInput::dryBulbWetBulb(double t_dry_bulb, double t_wet_bulb) {
    return StateInput{InputPair::DRY_BULB_WET_BULB, t_dry_bulb, t_wet_bulb};
}

StateInput StateInput::dryBulbDewPoint(double t_dry_bulb, double t_dew_point) {
    return StateInput{InputPair::DRY_BULB_DEW_POINT, t_dry_bulb, t_dew_point};
}

StateInput StateInput::dryBulbHumidityRatio(double t_dry_bulb, double humidity_ratio) {
    return StateInput{InputPair::DRY_BULB_HUMIDITY_RATIO, t_dry_bulb, humidity_ratio};
}

StateInput StateInput::dryBulbEnthalpy(double t_dry_bulb, double enthalpy) {
    return StateInput{InputPair::DRY_BULB_ENTHALPY, t_dry_bulb, enthalpy};
}

std::string StateInput::describe() const {
    std::ostringstream ss;
    ss << "Tdb=" << dry_bulb << " degC, ";
    switch (pair) {
        case InputPair::DRY_BULB_RELATIVE_HUMIDITY: ss << "RH=" << value; break;
        case InputPair::DRY_BULB_WET_BULB:          ss << "Twb=" << value << " degC"; break;
        case InputPair::DRY_BULB_DEW_POINT:         ss << "Tdp=" << value << " degC"; break;
        case InputPair::DRY_BULB_HUMIDITY_RATIO:    ss << "W=" << value << " kg/kg"; break;
        case InputPair::DRY_BULB_ENTHALPY:          ss << "h=" << value << " J/kg"; break;
    }
    return ss.str();
}

int DescriptorSet::count() const {
    return static_cast<int>(relative_humidity.has_value()) + static_cast<int>(wet_bulb.has_value())
         + static_cast<int>(dew_point.has_value()) + static_cast<int>(humidity_ratio.has_value())
         + static_cast<int>(enthalpy.has_value());
}

// =============================================================================
// PropertyConverter
// =============================================================================

namespace {

bool isDryAirDewPoint(const StateInput& input) {
    return input.pair == InputPair::DRY_BULB_DEW_POINT
        && input.value == PsychroConstants::DRY_AIR_DEW_POINT;
}

} // namespace

PropertyConverter::PropertyConverter() : settings_() {}

PropertyConverter::PropertyConverter(const NumericSettings& settings) : settings_(settings) {
    settings_.validate();
}

PropertySet PropertyConverter::resolve(const StateInput& input,
                                       const AtmosphericContext& context) const {
    return resolve(input, context.pressure());
}

double PropertyConverter::resolveHumidityRatio(const StateInput& input, double pressure,
                                               double p_ws_dry_bulb) const {
    using namespace Psychrometrics;
    const double tdb = input.dry_bulb;
    const double value = input.value;
    double w = 0.0;

    switch (input.pair) {
        case InputPair::DRY_BULB_RELATIVE_HUMIDITY:
            if (value < 0.0 || value > 1.0) {
                throw InvalidInputError("Relative humidity must be within [0, 1]: " + input.describe());
            }
            w = humidityRatioFromVaporPressure(value * p_ws_dry_bulb, pressure);
            break;

        case InputPair::DRY_BULB_WET_BULB:
            if (value > tdb) {
                throw InvalidInputError("Wet-bulb exceeds dry-bulb: " + input.describe());
            }
            if (value < PsychroConstants::MIN_TEMPERATURE) {
                throw InvalidInputError("Wet-bulb below correlation range: " + input.describe());
            }
            w = humidityRatioFromWetBulb(tdb, value, pressure);
            if (w < 0.0) {
                throw InvalidInputError("Wet-bulb depression implies negative humidity ratio: "
                                        + input.describe());
            }
            break;

        case InputPair::DRY_BULB_DEW_POINT:
            if (value > tdb) {
                throw InvalidInputError("Dew-point exceeds dry-bulb: " + input.describe());
            }
            if (isDryAirDewPoint(input)) {
                w = 0.0;
                break;
            }
            if (value < PsychroConstants::MIN_TEMPERATURE) {
                throw InvalidInputError("Dew-point below correlation range: " + input.describe());
            }
            w = humidityRatioFromVaporPressure(saturationVaporPressure(value), pressure);
            break;

        case InputPair::DRY_BULB_HUMIDITY_RATIO:
            if (value < 0.0) {
                throw InvalidInputError("Humidity ratio must be non-negative: " + input.describe());
            }
            w = value;
            break;

        case InputPair::DRY_BULB_ENTHALPY:
            w = humidityRatioFromEnthalpy(tdb, value);
            if (w < 0.0) {
                throw InvalidInputError("Enthalpy implies negative humidity ratio: " + input.describe());
            }
            break;
    }
    return w;
}

PropertySet PropertyConverter::resolve(const StateInput& input, double pressure) const {
    using namespace Psychrometrics;

    if (!std::isfinite(pressure) || pressure <= 0.0) {
        throw InvalidInputError("Pressure must be finite and positive");
    }
    if (!std::isfinite(input.dry_bulb) ||
        (!std::isfinite(input.value) && !isDryAirDewPoint(input))) {
        throw InvalidInputError("Non-finite state input: " + input.describe());
    }
    const double tdb = input.dry_bulb;
    if (tdb < PsychroConstants::MIN_TEMPERATURE || tdb > PsychroConstants::MAX_TEMPERATURE) {
        throw InvalidInputError("Dry-bulb outside correlation range [-100, 200] degC: "
                                + input.describe());
    }

    const double p_ws = saturationVaporPressure(tdb);
    if (p_ws >= pressure) {
        throw InvalidInputError("Saturation pressure reaches barometric pressure (boiling): "
                                + input.describe());
    }

    double w = resolveHumidityRatio(input, pressure, p_ws);
    const double w_sat = humidityRatioFromVaporPressure(p_ws, pressure);
    if (w > w_sat * (1.0 + PsychroConstants::SUPERSATURATION_TOLERANCE)) {
        std::ostringstream msg;
        msg << "Supersaturated state (W=" << w << " > Wsat=" << w_sat << "): " << input.describe();
        throw InvalidInputError(msg.str());
    }
    const bool saturated = (w >= w_sat);
    w = std::min(w, w_sat);

    PropertySet props;
    props.dry_bulb = tdb;
    props.pressure = pressure;
    props.humidity_ratio = w;
    props.saturation_vapor_pressure = p_ws;
    props.vapor_pressure = vaporPressureFromHumidityRatio(w, pressure);
    props.relative_humidity = std::min(1.0, props.vapor_pressure / p_ws);

    if (saturated) {
        props.dew_point = tdb;
        props.wet_bulb = tdb;
    } else {
        if (input.pair == InputPair::DRY_BULB_DEW_POINT) {
            props.dew_point = input.value;
        } else if (props.vapor_pressure < saturationVaporPressure(PsychroConstants::MIN_TEMPERATURE)) {
            props.dew_point = PsychroConstants::DRY_AIR_DEW_POINT;
        } else {
            props.dew_point = std::min(tdb, dewPointFromVaporPressure(props.vapor_pressure, settings_));
        }

        if (input.pair == InputPair::DRY_BULB_WET_BULB) {
            props.wet_bulb = input.value;
            props.dew_point = std::min(props.dew_point, props.wet_bulb);
        } else {
            props.wet_bulb = wetBulbFromHumidityRatio(tdb, w, pressure, settings_);
            props.wet_bulb = std::min(tdb, std::max(props.wet_bulb, props.dew_point));
        }
    }

    props.enthalpy = moistAirEnthalpy(tdb, w);
    props.specific_volume = moistAirVolume(tdb, w, pressure);
    props.density = moistAirDensity(tdb, w, pressure);
    props.specific_heat = moistAirSpecificHeat(w);
    return props;
}

PropertySet PropertyConverter::resolveDescriptors(const DescriptorSet& d, double pressure) const {
    StateInput primary;
    primary.dry_bulb = d.dry_bulb;
    if (d.relative_humidity) {
        primary.pair = InputPair::DRY_BULB_RELATIVE_HUMIDITY;
        primary.value = *d.relative_humidity;
    } else if (d.wet_bulb) {
        primary.pair = InputPair::DRY_BULB_WET_BULB;
        primary.value = *d.wet_bulb;
    } else if (d.dew_point) {
        primary.pair = InputPair::DRY_BULB_DEW_POINT;
        primary.value = *d.dew_point;
    } else if (d.humidity_ratio) {
        primary.pair = InputPair::DRY_BULB_HUMIDITY_RATIO;
        primary.value = *d.humidity_ratio;
    } else if (d.enthalpy) {
        primary.pair = InputPair::DRY_BULB_ENTHALPY;
        primary.value = *d.enthalpy;
    } else {
        throw InvalidInputError("Dry-bulb needs at least one secondary descriptor");
    }

    PropertySet props = resolve(primary, pressure);

    auto check = [](const std::optional<double>& given, double derived,
                    double tolerance, const char* name) {
        if (!given || *given == derived) return;
        if (!std::isfinite(*given) || std::abs(*given - derived) > tolerance) {
            std::ostringstream msg;
            msg << "Over-determined state: given " << name << " = " << *given
                << " disagrees with derived " << derived;
            throw InvalidInputError(msg.str());
        }
    };

    check(d.relative_humidity, props.relative_humidity,
          ConsistencyTolerance::RELATIVE_HUMIDITY, "relative humidity");
    check(d.wet_bulb, props.wet_bulb, ConsistencyTolerance::TEMPERATURE, "wet-bulb");
    check(d.dew_point, props.dew_point, ConsistencyTolerance::TEMPERATURE, "dew-point");
    check(d.humidity_ratio, props.humidity_ratio,
          ConsistencyTolerance::HUMIDITY_RATIO, "humidity ratio");
    check(d.enthalpy, props.enthalpy, ConsistencyTolerance::ENTHALPY, "enthalpy");
    return props;
}

} // namespace MASE
