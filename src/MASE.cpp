#include "MASE.hpp"
#include "PsychroError.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace MASE {

namespace {

std::string upper(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(), ::toupper);
    return r;
}

} // namespace

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_INPUT:       return "InvalidInput";
        case ErrorKind::CONVERGENCE_FAILURE: return "ConvergenceFailure";
    }
    return "Unknown";
}

InputPair parseInputPair(const std::string& name) {
    std::string s = upper(name);
    if (s == "RH" || s == "RELATIVE_HUMIDITY" || s == "DRY_BULB_RELATIVE_HUMIDITY") {
        return InputPair::DRY_BULB_RELATIVE_HUMIDITY;
    }
    if (s == "WET_BULB" || s == "TWB" || s == "DRY_BULB_WET_BULB") {
        return InputPair::DRY_BULB_WET_BULB;
    }
    if (s == "DEW_POINT" || s == "TDP" || s == "DRY_BULB_DEW_POINT") {
        return InputPair::DRY_BULB_DEW_POINT;
    }
    if (s == "HUMIDITY_RATIO" || s == "W" || s == "DRY_BULB_HUMIDITY_RATIO") {
        return InputPair::DRY_BULB_HUMIDITY_RATIO;
    }
    if (s == "ENTHALPY" || s == "H" || s == "DRY_BULB_ENTHALPY") {
        return InputPair::DRY_BULB_ENTHALPY;
    }
    throw InvalidInputError("Unknown input pair: " + name);
}

std::string toString(InputPair pair) {
    switch (pair) {
        case InputPair::DRY_BULB_RELATIVE_HUMIDITY: return "DRY_BULB_RELATIVE_HUMIDITY";
        case InputPair::DRY_BULB_WET_BULB:          return "DRY_BULB_WET_BULB";
        case InputPair::DRY_BULB_DEW_POINT:         return "DRY_BULB_DEW_POINT";
        case InputPair::DRY_BULB_HUMIDITY_RATIO:    return "DRY_BULB_HUMIDITY_RATIO";
        case InputPair::DRY_BULB_ENTHALPY:          return "DRY_BULB_ENTHALPY";
    }
    return "UNKNOWN";
}

IsoLineKind parseIsoLineKind(const std::string& name) {
    std::string s = upper(name);
    if (s == "SATURATION") return IsoLineKind::SATURATION;
    if (s == "RH" || s == "RELATIVE_HUMIDITY") return IsoLineKind::RELATIVE_HUMIDITY;
    if (s == "ENTHALPY" || s == "H") return IsoLineKind::ENTHALPY;
    if (s == "WET_BULB" || s == "TWB") return IsoLineKind::WET_BULB;
    throw InvalidInputError("Unknown iso-line kind: " + name);
}

std::string toString(IsoLineKind kind) {
    switch (kind) {
        case IsoLineKind::SATURATION:        return "SATURATION";
        case IsoLineKind::RELATIVE_HUMIDITY: return "RELATIVE_HUMIDITY";
        case IsoLineKind::ENTHALPY:          return "ENTHALPY";
        case IsoLineKind::WET_BULB:          return "WET_BULB";
    }
    return "UNKNOWN";
}

void NumericSettings::validate() const {
    if (!std::isfinite(tolerance) || tolerance <= 0.0 || tolerance > 1e-2) {
        throw InvalidInputError("NumericSettings: tolerance must be in (0, 1e-2]");
    }
    if (max_iterations < 10 || max_iterations > 10000) {
        throw InvalidInputError("NumericSettings: max_iterations must be in [10, 10000]");
    }
}

} // namespace MASE
