#ifndef MASE_HPP
#define MASE_HPP

#include <string>
#include <vector>

#define MASE_VERSION_MAJOR 1
#define MASE_VERSION_MINOR 0
#define MASE_VERSION_PATCH 0
#define MASE_VERSION_STRING "1.0.0"

namespace MASE {

// Forward declarations
class AirState;
class PropertyConverter;
class AtmosphericContext;
class IsoLine;
class IsoLineGenerator;
class ProcessEvaluator;
class StateTable;
class ProcessLog;

/**
 * @brief Independent descriptor pairs accepted by the property converter
 *
 * Dry-bulb temperature is always one member of the pair. All values are
 * in the engine's canonical units: degC, fraction, kg/kg, J/kg.
 */
enum class InputPair {
    DRY_BULB_RELATIVE_HUMIDITY,     ///< {Tdb, RH}
    DRY_BULB_WET_BULB,              ///< {Tdb, Twb}
    DRY_BULB_DEW_POINT,             ///< {Tdb, Tdp}
    DRY_BULB_HUMIDITY_RATIO,        ///< {Tdb, W}
    DRY_BULB_ENTHALPY               ///< {Tdb, h}
};

/**
 * @brief Kinds of iso-lines drawn on a psychrometric chart
 */
enum class IsoLineKind {
    SATURATION,                     ///< RH = 1
    RELATIVE_HUMIDITY,              ///< Constant RH
    ENTHALPY,                       ///< Constant specific enthalpy
    WET_BULB                        ///< Constant wet-bulb temperature
};

InputPair parseInputPair(const std::string& name);
std::string toString(InputPair pair);

IsoLineKind parseIsoLineKind(const std::string& name);
std::string toString(IsoLineKind kind);

/**
 * @brief Bounds for every iterative solve in the engine
 *
 * Exceeding max_iterations is a ConvergenceError, never an approximation.
 */
struct NumericSettings {
    double tolerance = 1e-6;        // degC (or the solved quantity's unit)
    int max_iterations = 100;

    // Throws InvalidInputError on nonsensical values
    void validate() const;
};

/**
 * @brief Tolerances of the round-trip consistency contract
 */
namespace ConsistencyTolerance {
    constexpr double TEMPERATURE = 1e-3;        // K
    constexpr double HUMIDITY_RATIO = 1e-7;     // kg/kg
    constexpr double ENTHALPY = 1.0;            // J/kg
    constexpr double RELATIVE_HUMIDITY = 1e-5;  // fraction
}

} // namespace MASE

#endif // MASE_HPP
