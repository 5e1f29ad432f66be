#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <iosfwd>
#include <stdexcept>
#include <cmath>

namespace MASE {

/**
 * @brief Unit dimension in terms of Length, Mass, Time, Temperature (L M T Θ)
 *
 * Temperature is a separate dimension so that specific enthalpy (J/kg)
 * and specific heat (J/(kg·K)) never convert into each other.
 */
struct Dimension {
    double L;      // Length exponent
    double M;      // Mass exponent
    double T;      // Time exponent
    double Theta;  // Temperature exponent

    Dimension(double length = 0, double mass = 0, double time = 0, double temperature = 0)
        : L(length), M(mass), T(time), Theta(temperature) {}

    bool operator==(const Dimension& other) const {
        return (std::abs(L - other.L) < 1e-10 &&
                std::abs(M - other.M) < 1e-10 &&
                std::abs(T - other.T) < 1e-10 &&
                std::abs(Theta - other.Theta) < 1e-10);
    }

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }

    // Get human-readable dimension string
    std::string toString() const;
};

/**
 * @brief Unit definition with conversion factor to the engine's base units
 *
 * Base units are SI except temperature, whose base is degC because every
 * psychrometric correlation takes Celsius:
 * - Temperature: degC
 * - Pressure: Pa
 * - Specific enthalpy: J/kg
 * - Humidity ratio: kg/kg
 * - Mass flow: kg/s, volume flow: m³/s, power: W
 */
struct Unit {
    std::string name;           // Full name (e.g., "kilopascal")
    std::string symbol;         // Short symbol (e.g., "kPa")
    Dimension dimension;        // Dimensional formula
    double to_base;             // Conversion factor to base units
    double offset;              // Offset for affine conversions (temperature)
    std::string category;       // Category for organization
    std::vector<std::string> aliases;  // Alternative names/symbols

    Unit() : to_base(1.0), offset(0.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat = "")
        : name(n), symbol(s), dimension(d), to_base(factor), offset(0.0), category(cat) {}

    // Convert value from this unit to base
    double convertToBase(double value) const {
        return (value + offset) * to_base;
    }

    // Convert value from base to this unit
    double convertFromBase(double value) const {
        return value / to_base - offset;
    }
};

/**
 * @brief Unit database and conversion utilities for psychrometric quantities
 *
 * Used only at the boundary (configuration input, report output); the
 * engine itself always works in base units.
 */
class UnitSystem {
public:
    UnitSystem();
    ~UnitSystem() = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Get unit by name or symbol
     * @param name_or_symbol Unit name or symbol (case-insensitive)
     * @return Pointer to Unit, or nullptr if not found
     */
    const Unit* getUnit(const std::string& name_or_symbol) const;

    bool hasUnit(const std::string& name_or_symbol) const;

    /**
     * @brief Get all units in a category
     * @param category Category name (e.g., "temperature", "humidity_ratio")
     */
    std::vector<const Unit*> getUnitsInCategory(const std::string& category) const;

    std::vector<std::string> getCategories() const;

    Dimension getDimension(const std::string& unit_name) const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units
     * @throws std::runtime_error if a unit is unknown or the units are incompatible
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    double toBase(double value, const std::string& from_unit) const;
    double fromBase(double value, const std::string& to_unit) const;

    // =========================================================================
    // Parsing Functions
    // =========================================================================

    /**
     * @brief Parse value with unit string (e.g., "75 degF", "2000 CFM")
     * @param[out] value Parsed numeric value (not converted)
     * @param[out] unit Unit string, empty if none was given
     * @return true if parsing successful
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                            double& value, std::string& unit) const;

    /**
     * @brief Parse value with unit and convert to base
     * @throws std::runtime_error on malformed input or unknown unit
     */
    double parseAndConvertToBase(const std::string& value_with_unit) const;

    // =========================================================================
    // Dimensional Analysis
    // =========================================================================

    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    /**
     * @brief Display unit for a reported quantity (e.g., "enthalpy" -> "kJ/kg")
     */
    std::string getSuggestedDisplayUnit(const std::string& quantity) const;

    // =========================================================================
    // Custom Unit Registration
    // =========================================================================

    void addUnit(const Unit& unit);
    void addAlias(const std::string& unit_name, const std::string& alias);

    // =========================================================================
    // Utility Functions
    // =========================================================================

    std::string formatValue(double value, const std::string& unit,
                            int precision = 6) const;

    /**
     * @brief Print unit database to stream
     */
    void printDatabase(std::ostream& os) const;

private:
    // Unit database: maps name/symbol -> Unit
    std::map<std::string, Unit> units_;

    // Category index: category -> list of unit names
    std::map<std::string, std::vector<std::string>> categories_;

    // Suggested display units for reported quantities
    std::map<std::string, std::string> display_units_;

    void initializeDatabase();

    void addLengthUnits();
    void addTemperatureUnits();
    void addPressureUnits();
    void addSpecificEnthalpyUnits();
    void addHumidityRatioUnits();
    void addFractionUnits();
    void addSpecificVolumeUnits();
    void addDensityUnits();
    void addMassRateUnits();
    void addVolumetricRateUnits();
    void addPowerUnits();
    void addSpecificHeatUnits();

    // Helper to add unit with all variations
    void registerUnit(const Unit& unit);

    std::string toLowerCase(const std::string& str) const;
    std::string trim(const std::string& str) const;
};

/**
 * @brief Global unit system instance (singleton pattern)
 */
class UnitSystemManager {
public:
    static UnitSystem& getInstance() {
        static UnitSystem instance;
        return instance;
    }

private:
    UnitSystemManager() = default;
};

// Convenience functions for quick access
inline double convertUnits(double value, const std::string& from, const std::string& to) {
    return UnitSystemManager::getInstance().convert(value, from, to);
}

inline double toBaseUnits(double value, const std::string& unit) {
    return UnitSystemManager::getInstance().toBase(value, unit);
}

inline double fromBaseUnits(double value, const std::string& unit) {
    return UnitSystemManager::getInstance().fromBase(value, unit);
}

} // namespace MASE

#endif // UNIT_SYSTEM_HPP
