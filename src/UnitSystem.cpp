#include "UnitSystem.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ostream>

namespace MASE {

// =============================================================================
// Dimension Implementation
// =============================================================================

std::string Dimension::toString() const {
    std::stringstream ss;
    bool first = true;

    auto term = [&](double exponent, const char* symbol) {
        if (std::abs(exponent) <= 1e-10) return;
        if (!first) ss << " ";
        ss << symbol;
        if (std::abs(exponent - 1.0) > 1e-10) ss << "^" << exponent;
        first = false;
    };

    term(L, "L");
    term(M, "M");
    term(T, "T");
    term(Theta, "Theta");

    return ss.str().empty() ? "dimensionless" : ss.str();
}

// =============================================================================
// UnitSystem Implementation
// =============================================================================

UnitSystem::UnitSystem() {
    initializeDatabase();
}

void UnitSystem::initializeDatabase() {
    addLengthUnits();
    addTemperatureUnits();
    addPressureUnits();
    addSpecificEnthalpyUnits();
    addHumidityRatioUnits();
    addFractionUnits();
    addSpecificVolumeUnits();
    addDensityUnits();
    addMassRateUnits();
    addVolumetricRateUnits();
    addPowerUnits();
    addSpecificHeatUnits();

    // Suggested display units for reported quantities
    display_units_["temperature"] = "degC";
    display_units_["humidity_ratio"] = "g/kg";
    display_units_["relative_humidity"] = "%";
    display_units_["enthalpy"] = "kJ/kg";
    display_units_["specific_volume"] = "m3/kg";
    display_units_["density"] = "kg/m3";
    display_units_["specific_heat"] = "kJ/(kg*K)";
    display_units_["pressure"] = "Pa";
    display_units_["mass_flow"] = "kg/s";
    display_units_["volume_flow"] = "m3/s";
    display_units_["heat"] = "kW";
    display_units_["moisture_rate"] = "g/s";
    display_units_["length"] = "m";
}

// =============================================================================
// Length Units
// =============================================================================

void UnitSystem::addLengthUnits() {
    Dimension length(1, 0, 0);

    registerUnit(Unit("meter", "m", length, 1.0, "length"));
    registerUnit(Unit("kilometer", "km", length, 1000.0, "length"));
    registerUnit(Unit("foot", "ft", length, 0.3048, "length"));
    registerUnit(Unit("mile", "mi", length, 1609.344, "length"));
}

// =============================================================================
// Temperature Units (base: degC)
// =============================================================================

void UnitSystem::addTemperatureUnits() {
    Dimension temperature(0, 0, 0, 1);

    Unit celsius("celsius", "degC", temperature, 1.0, "temperature");
    celsius.aliases = {"C", "°C"};
    registerUnit(celsius);

    Unit kelvin("kelvin", "K", temperature, 1.0, "temperature");
    kelvin.offset = -273.15;  // 273.15 K = 0 degC
    registerUnit(kelvin);

    Unit fahrenheit("fahrenheit", "degF", temperature, 5.0/9.0, "temperature");
    fahrenheit.offset = -32.0;  // 32 degF = 0 degC
    fahrenheit.aliases = {"F", "°F"};
    registerUnit(fahrenheit);

    Unit rankine("rankine", "R", temperature, 5.0/9.0, "temperature");
    rankine.offset = -491.67;  // 491.67 R = 0 degC
    registerUnit(rankine);
}

// =============================================================================
// Pressure Units
// =============================================================================

void UnitSystem::addPressureUnits() {
    Dimension pressure(-1, 1, -2);

    // SI
    registerUnit(Unit("pascal", "Pa", pressure, 1.0, "pressure"));
    registerUnit(Unit("hectopascal", "hPa", pressure, 100.0, "pressure"));
    registerUnit(Unit("kilopascal", "kPa", pressure, 1000.0, "pressure"));

    // Other metric
    registerUnit(Unit("bar", "bar", pressure, 1e5, "pressure"));
    registerUnit(Unit("millibar", "mbar", pressure, 100.0, "pressure"));
    registerUnit(Unit("atmosphere", "atm", pressure, 101325.0, "pressure"));

    // Imperial/US
    registerUnit(Unit("pounds per square inch", "psi", pressure, 6894.757293168, "pressure"));
    registerUnit(Unit("inch mercury", "inHg", pressure, 3386.389, "pressure"));
    registerUnit(Unit("inch water", "inH2O", pressure, 249.08891, "pressure"));
    registerUnit(Unit("millimeter mercury", "mmHg", pressure, 133.322368421, "pressure"));
}

// =============================================================================
// Specific Enthalpy Units (per kg dry air)
// =============================================================================

void UnitSystem::addSpecificEnthalpyUnits() {
    Dimension specific_energy(2, 0, -2);

    registerUnit(Unit("joule per kilogram", "J/kg", specific_energy, 1.0, "specific_enthalpy"));
    registerUnit(Unit("kilojoule per kilogram", "kJ/kg", specific_energy, 1000.0,
                      "specific_enthalpy"));
    registerUnit(Unit("BTU per pound", "BTU/lb", specific_energy, 2326.0, "specific_enthalpy"));
}

// =============================================================================
// Humidity Ratio Units
// =============================================================================

void UnitSystem::addHumidityRatioUnits() {
    Dimension ratio(0, 0, 0);

    registerUnit(Unit("kilogram per kilogram", "kg/kg", ratio, 1.0, "humidity_ratio"));
    registerUnit(Unit("gram per kilogram", "g/kg", ratio, 0.001, "humidity_ratio"));
    registerUnit(Unit("grain per pound", "gr/lb", ratio, 1.0/7000.0, "humidity_ratio"));
}

// =============================================================================
// Fraction Units (relative humidity, ratios)
// =============================================================================

void UnitSystem::addFractionUnits() {
    Dimension fraction(0, 0, 0);

    registerUnit(Unit("fraction", "fraction", fraction, 1.0, "fraction"));
    Unit percent("percent", "%", fraction, 0.01, "fraction");
    percent.aliases = {"pct"};
    registerUnit(percent);
}

// =============================================================================
// Specific Volume and Density Units
// =============================================================================

void UnitSystem::addSpecificVolumeUnits() {
    Dimension specific_volume(3, -1, 0);

    registerUnit(Unit("cubic meter per kilogram", "m3/kg", specific_volume, 1.0,
                      "specific_volume"));
    registerUnit(Unit("cubic foot per pound", "ft3/lb", specific_volume,
                      0.028316846592 / 0.45359237, "specific_volume"));
}

void UnitSystem::addDensityUnits() {
    Dimension density(-3, 1, 0);

    registerUnit(Unit("kilogram per cubic meter", "kg/m3", density, 1.0, "density"));
    registerUnit(Unit("pound per cubic foot", "lb/ft3", density,
                      0.45359237 / 0.028316846592, "density"));
}

// =============================================================================
// Flow Units
// =============================================================================

void UnitSystem::addMassRateUnits() {
    Dimension rate(0, 1, -1);

    registerUnit(Unit("kilogram per second", "kg/s", rate, 1.0, "mass_rate"));
    registerUnit(Unit("gram per second", "g/s", rate, 0.001, "mass_rate"));
    registerUnit(Unit("kilogram per hour", "kg/h", rate, 1.0/3600.0, "mass_rate"));
    registerUnit(Unit("pound per hour", "lb/h", rate, 0.45359237/3600.0, "mass_rate"));
    registerUnit(Unit("pound per minute", "lb/min", rate, 0.45359237/60.0, "mass_rate"));
}

void UnitSystem::addVolumetricRateUnits() {
    Dimension rate(3, 0, -1);

    // SI
    registerUnit(Unit("cubic meter per second", "m3/s", rate, 1.0, "volumetric_rate"));
    registerUnit(Unit("cubic meter per hour", "m3/h", rate, 1.0/3600.0, "volumetric_rate"));
    registerUnit(Unit("liter per second", "L/s", rate, 0.001, "volumetric_rate"));

    // Imperial/US
    Unit cfm("cubic foot per minute", "CFM", rate, 0.028316846592/60.0, "volumetric_rate");
    cfm.aliases = {"ft3/min"};
    registerUnit(cfm);
}

// =============================================================================
// Power Units
// =============================================================================

void UnitSystem::addPowerUnits() {
    Dimension power(2, 1, -3);

    // SI
    registerUnit(Unit("watt", "W", power, 1.0, "power"));
    registerUnit(Unit("kilowatt", "kW", power, 1000.0, "power"));
    registerUnit(Unit("megawatt", "MW", power, 1e6, "power"));

    // HVAC
    registerUnit(Unit("BTU per hour", "BTU/hr", power, 0.29307107017, "power"));
    registerUnit(Unit("thousand BTU per hour", "MBH", power, 293.07107017, "power"));
    registerUnit(Unit("ton of refrigeration", "TR", power, 3516.8528420667, "power"));
}

// =============================================================================
// Specific Heat Units
// =============================================================================

void UnitSystem::addSpecificHeatUnits() {
    Dimension specific_heat(2, 0, -2, -1);

    registerUnit(Unit("joule per kilogram kelvin", "J/(kg*K)", specific_heat, 1.0,
                      "specific_heat"));
    registerUnit(Unit("kilojoule per kilogram kelvin", "kJ/(kg*K)", specific_heat, 1000.0,
                      "specific_heat"));
    registerUnit(Unit("BTU per pound fahrenheit", "BTU/(lb*F)", specific_heat, 4186.8,
                      "specific_heat"));
}

// =============================================================================
// Helper Functions
// =============================================================================

void UnitSystem::registerUnit(const Unit& unit) {
    // Store by name (lowercase)
    std::string key = toLowerCase(unit.name);
    units_[key] = unit;

    // Store by symbol (case-sensitive primary, lowercase secondary)
    if (!unit.symbol.empty()) {
        units_[unit.symbol] = unit;
        units_[toLowerCase(unit.symbol)] = unit;
    }

    for (const auto& alias : unit.aliases) {
        units_[alias] = unit;
        units_[toLowerCase(alias)] = unit;
    }

    // Add to category index once per unit
    if (!unit.category.empty()) {
        auto& names = categories_[unit.category];
        if (std::find(names.begin(), names.end(), key) == names.end()) {
            names.push_back(key);
        }
    }
}

std::string UnitSystem::toLowerCase(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string UnitSystem::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Database Access
// =============================================================================

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    // Try exact match first
    auto it = units_.find(name_or_symbol);
    if (it != units_.end()) {
        return &(it->second);
    }

    // Try lowercase
    it = units_.find(toLowerCase(name_or_symbol));
    if (it != units_.end()) {
        return &(it->second);
    }

    return nullptr;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

std::vector<const Unit*> UnitSystem::getUnitsInCategory(const std::string& category) const {
    std::vector<const Unit*> result;
    auto it = categories_.find(category);
    if (it != categories_.end()) {
        for (const auto& unit_name : it->second) {
            auto unit_it = units_.find(unit_name);
            if (unit_it != units_.end()) {
                result.push_back(&(unit_it->second));
            }
        }
    }
    return result;
}

std::vector<std::string> UnitSystem::getCategories() const {
    std::vector<std::string> result;
    for (const auto& pair : categories_) {
        result.push_back(pair.first);
    }
    return result;
}

Dimension UnitSystem::getDimension(const std::string& unit_name) const {
    const Unit* unit = getUnit(unit_name);
    if (unit) {
        return unit->dimension;
    }
    throw std::runtime_error("Unit not found: " + unit_name);
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit* from = getUnit(from_unit);
    const Unit* to = getUnit(to_unit);

    if (!from) {
        throw std::runtime_error("Unknown source unit: " + from_unit);
    }
    if (!to) {
        throw std::runtime_error("Unknown destination unit: " + to_unit);
    }

    if (from->dimension != to->dimension) {
        throw std::runtime_error("Incompatible dimensions: " +
                                 from->dimension.toString() + " vs " +
                                 to->dimension.toString());
    }

    // Convert: from_unit -> base -> to_unit
    double base_value = from->convertToBase(value);
    return to->convertFromBase(base_value);
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    const Unit* unit = getUnit(from_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + from_unit);
    }
    return unit->convertToBase(value);
}

double UnitSystem::fromBase(double value, const std::string& to_unit) const {
    const Unit* unit = getUnit(to_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + to_unit);
    }
    return unit->convertFromBase(value);
}

// =============================================================================
// Parsing Functions
// =============================================================================

bool UnitSystem::parseValueWithUnit(const std::string& value_with_unit,
                                    double& value, std::string& unit) const {
    std::string trimmed = trim(value_with_unit);
    if (trimmed.empty()) return false;

    // Find where the number ends and unit begins
    size_t i = 0;

    // Skip sign
    if (trimmed[i] == '+' || trimmed[i] == '-') i++;

    // Skip digits and decimal point
    bool has_digits = false;
    bool has_decimal = false;
    while (i < trimmed.length()) {
        if (std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            has_digits = true;
            i++;
        } else if (trimmed[i] == '.' && !has_decimal) {
            has_decimal = true;
            i++;
        } else if ((trimmed[i] == 'e' || trimmed[i] == 'E') && has_digits &&
                   i + 1 < trimmed.length() &&
                   (std::isdigit(static_cast<unsigned char>(trimmed[i + 1])) ||
                    trimmed[i + 1] == '+' || trimmed[i + 1] == '-')) {
            // Scientific notation
            i++;
            if (trimmed[i] == '+' || trimmed[i] == '-') {
                i++;
            }
        } else {
            break;
        }
    }

    if (!has_digits) return false;

    // Extract number and unit parts
    std::string num_str = trim(trimmed.substr(0, i));
    std::string unit_str = trim(trimmed.substr(i));

    try {
        value = std::stod(num_str);
    } catch (const std::exception&) {
        return false;
    }
    unit = unit_str;
    return true;
}

double UnitSystem::parseAndConvertToBase(const std::string& value_with_unit) const {
    double value;
    std::string unit;

    if (!parseValueWithUnit(value_with_unit, value, unit)) {
        throw std::runtime_error("Failed to parse: " + value_with_unit);
    }

    if (unit.empty()) {
        // No unit specified, assume base units
        return value;
    }

    return toBase(value, unit);
}

// =============================================================================
// Dimensional Analysis
// =============================================================================

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    const Unit* u1 = getUnit(unit1);
    const Unit* u2 = getUnit(unit2);

    if (!u1 || !u2) return false;
    return u1->dimension == u2->dimension;
}

std::string UnitSystem::getSuggestedDisplayUnit(const std::string& quantity) const {
    auto it = display_units_.find(quantity);
    if (it != display_units_.end()) {
        return it->second;
    }
    return "";
}

// =============================================================================
// Custom Units
// =============================================================================

void UnitSystem::addUnit(const Unit& unit) {
    registerUnit(unit);
}

void UnitSystem::addAlias(const std::string& unit_name, const std::string& alias) {
    const Unit* unit = getUnit(unit_name);
    if (!unit) {
        throw std::runtime_error("Cannot alias unknown unit: " + unit_name);
    }
    Unit modified = *unit;
    modified.aliases.push_back(alias);
    registerUnit(modified);
}

// =============================================================================
// Utility Functions
// =============================================================================

std::string UnitSystem::formatValue(double value, const std::string& unit,
                                    int precision) const {
    std::stringstream ss;
    ss << std::setprecision(precision) << value << " " << unit;
    return ss.str();
}

void UnitSystem::printDatabase(std::ostream& os) const {
    os << "Unit System Database\n";
    os << "====================\n\n";

    for (const auto& cat_pair : categories_) {
        os << "Category: " << cat_pair.first << "\n";
        os << std::string(40, '-') << "\n";

        for (const auto& unit_name : cat_pair.second) {
            auto it = units_.find(unit_name);
            if (it != units_.end()) {
                const Unit& u = it->second;
                os << std::setw(30) << std::left << u.name
                   << " [" << std::setw(10) << u.symbol << "] "
                   << " = " << u.to_base << " * base";
                if (u.offset != 0.0) {
                    os << " (offset " << u.offset << ")";
                }
                os << " (" << u.dimension.toString() << ")\n";
            }
        }
        os << "\n";
    }
}

} // namespace MASE
