#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <functional>

namespace MASE {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& content) {
    std::istringstream input(content);
    return parseStream(input);
}

bool ConfigReader::parseStream(std::istream& input) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            if (data.find(current_section) == data.end()) {
                data[current_section];
                section_order_.push_back(current_section);
            }
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

std::string ConfigReader::sectionLabel(const std::string& section) const {
    size_t colon = section.find(':');
    if (colon == std::string::npos) return "";
    return trim(section.substr(colon + 1));
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                        int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                          bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }

    return result;
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       double default_val, const std::string& default_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    double parsed_value;
    std::string parsed_unit;

    if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit)) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "'" << std::endl;
        return default_val;
    }

    const std::string& unit = parsed_unit.empty() ? default_unit : parsed_unit;
    if (unit.empty()) {
        // No unit specified and no default, assume already in base units
        return parsed_value;
    }

    try {
        return unit_system_.toBase(parsed_value, unit);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Unit conversion error for [" << section
                  << "]:" << key << " - " << e.what() << std::endl;
        return default_val;
    }
}

std::optional<double> ConfigReader::getOptionalWithUnit(const std::string& section,
                                                        const std::string& key,
                                                        const std::string& default_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return std::nullopt;
    }

    double parsed_value;
    std::string parsed_unit;
    if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit)) {
        throw std::runtime_error("Cannot parse [" + section + "]:" + key + " = '" + val + "'");
    }

    const std::string& unit = parsed_unit.empty() ? default_unit : parsed_unit;
    if (unit.empty()) {
        return parsed_value;
    }
    if (!default_unit.empty() && !unit_system_.areCompatible(unit, default_unit)) {
        throw std::runtime_error("Unit '" + unit + "' not valid for [" + section + "]:" + key);
    }
    return unit_system_.toBase(parsed_value, unit);
}

std::optional<double> ConfigReader::getOptionalTemperatureDifference(const std::string& section,
                                                                     const std::string& key) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return std::nullopt;
    }

    double parsed_value;
    std::string parsed_unit;
    if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit)) {
        throw std::runtime_error("Cannot parse [" + section + "]:" + key + " = '" + val + "'");
    }
    if (parsed_unit.empty()) {
        return parsed_value;
    }
    if (!unit_system_.areCompatible(parsed_unit, "K")) {
        throw std::runtime_error("Unit '" + parsed_unit + "' is not a temperature difference for ["
                                 + section + "]:" + key);
    }
    return parsed_value * unit_system_.getUnit(parsed_unit)->to_base;
}

std::optional<double> ConfigReader::getOptionalDouble(const std::string& section,
                                                      const std::string& key) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return std::nullopt;
    }

    double parsed_value;
    std::string parsed_unit;
    if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit) || !parsed_unit.empty()) {
        throw std::runtime_error("Cannot parse [" + section + "]:" + key + " = '" + val
                                 + "' as a plain number");
    }
    return parsed_value;
}

std::optional<int> ConfigReader::getOptionalInt(const std::string& section,
                                                const std::string& key) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return std::nullopt;
    }

    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(val, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != val.size()) {
        throw std::runtime_error("Cannot parse [" + section + "]:" + key + " = '" + val
                                 + "' as integer");
    }
    return parsed;
}

std::vector<double> ConfigReader::getDoubleArrayWithUnit(const std::string& section,
                                                         const std::string& key,
                                                         const std::string& default_unit) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        double parsed_value;
        std::string parsed_unit;

        if (!unit_system_.parseValueWithUnit(token, parsed_value, parsed_unit)) {
            throw std::runtime_error("Cannot parse '" + token + "' in [" + section + "]:" + key);
        }

        const std::string& unit = parsed_unit.empty() ? default_unit : parsed_unit;
        if (unit.empty()) {
            result.push_back(parsed_value);
            continue;
        }
        if (!default_unit.empty() && !unit_system_.areCompatible(unit, default_unit)) {
            throw std::runtime_error("Unit '" + unit + "' not valid for [" + section + "]:" + key);
        }
        result.push_back(unit_system_.toBase(parsed_value, unit));
    }

    return result;
}

// =============================================================================
// Section/Key Queries
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    return section_order_;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it != data.end()) {
        return it->second;
    }
    return {};
}

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& section : section_order_) {
        if (section.find(prefix) == 0) {
            result.push_back(section);
        }
    }
    return result;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Merge data - other file values override existing
    for (const auto& section : other.section_order_) {
        if (data.find(section) == data.end()) {
            section_order_.push_back(section);
        }
        for (const auto& key_val : other.data.at(section)) {
            data[section][key_val.first] = key_val.second;
        }
    }

    return true;
}

// =============================================================================
// Design Study Sections
// =============================================================================

bool ConfigReader::parseAtmosphereConfig(AtmosphereConfig& config) const {
    if (!hasSection("ATMOSPHERE")) return false;

    config.altitude = getOptionalWithUnit("ATMOSPHERE", "altitude", "m");
    config.pressure = getOptionalWithUnit("ATMOSPHERE", "pressure", "Pa");
    return true;
}

bool ConfigReader::parseNumericSettings(NumericSettings& settings) const {
    if (!hasSection("NUMERICS")) return false;

    settings.tolerance = getOptionalDouble("NUMERICS", "tolerance").value_or(settings.tolerance);
    settings.max_iterations =
        getOptionalInt("NUMERICS", "max_iterations").value_or(settings.max_iterations);
    return true;
}

std::string ConfigReader::parseLocationKey() const {
    return getString("LOCATION", "key", "");
}

DesignConditionsCatalog ConfigReader::parseDesignCatalog(const DesignConditionsCatalog& base) const {
    DesignConditionsCatalog catalog = base;

    for (const auto& section : getSectionsMatching("LOCATION:")) {
        const std::string key = sectionLabel(section);
        if (key.empty()) {
            std::cerr << "Warning: Section [" << section << "] has no location key" << std::endl;
            continue;
        }

        DesignDayRecord record;
        if (auto existing = catalog.find(key)) {
            record = *existing;
        }
        record.key = key;

        auto temp = [&](const char* name, double current) {
            return getOptionalWithUnit(section, name, "degC").value_or(current);
        };

        record.location = getString(section, "location", record.location.empty() ? key
                                                                               : record.location);
        record.country = getString(section, "country", record.country);
        record.latitude = getOptionalDouble(section, "latitude").value_or(record.latitude);
        record.longitude = getOptionalDouble(section, "longitude").value_or(record.longitude);
        record.altitude = getOptionalWithUnit(section, "altitude", "m").value_or(record.altitude);
        record.timezone = getOptionalInt(section, "timezone").value_or(record.timezone);

        record.cooling_db_n20 = temp("cooling_db_n20", record.cooling_db_n20);
        record.cooling_wb_n20 = temp("cooling_wb_n20", record.cooling_wb_n20);
        record.cooling_db_04 = temp("cooling_db_04", record.cooling_db_04);
        record.cooling_wb_04 = temp("cooling_wb_04", record.cooling_wb_04);
        record.cooling_db_meanwb = temp("cooling_db_meanwb", record.cooling_db_meanwb);
        record.dehumid_db = temp("dehumid_db", record.dehumid_db);
        record.dehumid_wb = temp("dehumid_wb", record.dehumid_wb);
        record.heating_db_n20 = temp("heating_db_n20", record.heating_db_n20);
        record.heating_db_004 = temp("heating_db_004", record.heating_db_004);
        record.heating_db_meanwb = temp("heating_db_meanwb", record.heating_db_meanwb);

        catalog.add(record);
    }

    return catalog;
}

std::vector<ConfigReader::StateConfig> ConfigReader::parseStates() const {
    std::vector<StateConfig> states;

    for (const auto& section : getSectionsMatching("STATE:")) {
        StateConfig state;
        state.label = sectionLabel(section);

        auto dry_bulb = getOptionalWithUnit(section, "dry_bulb", "degC");
        if (!dry_bulb) {
            throw std::runtime_error("Section [" + section + "] needs dry_bulb");
        }
        state.descriptors.dry_bulb = *dry_bulb;
        state.descriptors.relative_humidity =
            getOptionalWithUnit(section, "relative_humidity", "fraction");
        state.descriptors.wet_bulb = getOptionalWithUnit(section, "wet_bulb", "degC");
        state.descriptors.dew_point = getOptionalWithUnit(section, "dew_point", "degC");
        state.descriptors.humidity_ratio =
            getOptionalWithUnit(section, "humidity_ratio", "kg/kg");
        state.descriptors.enthalpy = getOptionalWithUnit(section, "enthalpy", "J/kg");

        states.push_back(state);
    }

    return states;
}

std::vector<ConfigReader::OffCoilConfig> ConfigReader::parseOffCoils() const {
    std::vector<OffCoilConfig> off_coils;

    for (const auto& section : getSectionsMatching("OFFCOIL:")) {
        OffCoilConfig oc;
        oc.label = sectionLabel(section);
        oc.dew_point = getOptionalWithUnit(section, "dew_point", "degC");
        oc.reference_state = getString(section, "reference_state", "");
        oc.relative_humidity = getOptionalWithUnit(section, "relative_humidity", "fraction");
        oc.approach = getOptionalTemperatureDifference(section, "approach");
        off_coils.push_back(oc);
    }

    return off_coils;
}

bool ConfigReader::parseSetpointConfig(SetpointConfig& config) const {
    if (!hasSection("SETPOINTS")) return false;

    config.crah_off_coil = getString("SETPOINTS", "crah_off_coil", config.crah_off_coil);
    config.crah_on_coil = getString("SETPOINTS", "crah_on_coil", config.crah_on_coil);
    config.winter_state = getString("SETPOINTS", "winter_state", config.winter_state);
    config.cool_margin = getOptionalTemperatureDifference("SETPOINTS", "cool_margin")
                             .value_or(config.cool_margin);
    config.dehumidification_margin =
        getOptionalTemperatureDifference("SETPOINTS", "dehumidification_margin")
            .value_or(config.dehumidification_margin);
    config.target_enthalpy = getOptionalWithUnit("SETPOINTS", "target_enthalpy", "J/kg")
                                 .value_or(config.target_enthalpy);
    return true;
}

std::vector<ConfigReader::ProcessConfig> ConfigReader::parseProcesses() const {
    std::vector<ProcessConfig> processes;

    for (const auto& section : getSectionsMatching("PROCESS:")) {
        ProcessConfig proc;
        proc.name = sectionLabel(section);
        proc.from = getString(section, "from", "");
        proc.to = getString(section, "to", "");
        proc.mass_flow = getOptionalWithUnit(section, "mass_flow", "kg/s");
        proc.volume_flow = getOptionalWithUnit(section, "volume_flow", "m3/s");
        proc.flow_source = getString(section, "flow", "");
        std::transform(proc.flow_source.begin(), proc.flow_source.end(),
                       proc.flow_source.begin(), ::toupper);
        proc.to_dry_bulb = getOptionalWithUnit(section, "to_dry_bulb", "degC");
        proc.sensible_heat_ratio = getOptionalWithUnit(section, "sensible_heat_ratio", "fraction");
        processes.push_back(proc);
    }

    return processes;
}

std::vector<ConfigReader::MixConfig> ConfigReader::parseMixes() const {
    std::vector<MixConfig> mixes;

    for (const auto& section : getSectionsMatching("MIX:")) {
        MixConfig mix;
        mix.label = sectionLabel(section);
        mix.stream_a = getString(section, "stream_a", "");
        mix.stream_b = getString(section, "stream_b", "");
        auto flow = [&](const char* name) {
            auto value = getOptionalWithUnit(section, name, "kg/s");
            if (!value) {
                throw std::runtime_error("Section [" + section + "] needs " + name);
            }
            return *value;
        };
        mix.mass_flow_a = flow("mass_flow_a");
        mix.mass_flow_b = flow("mass_flow_b");
        mixes.push_back(mix);
    }

    return mixes;
}

bool ConfigReader::parseChartConfig(ChartConfig& config) const {
    if (!hasSection("CHART")) return false;

    config.enabled = getBool("CHART", "enabled", config.enabled);
    config.domain.t_min = getOptionalWithUnit("CHART", "t_min", "degC").value_or(config.domain.t_min);
    config.domain.t_max = getOptionalWithUnit("CHART", "t_max", "degC").value_or(config.domain.t_max);
    config.domain.steps = getOptionalInt("CHART", "steps").value_or(config.domain.steps);

    if (hasKey("CHART", "rh_lines")) {
        config.domain.rh_values = getDoubleArrayWithUnit("CHART", "rh_lines", "fraction");
    }
    if (hasKey("CHART", "enthalpy_lines")) {
        config.domain.enthalpy_values = getDoubleArrayWithUnit("CHART", "enthalpy_lines", "J/kg");
    }
    if (hasKey("CHART", "wet_bulb_lines")) {
        config.domain.wet_bulb_values = getDoubleArrayWithUnit("CHART", "wet_bulb_lines", "degC");
    }
    config.include_wet_bulb = getBool("CHART", "wet_bulb", config.include_wet_bulb);
    if (!config.include_wet_bulb) {
        config.domain.wet_bulb_values.clear();
    }
    return true;
}

bool ConfigReader::parseSystemConfig(SystemConfig& config) const {
    if (!hasSection("SYSTEM")) return false;

    config.it_load = getOptionalWithUnit("SYSTEM", "it_load", "W").value_or(config.it_load);
    config.auxiliary_load_factor = getOptionalWithUnit("SYSTEM", "auxiliary_load_factor", "fraction")
                                       .value_or(config.auxiliary_load_factor);
    config.crah_on_coil = getString("SYSTEM", "crah_on_coil", config.crah_on_coil);
    config.crah_off_coil = getString("SYSTEM", "crah_off_coil", config.crah_off_coil);
    config.ahu_off_coil = getString("SYSTEM", "ahu_off_coil", config.ahu_off_coil);
    config.ahu_volume_flow = getOptionalWithUnit("SYSTEM", "ahu_volume_flow", "m3/s");
    config.ahu_flow_fraction = getOptionalWithUnit("SYSTEM", "ahu_flow_fraction", "fraction")
                                   .value_or(config.ahu_flow_fraction);
    config.ahu_pressure_drop = getOptionalWithUnit("SYSTEM", "ahu_pressure_drop", "Pa")
                                   .value_or(config.ahu_pressure_drop);
    return true;
}

bool ConfigReader::parseOutputConfig(OutputConfig& config) const {
    if (!hasSection("OUTPUT")) {
        // Use defaults
        return true;
    }

    config.prefix = getString("OUTPUT", "prefix", config.prefix);
    config.write_states = getBool("OUTPUT", "states", config.write_states);
    config.write_processes = getBool("OUTPUT", "processes", config.write_processes);
    config.write_chart = getBool("OUTPUT", "chart", config.write_chart);

    // Parse output unit preferences, e.g. temperature_unit = degF
    const std::string suffix = "_unit";
    for (const auto& key : getKeys("OUTPUT")) {
        if (key.size() > suffix.size() &&
            key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
            config.output_units[key.substr(0, key.size() - suffix.size())] =
                getString("OUTPUT", key);
        }
    }

    return true;
}

// =============================================================================
// Validation
// =============================================================================

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    auto error = [&](const std::string& message) {
        result.errors.push_back(message);
        result.valid = false;
    };

    if (!hasSection("ATMOSPHERE")) {
        result.warnings.push_back("No [ATMOSPHERE] section found - using sea level");
    } else if (hasKey("ATMOSPHERE", "altitude") && hasKey("ATMOSPHERE", "pressure")) {
        result.warnings.push_back("Both altitude and pressure given - pressure overrides altitude");
    }

    const std::string location = parseLocationKey();
    if (!location.empty()) {
        bool known = DesignConditionsCatalog::standard().contains(location);
        for (const auto& section : getSectionsMatching("LOCATION:")) {
            if (DesignConditionsCatalog::normalizeKey(sectionLabel(section)) ==
                DesignConditionsCatalog::normalizeKey(location)) {
                known = true;
            }
        }
        if (!known) {
            error("Unknown design location: " + location);
        }
    }

    if (getSectionsMatching("STATE:").empty() && location.empty()) {
        result.warnings.push_back("No states or design location defined");
    }

    for (const auto& section : getSectionsMatching("STATE:")) {
        if (sectionLabel(section).empty()) {
            error("Section [" + section + "] has no label");
        }
        if (!hasKey(section, "dry_bulb")) {
            error("Section [" + section + "] needs dry_bulb");
        }
        static const char* const descriptors[] = {
            "relative_humidity", "wet_bulb", "dew_point", "humidity_ratio", "enthalpy"
        };
        bool any = false;
        for (const char* key : descriptors) {
            any = any || hasKey(section, key);
        }
        if (!any) {
            error("Section [" + section + "] needs a second descriptor");
        }
    }

    for (const auto& section : getSectionsMatching("OFFCOIL:")) {
        if (hasKey(section, "dew_point") == hasKey(section, "reference_state")) {
            error("Section [" + section + "] needs exactly one of dew_point or reference_state");
        }
        if (!hasKey(section, "relative_humidity") && !hasKey(section, "approach")) {
            error("Section [" + section + "] needs relative_humidity or approach");
        }
    }

    for (const auto& section : getSectionsMatching("PROCESS:")) {
        if (!hasKey(section, "from") || !hasKey(section, "to")) {
            error("Section [" + section + "] needs from and to");
        }
        int flows = (hasKey(section, "mass_flow") ? 1 : 0) +
                    (hasKey(section, "volume_flow") ? 1 : 0) +
                    (hasKey(section, "flow") ? 1 : 0);
        if (flows != 1) {
            error("Section [" + section + "] needs exactly one of mass_flow, volume_flow or flow");
        }
        if (hasKey(section, "sensible_heat_ratio") && !hasKey(section, "to_dry_bulb")) {
            error("Section [" + section + "] sensible_heat_ratio needs to_dry_bulb");
        }
    }

    for (const auto& section : getSectionsMatching("MIX:")) {
        if (!hasKey(section, "stream_a") || !hasKey(section, "stream_b")) {
            error("Section [" + section + "] needs stream_a and stream_b");
        }
        if (!hasKey(section, "mass_flow_a") || !hasKey(section, "mass_flow_b")) {
            error("Section [" + section + "] needs mass_flow_a and mass_flow_b");
        }
    }

    // Every present value must parse; a malformed one never falls back to a default
    auto parses = [&](const std::function<void()>& parse) {
        try {
            parse();
        } catch (const std::exception& e) {
            error(e.what());
        }
    };
    NumericSettings settings;
    ChartConfig chart;
    parses([&] { AtmosphereConfig atmosphere; parseAtmosphereConfig(atmosphere); });
    parses([&] { parseNumericSettings(settings); });
    parses([&] { parseDesignCatalog(DesignConditionsCatalog::standard()); });
    for (const auto& section : getSectionsMatching("STATE:")) {
        parses([&] {
            getOptionalWithUnit(section, "dry_bulb", "degC");
            getOptionalWithUnit(section, "relative_humidity", "fraction");
            getOptionalWithUnit(section, "wet_bulb", "degC");
            getOptionalWithUnit(section, "dew_point", "degC");
            getOptionalWithUnit(section, "humidity_ratio", "kg/kg");
            getOptionalWithUnit(section, "enthalpy", "J/kg");
        });
    }
    parses([&] { parseOffCoils(); });
    parses([&] { SetpointConfig setpoints; parseSetpointConfig(setpoints); });
    parses([&] { parseProcesses(); });
    for (const auto& section : getSectionsMatching("MIX:")) {
        parses([&] {
            getOptionalWithUnit(section, "mass_flow_a", "kg/s");
            getOptionalWithUnit(section, "mass_flow_b", "kg/s");
        });
    }
    parses([&] { SystemConfig system; parseSystemConfig(system); });

    bool chart_parsed = false;
    parses([&] { parseChartConfig(chart); chart_parsed = true; });

    if (hasSection("NUMERICS")) {
        if (settings.tolerance <= 0.0 || settings.tolerance > 1e-2) {
            error("Invalid solver tolerance (must be in (0, 1e-2])");
        }
        if (settings.max_iterations < 10 || settings.max_iterations > 10000) {
            error("Invalid max_iterations (must be 10-10000)");
        }
    }

    if (hasSection("CHART") && chart_parsed) {
        if (chart.domain.t_min >= chart.domain.t_max) {
            error("Chart t_min must be below t_max");
        }
        if (chart.domain.steps < 1) {
            error("Chart steps must be positive");
        }
    }

    return result;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    file << "# MASE design study configuration\n";
    file << "# Values may carry units, e.g. 75 degF, 1500 ft, 2000 CFM, 9.3 g/kg\n";
    file << "# Plain numbers use base units: degC, Pa, m, J/kg, kg/kg, kg/s, m3/s, W\n\n";

    file << "[ATMOSPHERE]\n";
    file << "altitude = 22 m\n";
    file << "# pressure = 101325 Pa       # overrides altitude\n\n";

    file << "[NUMERICS]\n";
    file << "tolerance = 1e-6\n";
    file << "max_iterations = 100\n\n";

    file << "[LOCATION]\n";
    file << "key = ABU DHABI              # outdoor design states from the catalog\n\n";

    file << "# Catalog extension or override\n";
    file << "# [LOCATION:SITE A]\n";
    file << "# altitude = 150 m\n";
    file << "# cooling_db_n20 = 44.0\n";
    file << "# cooling_wb_n20 = 27.0\n\n";

    file << "# ASHRAE A1 recommended envelope corners\n";
    file << "[STATE:ASHRAE 18 Low]\n";
    file << "dry_bulb = 18.0\n";
    file << "wet_bulb = 6.4\n\n";
    file << "[STATE:ASHRAE 18 High]\n";
    file << "dry_bulb = 18.0\n";
    file << "wet_bulb = 14.4\n\n";
    file << "[STATE:ASHRAE 27 Low]\n";
    file << "dry_bulb = 27.0\n";
    file << "wet_bulb = 10.27\n\n";
    file << "[STATE:ASHRAE 27 High]\n";
    file << "dry_bulb = 27.0\n";
    file << "wet_bulb = 13.2\n\n";

    file << "[STATE:CRAH Off-Coil]\n";
    file << "dry_bulb = 25.0\n";
    file << "wet_bulb = 16.5\n\n";
    file << "[STATE:CRAH On-Coil]\n";
    file << "dry_bulb = 36.0\n";
    file << "wet_bulb = 19.8\n\n";
    file << "[STATE:Return Air]\n";
    file << "dry_bulb = 35.0\n";
    file << "wet_bulb = 25.0\n\n";

    file << "# AHU off-coil set: OC Max Cool, OC Dehum, OC Enthalpy, OC Heat\n";
    file << "[SETPOINTS]\n";
    file << "crah_off_coil = CRAH Off-Coil\n";
    file << "crah_on_coil = CRAH On-Coil\n";
    file << "winter_state = OAT Min N=20\n";
    file << "cool_margin = 2.0\n";
    file << "dehumidification_margin = 4.0\n";
    file << "target_enthalpy = 44 kJ/kg\n\n";

    file << "# Coil leaving state from a dew point\n";
    file << "# [OFFCOIL:Coil Leaving]\n";
    file << "# dew_point = 10.0\n";
    file << "# relative_humidity = 90 %\n\n";

    file << "[SYSTEM]\n";
    file << "it_load = 1500 kW\n";
    file << "auxiliary_load_factor = 1.055\n";
    file << "crah_on_coil = CRAH On-Coil\n";
    file << "crah_off_coil = CRAH Off-Coil\n";
    file << "ahu_off_coil = OC Dehum\n";
    file << "ahu_flow_fraction = 0.011\n";
    file << "ahu_pressure_drop = 600 Pa\n\n";

    file << "[PROCESS:Summer Max Cooling]\n";
    file << "from = OAT Max N=20\n";
    file << "to = OC Max Cool\n";
    file << "flow = AHU\n\n";
    file << "[PROCESS:Summer Enthalpy Cooling]\n";
    file << "from = OAT Max 0.4%E\n";
    file << "to = OC Enthalpy\n";
    file << "flow = AHU\n\n";
    file << "[PROCESS:Summer Dehumidification]\n";
    file << "from = OAT Max 0.4%H\n";
    file << "to = OC Dehum\n";
    file << "flow = AHU\n\n";
    file << "[PROCESS:CRAH Cooling Loop]\n";
    file << "from = CRAH On-Coil\n";
    file << "to = CRAH Off-Coil\n";
    file << "flow = CRAH\n\n";
    file << "[PROCESS:Winter Heating]\n";
    file << "from = OAT Min N=20\n";
    file << "to = OC Heat\n";
    file << "flow = AHU\n\n";
    file << "[PROCESS:Winter Min OAH Heating]\n";
    file << "from = OAT Min 0.4%H\n";
    file << "to = OC Heat\n";
    file << "flow = AHU\n\n";

    file << "# [MIX:Mixed Air]\n";
    file << "# stream_a = Return Air\n";
    file << "# mass_flow_a = 9.0\n";
    file << "# stream_b = OAT Max N=20\n";
    file << "# mass_flow_b = 1.0\n\n";

    file << "[CHART]\n";
    file << "enabled = true\n";
    file << "t_min = -10\n";
    file << "t_max = 55\n";
    file << "steps = 130\n";
    file << "rh_lines = 10 %, 20 %, 30 %, 40 %, 50 %, 60 %, 70 %, 80 %, 90 %\n";
    file << "enthalpy_lines = 0 kJ/kg, 20 kJ/kg, 40 kJ/kg, 60 kJ/kg, 80 kJ/kg, 100 kJ/kg\n";
    file << "wet_bulb = false\n\n";

    file << "[OUTPUT]\n";
    file << "prefix = mase_output\n";
    file << "states = true\n";
    file << "processes = true\n";
    file << "chart = true\n";
    file << "temperature_unit = degC\n";
    file << "humidity_ratio_unit = g/kg\n";
    file << "enthalpy_unit = kJ/kg\n";
    file << "heat_unit = kW\n";

    file.close();
}

} // namespace MASE
