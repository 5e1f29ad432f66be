#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "MASE.hpp"
#include "MoistAirProperties.hpp"
#include "IsoLineGenerator.hpp"
#include "DesignConditions.hpp"
#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <vector>
#include <optional>
#include <fstream>
#include <sstream>

namespace MASE {

/**
 * @brief INI-style configuration reader for design studies
 *
 * Values may carry units ("75 degF", "1500 ft", "2000 CFM"); the
 * unit-aware accessors convert them to the engine's base units.
 * Labeled sections use a colon: [STATE:Return Air], [PROCESS:Winter Heating].
 */
class ConfigReader {
public:
    // =========================================================================
    // Nested Struct Definitions (must be before method declarations that use them)
    // =========================================================================

    struct AtmosphereConfig {
        std::optional<double> altitude;         // m
        std::optional<double> pressure;         // Pa, overrides altitude
    };

    struct StateConfig {
        std::string label;
        DescriptorSet descriptors;
    };

    struct OffCoilConfig {
        std::string label;
        std::optional<double> dew_point;        // degC
        std::string reference_state;            // dew point taken from this state
        std::optional<double> relative_humidity;
        std::optional<double> approach;         // K
    };

    struct SetpointConfig {
        std::string crah_off_coil = "CRAH Off-Coil";
        std::string crah_on_coil = "CRAH On-Coil";
        std::string winter_state = DesignStateLabel::MIN_N20;
        double cool_margin = 2.0;               // K
        double dehumidification_margin = 4.0;   // K
        double target_enthalpy = 44000.0;       // J/kg
    };

    struct ProcessConfig {
        std::string name;
        std::string from;
        std::string to;
        std::optional<double> mass_flow;        // kg/s
        std::optional<double> volume_flow;      // m3/s, converted at the entering state
        std::string flow_source;                // AHU or CRAH, from [SYSTEM]
        std::optional<double> to_dry_bulb;      // derive the leaving state
        std::optional<double> sensible_heat_ratio;
    };

    struct MixConfig {
        std::string label;
        std::string stream_a;
        std::string stream_b;
        double mass_flow_a = 0.0;               // kg/s
        double mass_flow_b = 0.0;               // kg/s
    };

    struct ChartConfig {
        bool enabled = true;
        ChartDomain domain;
        bool include_wet_bulb = true;
    };

    struct SystemConfig {
        double it_load = 1.5e6;                 // W
        double auxiliary_load_factor = 1.055;
        std::string crah_on_coil = "CRAH On-Coil";
        std::string crah_off_coil = "CRAH Off-Coil";
        std::string ahu_off_coil = "OC Dehum";
        std::optional<double> ahu_volume_flow;  // m3/s
        double ahu_flow_fraction = 0.011;
        double ahu_pressure_drop = 600.0;       // Pa
    };

    struct OutputConfig {
        std::string prefix = "mase_output";
        bool write_states = true;
        bool write_processes = true;
        bool write_chart = true;

        // Output unit preferences, quantity -> unit
        std::map<std::string, std::string> output_units;
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();

    bool loadFile(const std::string& filename);

    // Parse from an in-memory string (same syntax as a file)
    bool loadString(const std::string& content);

    // =========================================================================
    // Design Study Sections
    // =========================================================================

    bool parseAtmosphereConfig(AtmosphereConfig& config) const;
    bool parseNumericSettings(NumericSettings& settings) const;

    // [LOCATION] key, empty if none
    std::string parseLocationKey() const;

    /**
     * @brief Base catalog extended by [LOCATION:KEY] sections
     *
     * A section naming an existing key starts from that record and
     * overrides only the fields it sets.
     */
    DesignConditionsCatalog parseDesignCatalog(const DesignConditionsCatalog& base) const;

    // @throws std::runtime_error for a state without dry_bulb or a malformed value
    std::vector<StateConfig> parseStates() const;

    std::vector<OffCoilConfig> parseOffCoils() const;
    bool parseSetpointConfig(SetpointConfig& config) const;
    std::vector<ProcessConfig> parseProcesses() const;
    std::vector<MixConfig> parseMixes() const;
    bool parseChartConfig(ChartConfig& config) const;
    bool parseSystemConfig(SystemConfig& config) const;
    bool parseOutputConfig(OutputConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
              int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    // =========================================================================
    // Unit-Aware Value Accessors (converts to base units)
    // =========================================================================

    /**
     * @brief Get double value with automatic unit conversion
     * @param section Config section
     * @param key Config key
     * @param default_val Default value (in base units)
     * @param default_unit Default unit if no unit specified in value
     * @return Value converted to base units (degC, Pa, J/kg, kg/kg, kg/s, m3/s, W)
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                            double default_val = 0.0,
                            const std::string& default_unit = "") const;

    /**
     * @brief Optional value with unit conversion
     *
     * Unlike getDoubleWithUnit a present but unparseable value is an error,
     * because a state silently built from a default is worse than no state.
     * @throws std::runtime_error for a malformed value or unknown unit
     */
    std::optional<double> getOptionalWithUnit(const std::string& section, const std::string& key,
                                              const std::string& default_unit = "") const;

    /**
     * @brief Optional temperature difference in K
     *
     * Plain numbers are K; a temperature unit is converted by its scale
     * only (5 degF -> 2.78 K), never by its offset.
     * @throws std::runtime_error for a malformed value or non-temperature unit
     */
    std::optional<double> getOptionalTemperatureDifference(const std::string& section,
                                                           const std::string& key) const;

    // Strict unitless accessors: trailing text or a unit is an error
    std::optional<double> getOptionalDouble(const std::string& section,
                                            const std::string& key) const;
    std::optional<int> getOptionalInt(const std::string& section, const std::string& key) const;

    // @throws std::runtime_error for a malformed entry
    std::vector<double> getDoubleArrayWithUnit(const std::string& section,
                                               const std::string& key,
                                               const std::string& default_unit = "") const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

    // =========================================================================
    // Utility Methods
    // =========================================================================

    std::map<std::string, std::string> getSectionData(const std::string& section) const;
    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;
    bool mergeFile(const std::string& filename);
    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    std::vector<std::string> section_order_;
    UnitSystem unit_system_;

    bool parseStream(std::istream& input);

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;

    // Text after the first ':' of a labeled section name
    std::string sectionLabel(const std::string& section) const;
};

} // namespace MASE

#endif // CONFIG_READER_HPP
