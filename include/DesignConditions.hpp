/**
 * @file DesignConditions.hpp
 * @brief Design-day weather catalog for common data-centre locations
 *
 * Values follow the ASHRAE Handbook of Fundamentals climatic design
 * tables. Temperatures in degC, altitude in m, timezone in hours from UTC.
 *
 * Usage:
 * @code
 * DesignConditionsCatalog catalog = DesignConditionsCatalog::standard();
 * auto record = catalog.find("abu dhabi");
 * StateTable states = DesignConditionsCatalog::designStates(*record);
 * @endcode
 */

#ifndef DESIGN_CONDITIONS_HPP
#define DESIGN_CONDITIONS_HPP

#include "StateTable.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace MASE {

/**
 * @brief ASHRAE design-day record for one location
 */
struct DesignDayRecord {
    std::string key;                    // catalog key, upper case
    std::string location;
    std::string country;
    double latitude = 0.0;              // deg
    double longitude = 0.0;             // deg
    double altitude = 0.0;              // m
    int timezone = 0;                   // h from UTC

    // Summer
    double cooling_db_n20 = 0.0;        // extreme (N=20) cooling dry-bulb
    double cooling_wb_n20 = 0.0;        // coincident wet-bulb
    double cooling_db_04 = 0.0;         // 0.4% cooling dry-bulb
    double cooling_wb_04 = 0.0;         // coincident wet-bulb
    double cooling_db_meanwb = 0.0;     // dry-bulb at mean coincident wet-bulb
    double dehumid_db = 0.0;            // dehumidification dry-bulb
    double dehumid_wb = 0.0;            // dehumidification wet-bulb

    // Winter
    double heating_db_n20 = 0.0;        // extreme (N=20) heating dry-bulb
    double heating_db_004 = 0.0;        // 99.6% heating dry-bulb
    double heating_db_meanwb = 0.0;     // mean coincident wet-bulb

    // Pressure at the record's altitude, standard atmosphere
    double standardPressure() const;
};

// Labels of the outdoor design states, in report order
namespace DesignStateLabel {
    constexpr const char* MAX_N20 = "OAT Max N=20";
    constexpr const char* MAX_ENTHALPY = "OAT Max 0.4%E";
    constexpr const char* MAX_HUMIDITY = "OAT Max 0.4%H";
    constexpr const char* MIN_N20 = "OAT Min N=20";
    constexpr const char* MIN_HUMIDITY = "OAT Min 0.4%H";
}

/**
 * @brief Location key -> design-day record
 *
 * The built-in set is constructed once and never modified; extend a copy
 * with add() (typically from [LOCATION:KEY] configuration sections).
 * Lookups are case-insensitive.
 */
class DesignConditionsCatalog {
public:
    DesignConditionsCatalog() = default;

    // Built-in catalog
    static const DesignConditionsCatalog& standard();

    std::optional<DesignDayRecord> find(const std::string& key) const;

    // @throws std::runtime_error for an unknown key
    const DesignDayRecord& get(const std::string& key) const;

    bool contains(const std::string& key) const;

    // Adds or replaces a record; the key is normalized to upper case
    void add(const DesignDayRecord& record);

    // Sorted keys with CUSTOM last
    std::vector<std::string> locations() const;

    size_t size() const { return records_.size(); }

    /**
     * @brief Outdoor design states of a record
     *
     * Each state is the {Tdb, Twb} pair of the record. Winter wet-bulbs
     * are tabulated as coincident means and may exceed the extreme
     * dry-bulb; they are capped at the dry-bulb (saturated air).
     * The 0.4% winter humidity case uses the mean wet-bulb + 2 K.
     */
    static StateTable designStates(const DesignDayRecord& record, double pressure,
                                   const PropertyConverter& converter = PropertyConverter());

    static StateTable designStates(const DesignDayRecord& record);

    static std::string normalizeKey(const std::string& key);

private:
    void initializeMiddleEast();
    void initializeAfrica();
    void initializeEurope();
    void initializeAsiaPacific();
    void initializeAmericas();
    void initializeCustom();

    std::map<std::string, DesignDayRecord> records_;
};

} // namespace MASE

#endif // DESIGN_CONDITIONS_HPP
