#include "DesignConditions.hpp"
#include "AtmosphericModel.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace MASE {

namespace {

const char* const CUSTOM_KEY = "CUSTOM";

DesignDayRecord makeRecord(const std::string& key, const std::string& location,
                           const std::string& country, double latitude, double longitude,
                           double altitude, int timezone,
                           double cooling_db_n20, double cooling_wb_n20,
                           double cooling_db_04, double cooling_wb_04,
                           double cooling_db_meanwb, double dehumid_db, double dehumid_wb,
                           double heating_db_n20, double heating_db_004,
                           double heating_db_meanwb) {
    DesignDayRecord r;
    r.key = key;
    r.location = location;
    r.country = country;
    r.latitude = latitude;
    r.longitude = longitude;
    r.altitude = altitude;
    r.timezone = timezone;
    r.cooling_db_n20 = cooling_db_n20;
    r.cooling_wb_n20 = cooling_wb_n20;
    r.cooling_db_04 = cooling_db_04;
    r.cooling_wb_04 = cooling_wb_04;
    r.cooling_db_meanwb = cooling_db_meanwb;
    r.dehumid_db = dehumid_db;
    r.dehumid_wb = dehumid_wb;
    r.heating_db_n20 = heating_db_n20;
    r.heating_db_004 = heating_db_004;
    r.heating_db_meanwb = heating_db_meanwb;
    return r;
}

} // namespace

double DesignDayRecord::standardPressure() const {
    return AtmosphereUtils::standardPressure(altitude);
}

// =============================================================================
// Catalog access
// =============================================================================

const DesignConditionsCatalog& DesignConditionsCatalog::standard() {
    static const DesignConditionsCatalog instance = [] {
        DesignConditionsCatalog catalog;
        catalog.initializeMiddleEast();
        catalog.initializeAfrica();
        catalog.initializeEurope();
        catalog.initializeAsiaPacific();
        catalog.initializeAmericas();
        catalog.initializeCustom();
        return catalog;
    }();
    return instance;
}

std::string DesignConditionsCatalog::normalizeKey(const std::string& key) {
    size_t first = key.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    size_t last = key.find_last_not_of(" \t");
    std::string result = key.substr(first, last - first + 1);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::optional<DesignDayRecord> DesignConditionsCatalog::find(const std::string& key) const {
    auto it = records_.find(normalizeKey(key));
    if (it != records_.end()) {
        return it->second;
    }
    return std::nullopt;
}

const DesignDayRecord& DesignConditionsCatalog::get(const std::string& key) const {
    auto it = records_.find(normalizeKey(key));
    if (it == records_.end()) {
        throw std::runtime_error("Unknown design location: " + key);
    }
    return it->second;
}

bool DesignConditionsCatalog::contains(const std::string& key) const {
    return records_.find(normalizeKey(key)) != records_.end();
}

void DesignConditionsCatalog::add(const DesignDayRecord& record) {
    std::string key = normalizeKey(record.key);
    if (key.empty()) {
        throw std::runtime_error("Design-day record needs a location key");
    }
    DesignDayRecord stored = record;
    stored.key = key;
    records_[key] = stored;
}

std::vector<std::string> DesignConditionsCatalog::locations() const {
    std::vector<std::string> keys;
    bool has_custom = false;
    for (const auto& pair : records_) {
        if (pair.first == CUSTOM_KEY) {
            has_custom = true;
        } else {
            keys.push_back(pair.first);
        }
    }
    if (has_custom) {
        keys.push_back(CUSTOM_KEY);
    }
    return keys;
}

// =============================================================================
// Design states
// =============================================================================

StateTable DesignConditionsCatalog::designStates(const DesignDayRecord& record, double pressure,
                                                 const PropertyConverter& converter) {
    StateTable states;
    auto add = [&](const char* label, double t_dry_bulb, double t_wet_bulb) {
        states.add(label, AirState::create(
            StateInput::dryBulbWetBulb(t_dry_bulb, std::min(t_wet_bulb, t_dry_bulb)),
            pressure, converter));
    };

    add(DesignStateLabel::MAX_N20, record.cooling_db_n20, record.cooling_wb_n20);
    add(DesignStateLabel::MAX_ENTHALPY, record.cooling_db_04, record.cooling_wb_04);
    add(DesignStateLabel::MAX_HUMIDITY, record.dehumid_db, record.dehumid_wb);
    add(DesignStateLabel::MIN_N20, record.heating_db_n20, record.heating_db_meanwb);
    add(DesignStateLabel::MIN_HUMIDITY, record.heating_db_004, record.heating_db_meanwb + 2.0);
    return states;
}

StateTable DesignConditionsCatalog::designStates(const DesignDayRecord& record) {
    return designStates(record, record.standardPressure());
}

// =============================================================================
// Built-in records
// =============================================================================

void DesignConditionsCatalog::initializeMiddleEast() {
    add(makeRecord("ABU DHABI", "Abu Dhabi", "UAE", 24.43, 54.65, 27, 4,
                   47.0, 29.5, 45.2, 28.5, 35.2, 33.6, 30.2, 7.3, 9.5, 14.7));
    add(makeRecord("DUBAI", "Dubai", "UAE", 25.25, 55.33, 5, 4,
                   46.2, 30.8, 44.9, 30.0, 35.8, 34.2, 31.2, 10.2, 12.0, 16.0));
    add(makeRecord("RIYADH", "Riyadh", "Saudi Arabia", 24.72, 46.73, 612, 3,
                   44.7, 23.2, 43.0, 22.4, 32.0, 31.0, 22.8, 3.2, 5.0, 9.5));
}

void DesignConditionsCatalog::initializeAfrica() {
    add(makeRecord("JOHANNESBURG", "Johannesburg", "South Africa", -26.13, 28.23, 1694, 2,
                   32.2, 19.3, 30.8, 18.8, 24.5, 23.0, 19.0, 1.4, 3.1, 8.5));
    add(makeRecord("CAPE TOWN", "Cape Town", "South Africa", -33.97, 18.60, 42, 2,
                   35.2, 21.0, 33.1, 20.4, 26.3, 24.8, 20.5, 4.8, 6.2, 11.5));
}

void DesignConditionsCatalog::initializeEurope() {
    add(makeRecord("LONDON", "London", "UK", 51.48, -0.45, 25, 0,
                   30.5, 21.0, 28.8, 20.2, 22.8, 21.0, 19.7, -3.5, -1.8, 4.0));
    add(makeRecord("FRANKFURT", "Frankfurt", "Germany", 50.03, 8.55, 113, 1,
                   33.2, 21.5, 31.2, 21.0, 23.8, 22.5, 20.5, -10.0, -7.5, 2.0));
}

void DesignConditionsCatalog::initializeAsiaPacific() {
    add(makeRecord("SINGAPORE", "Singapore", "Singapore", 1.37, 103.98, 16, 8,
                   34.0, 28.3, 33.1, 27.8, 30.1, 29.0, 28.1, 22.3, 22.8, 25.0));
    add(makeRecord("SYDNEY", "Sydney", "Australia", -33.95, 151.18, 6, 10,
                   37.8, 24.5, 35.9, 23.5, 28.0, 26.2, 23.8, 4.8, 6.3, 11.0));
    add(makeRecord("HONG KONG", "Hong Kong", "China", 22.32, 114.17, 9, 8,
                   34.5, 28.5, 33.3, 28.1, 30.0, 29.2, 28.3, 7.3, 8.8, 14.5));
    add(makeRecord("MUMBAI", "Mumbai", "India", 19.12, 72.85, 14, 5,
                   37.0, 29.8, 35.2, 29.0, 31.5, 30.5, 29.2, 14.5, 16.0, 20.0));
}

void DesignConditionsCatalog::initializeAmericas() {
    add(makeRecord("NEW YORK", "New York (JFK)", "USA", 40.63, -73.78, 9, -5,
                   33.9, 25.9, 32.6, 25.2, 28.0, 26.8, 25.4, -11.2, -8.9, 2.0));
    add(makeRecord("CHICAGO", "Chicago O'Hare", "USA", 41.98, -87.90, 204, -6,
                   34.4, 25.7, 32.6, 25.0, 28.1, 27.0, 25.2, -22.8, -19.2, -2.0));
}

void DesignConditionsCatalog::initializeCustom() {
    add(makeRecord(CUSTOM_KEY, "Custom Location", "", 0.0, 0.0, 0.0, 0,
                   45.0, 28.0, 40.0, 26.0, 32.0, 30.0, 26.0, 5.0, 8.0, 12.0));
}

} // namespace MASE
