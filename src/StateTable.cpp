#include "StateTable.hpp"
#include "UnitSystem.hpp"
#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>

namespace MASE {

namespace {

std::string csvField(const std::string& text) {
    if (text.find_first_of(",\"\n") == std::string::npos) {
        return text;
    }
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string column(const std::string& name, const ReportUnits& units,
                   const std::string& quantity) {
    return name + " [" + units.unitFor(quantity) + "]";
}

} // namespace

// =============================================================================
// ReportUnits
// =============================================================================

const std::vector<std::string>& ReportUnits::quantities() {
    static const std::vector<std::string> names = {
        "temperature", "humidity_ratio", "relative_humidity", "enthalpy",
        "specific_volume", "density", "specific_heat", "pressure",
        "mass_flow", "volume_flow", "heat", "moisture_rate"
    };
    return names;
}

ReportUnits::ReportUnits() {
    const UnitSystem& us = UnitSystemManager::getInstance();
    for (const auto& quantity : quantities()) {
        units_[quantity] = us.getSuggestedDisplayUnit(quantity);
    }
}

ReportUnits::ReportUnits(const std::map<std::string, std::string>& overrides) : ReportUnits() {
    const UnitSystem& us = UnitSystemManager::getInstance();
    for (const auto& pair : overrides) {
        auto it = units_.find(pair.first);
        if (it == units_.end()) {
            throw std::runtime_error("Unknown output quantity: " + pair.first);
        }
        const Unit* requested = us.getUnit(pair.second);
        if (!requested) {
            throw std::runtime_error("Unknown unit '" + pair.second + "' for " + pair.first);
        }
        const Unit* reference = us.getUnit(it->second);
        if (!us.areCompatible(it->second, pair.second) ||
            requested->category != reference->category) {
            throw std::runtime_error("Unit '" + pair.second + "' cannot express " + pair.first);
        }
        it->second = pair.second;
    }
}

const std::string& ReportUnits::unitFor(const std::string& quantity) const {
    auto it = units_.find(quantity);
    if (it == units_.end()) {
        throw std::runtime_error("Unknown output quantity: " + quantity);
    }
    return it->second;
}

double ReportUnits::convert(double si_value, const std::string& quantity) const {
    return fromBaseUnits(si_value, unitFor(quantity));
}

// =============================================================================
// StateTable
// =============================================================================

void StateTable::add(const std::string& label, const AirState& state) {
    for (auto& entry : entries_) {
        if (entry.first == label) {
            entry.second = state;
            return;
        }
    }
    entries_.emplace_back(label, state);
}

bool StateTable::contains(const std::string& label) const {
    for (const auto& entry : entries_) {
        if (entry.first == label) return true;
    }
    return false;
}

const AirState& StateTable::get(const std::string& label) const {
    for (const auto& entry : entries_) {
        if (entry.first == label) return entry.second;
    }
    throw std::runtime_error("Unknown state label: " + label);
}

std::optional<AirState> StateTable::find(const std::string& label) const {
    for (const auto& entry : entries_) {
        if (entry.first == label) return entry.second;
    }
    return std::nullopt;
}

std::vector<std::string> StateTable::labels() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

void StateTable::writeCSV(std::ostream& os, const ReportUnits& units) const {
    os << "label"
       << "," << column("Tdb", units, "temperature")
       << "," << column("Twb", units, "temperature")
       << "," << column("Tdp", units, "temperature")
       << "," << column("RH", units, "relative_humidity")
       << "," << column("W", units, "humidity_ratio")
       << "," << column("h", units, "enthalpy")
       << "," << column("v", units, "specific_volume")
       << "," << column("rho", units, "density")
       << "," << column("cp", units, "specific_heat")
       << "," << column("P", units, "pressure")
       << "\n";

    os << std::setprecision(8);
    for (const auto& entry : entries_) {
        const AirState& s = entry.second;
        os << csvField(entry.first)
           << "," << units.convert(s.dryBulb(), "temperature")
           << "," << units.convert(s.wetBulb(), "temperature")
           << "," << units.convert(s.dewPoint(), "temperature")
           << "," << units.convert(s.relativeHumidity(), "relative_humidity")
           << "," << units.convert(s.humidityRatio(), "humidity_ratio")
           << "," << units.convert(s.enthalpy(), "enthalpy")
           << "," << units.convert(s.specificVolume(), "specific_volume")
           << "," << units.convert(s.density(), "density")
           << "," << units.convert(s.specificHeat(), "specific_heat")
           << "," << units.convert(s.pressure(), "pressure")
           << "\n";
    }
}

void StateTable::writeCSV(const std::string& filename, const ReportUnits& units) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    writeCSV(file, units);
}

// =============================================================================
// ProcessLog
// =============================================================================

void ProcessLog::add(const ProcessResult& result, const std::string& from_label,
                     const std::string& to_label) {
    entries_.push_back(ProcessLogEntry{from_label, to_label, result});
}

double ProcessLog::totalHeat() const {
    double sum = 0.0;
    for (const auto& entry : entries_) {
        sum += entry.result.total_heat;
    }
    return sum;
}

void ProcessLog::writeCSV(std::ostream& os, const ReportUnits& units) const {
    os << "process,from,to"
       << "," << column("mass_flow", units, "mass_flow")
       << "," << column("sensible", units, "heat")
       << "," << column("latent", units, "heat")
       << "," << column("total", units, "heat")
       << "," << column("moisture", units, "moisture_rate")
       << ",SHR\n";

    os << std::setprecision(8);
    for (const auto& entry : entries_) {
        const ProcessResult& r = entry.result;
        os << csvField(r.name) << "," << csvField(entry.from_label)
           << "," << csvField(entry.to_label)
           << "," << units.convert(r.mass_flow, "mass_flow")
           << "," << units.convert(r.sensible_heat, "heat")
           << "," << units.convert(r.latent_heat, "heat")
           << "," << units.convert(r.total_heat, "heat")
           << "," << units.convert(r.moisture_rate, "moisture_rate")
           << ",";
        if (r.sensible_heat_ratio) {
            os << *r.sensible_heat_ratio;
        }
        os << "\n";
    }
}

void ProcessLog::writeCSV(const std::string& filename, const ReportUnits& units) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    writeCSV(file, units);
}

} // namespace MASE
