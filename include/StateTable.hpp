#ifndef STATE_TABLE_HPP
#define STATE_TABLE_HPP

/**
 * @file StateTable.hpp
 * @brief Labeled design states and ordered process results for reporting
 *
 * Both containers keep insertion order, which is the order the report
 * collaborator lists them in. CSV output converts from the engine's SI
 * values through the UnitSystem at write time only.
 */

#include "AirState.hpp"
#include "ProcessEvaluator.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <iosfwd>

namespace MASE {

/**
 * @brief Per-quantity output units
 *
 * Quantities: temperature, humidity_ratio, relative_humidity, enthalpy,
 * specific_volume, density, specific_heat, pressure, mass_flow,
 * volume_flow, heat, moisture_rate. Unset quantities use the UnitSystem's
 * suggested display unit.
 */
class ReportUnits {
public:
    ReportUnits();

    /**
     * @param overrides quantity -> unit symbol
     * @throws std::runtime_error for an unknown quantity or unit, or a unit
     *         whose dimension does not match the quantity
     */
    explicit ReportUnits(const std::map<std::string, std::string>& overrides);

    const std::string& unitFor(const std::string& quantity) const;

    // SI value of a quantity expressed in its output unit
    double convert(double value_si, const std::string& quantity) const;

    static const std::vector<std::string>& quantities();

private:
    std::map<std::string, std::string> units_;
};

// =============================================================================
// StateTable
// =============================================================================

class StateTable {
public:
    StateTable() = default;

    // Adds a state; an existing label is replaced in place
    void add(const std::string& label, const AirState& state);

    bool contains(const std::string& label) const;

    // @throws std::runtime_error for an unknown label
    const AirState& get(const std::string& label) const;

    std::optional<AirState> find(const std::string& label) const;

    std::vector<std::string> labels() const;
    const std::vector<std::pair<std::string, AirState>>& entries() const { return entries_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    void writeCSV(std::ostream& os, const ReportUnits& units = ReportUnits()) const;

    // @throws std::runtime_error if the file cannot be opened
    void writeCSV(const std::string& filename, const ReportUnits& units = ReportUnits()) const;

private:
    std::vector<std::pair<std::string, AirState>> entries_;
};

// =============================================================================
// ProcessLog
// =============================================================================

struct ProcessLogEntry {
    std::string from_label;
    std::string to_label;
    ProcessResult result;
};

class ProcessLog {
public:
    ProcessLog() = default;

    void add(const ProcessResult& result, const std::string& from_label = "",
             const std::string& to_label = "");

    const std::vector<ProcessLogEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Sum of total heat over all entries, W
    double totalHeat() const;

    void writeCSV(std::ostream& os, const ReportUnits& units = ReportUnits()) const;
    void writeCSV(const std::string& filename, const ReportUnits& units = ReportUnits()) const;

private:
    std::vector<ProcessLogEntry> entries_;
};

} // namespace MASE

#endif // STATE_TABLE_HPP
