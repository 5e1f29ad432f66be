#ifndef DESIGN_STUDY_HPP
#define DESIGN_STUDY_HPP

#include "MASE.hpp"
#include "ConfigReader.hpp"
#include "AtmosphericModel.hpp"
#include "DerivationRules.hpp"
#include "ProcessEvaluator.hpp"
#include "StateTable.hpp"
#include "PsychroChartViz.hpp"
#include <petsc.h>
#include <optional>
#include <string>
#include <vector>

namespace MASE {

/**
 * @brief Batch design study driven by a configuration file
 *
 * Steps, in order: resolve labeled states (design-day catalog, [STATE],
 * [OFFCOIL], [SETPOINTS]), size system flows, evaluate mixes and
 * processes, generate the chart family, write output.
 *
 * Every rank resolves states and processes redundantly; iso-lines are
 * distributed round-robin and gathered on rank 0, which alone writes files.
 * Engine exceptions are turned into PETSc errors at this boundary.
 */
class DesignStudy {
public:
    explicit DesignStudy(MPI_Comm comm);
    ~DesignStudy() = default;

    // Initialization
    PetscErrorCode initializeFromConfigFile(const std::string& config_file);
    PetscErrorCode initialize(const ConfigReader& reader);

    // Command-line overrides, applied before resolveStates()
    PetscErrorCode setLocation(const std::string& key);
    PetscErrorCode setAltitude(double altitude);
    PetscErrorCode setOutputPrefix(const std::string& prefix);

    // Study steps
    PetscErrorCode resolveStates();
    PetscErrorCode computeSystemFlows();
    PetscErrorCode evaluateProcesses();
    PetscErrorCode generateChart();
    PetscErrorCode writeOutput();
    PetscErrorCode printSummary();

    // All steps in order
    PetscErrorCode run();

    // Results
    const StateTable& states() const { return states_; }
    const ProcessLog& processes() const { return process_log_; }
    const std::optional<SystemFlows>& systemFlows() const { return flows_; }
    const std::vector<PsychroChartViz::ChartSeries>& chartSeries() const { return chart_series_; }
    double pressure() const { return context_.pressure(); }
    const std::string& outputPrefix() const { return output_config_.prefix; }

private:
    MPI_Comm comm;
    int rank, size;

    // Configuration
    ConfigReader::AtmosphereConfig atmosphere_config_;
    std::optional<double> altitude_override_;
    NumericSettings numeric_settings_;
    std::string location_key_;
    DesignConditionsCatalog catalog_;
    std::vector<ConfigReader::StateConfig> state_configs_;
    std::vector<ConfigReader::OffCoilConfig> off_coil_configs_;
    std::optional<ConfigReader::SetpointConfig> setpoint_config_;
    std::vector<ConfigReader::ProcessConfig> process_configs_;
    std::vector<ConfigReader::MixConfig> mix_configs_;
    ConfigReader::ChartConfig chart_config_;
    std::optional<ConfigReader::SystemConfig> system_config_;
    ConfigReader::OutputConfig output_config_;

    // Engine
    AtmosphericContext context_;
    PropertyConverter converter_;

    // Results
    StateTable states_;
    ProcessLog process_log_;
    std::optional<SystemFlows> flows_;
    std::vector<PsychroChartViz::ChartSeries> chart_series_;

    bool initialized_ = false;
    bool states_resolved_ = false;

    // Helpers
    void resolveContext();
    double processMassFlow(const ConfigReader::ProcessConfig& proc, const AirState& entering) const;
    AirState leavingState(const ConfigReader::ProcessConfig& proc, const AirState& entering,
                          const DerivationRules& rules);
};

} // namespace MASE

#endif // DESIGN_STUDY_HPP
