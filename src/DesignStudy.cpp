#include "DesignStudy.hpp"
#include "PsychroError.hpp"
#include "IsoLineGenerator.hpp"
#include <cmath>
#include <fstream>

namespace MASE {

DesignStudy::DesignStudy(MPI_Comm comm_in)
    : comm(comm_in), catalog_(DesignConditionsCatalog::standard()) {
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);
}

// =============================================================================
// Initialization
// =============================================================================

PetscErrorCode DesignStudy::initializeFromConfigFile(const std::string& config_file) {
    PetscFunctionBeginUser;

    if (rank == 0) {
        PetscPrintf(comm, "Loading configuration from: %s\n", config_file.c_str());
    }

    ConfigReader reader;
    if (!reader.loadFile(config_file)) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Failed to load configuration file");
    }

    ConfigReader::ValidationResult validation = reader.validate();
    if (rank == 0) {
        for (const auto& w : validation.warnings) {
            PetscPrintf(comm, "  Warning: %s\n", w.c_str());
        }
        for (const auto& e : validation.errors) {
            PetscPrintf(comm, "  Error: %s\n", e.c_str());
        }
    }
    if (!validation.valid) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Invalid configuration file %s", config_file.c_str());
    }

    PetscErrorCode ierr = initialize(reader); CHKERRQ(ierr);
    PetscFunctionReturn(0);
}

PetscErrorCode DesignStudy::initialize(const ConfigReader& reader) {
    PetscFunctionBeginUser;

    try {
        reader.parseAtmosphereConfig(atmosphere_config_);
        reader.parseNumericSettings(numeric_settings_);
        numeric_settings_.validate();
        converter_ = PropertyConverter(numeric_settings_);

        catalog_ = reader.parseDesignCatalog(DesignConditionsCatalog::standard());
        location_key_ = reader.parseLocationKey();

        state_configs_ = reader.parseStates();
        off_coil_configs_ = reader.parseOffCoils();

        ConfigReader::SetpointConfig setpoints;
        if (reader.parseSetpointConfig(setpoints)) {
            setpoint_config_ = setpoints;
        }

        ConfigReader::SystemConfig system;
        if (reader.parseSystemConfig(system)) {
            system_config_ = system;
        }

        process_configs_ = reader.parseProcesses();
        mix_configs_ = reader.parseMixes();
        reader.parseChartConfig(chart_config_);
        reader.parseOutputConfig(output_config_);

        // Fail early on bad unit names rather than after the study has run
        ReportUnits check(output_config_.output_units);
        (void)check;
    } catch (const std::exception& e) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "%s", e.what());
    }

    if (rank == 0) {
        PetscPrintf(comm, "Configuration:\n");
        PetscPrintf(comm, "  Location:        %s\n",
                    location_key_.empty() ? "(none)" : location_key_.c_str());
        PetscPrintf(comm, "  States:          %d\n", static_cast<int>(state_configs_.size()));
        PetscPrintf(comm, "  Off-coil rules:  %d\n", static_cast<int>(off_coil_configs_.size()));
        PetscPrintf(comm, "  Processes:       %d\n", static_cast<int>(process_configs_.size()));
        PetscPrintf(comm, "  Mixes:           %d\n", static_cast<int>(mix_configs_.size()));
        PetscPrintf(comm, "  Solver:          tol %g, max %d iterations\n",
                    numeric_settings_.tolerance, numeric_settings_.max_iterations);
    }

    initialized_ = true;
    PetscFunctionReturn(0);
}

PetscErrorCode DesignStudy::setLocation(const std::string& key) {
    PetscFunctionBeginUser;
    if (!catalog_.contains(key)) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Unknown design location: %s", key.c_str());
    }
    location_key_ = key;
    PetscFunctionReturn(0);
}

PetscErrorCode DesignStudy::setAltitude(double altitude) {
    PetscFunctionBeginUser;
    if (!std::isfinite(altitude)) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Altitude must be finite");
    }
    altitude_override_ = altitude;
    PetscFunctionReturn(0);
}

PetscErrorCode DesignStudy::setOutputPrefix(const std::string& prefix) {
    PetscFunctionBeginUser;
    output_config_.prefix = prefix;
    PetscFunctionReturn(0);
}

// Pressure override, then altitude (command line, config, design location), then sea level
void DesignStudy::resolveContext() {
    if (atmosphere_config_.pressure) {
        context_ = AtmosphericContext::fromPressure(*atmosphere_config_.pressure);
    } else if (altitude_override_) {
        context_ = AtmosphericContext::fromAltitude(*altitude_override_);
    } else if (atmosphere_config_.altitude) {
        context_ = AtmosphericContext::fromAltitude(*atmosphere_config_.altitude);
    } else if (!location_key_.empty()) {
        context_ = AtmosphericContext::fromAltitude(catalog_.get(location_key_).altitude);
    } else {
        context_ = AtmosphericContext();
    }
}

// =============================================================================
// States
// =============================================================================

PetscErrorCode DesignStudy::resolveStates() {
    PetscFunctionBeginUser;

    if (!initialized_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "Design study not initialized");
    }

    try {
        resolveContext();
        const double p = context_.pressure();
        DerivationRules rules(converter_);

        // Outdoor design states
        if (!location_key_.empty()) {
            const DesignDayRecord& record = catalog_.get(location_key_);
            StateTable outdoor = DesignConditionsCatalog::designStates(record, p, converter_);
            for (const auto& entry : outdoor.entries()) {
                states_.add(entry.first, entry.second);
            }
        }

        // Explicit states
        for (const auto& sc : state_configs_) {
            states_.add(sc.label, AirState::fromDescriptors(sc.descriptors, p, converter_));
        }

        // Coil leaving states
        for (const auto& oc : off_coil_configs_) {
            OffCoilRequest request;
            request.pressure = p;
            request.relative_humidity = oc.relative_humidity;
            request.approach = oc.approach;
            if (!oc.reference_state.empty()) {
                request.coil_dew_point = states_.get(oc.reference_state).dewPoint();
            } else if (oc.dew_point) {
                request.coil_dew_point = *oc.dew_point;
            } else {
                throw InvalidInputError("Off-coil '" + oc.label +
                                        "' needs dew_point or reference_state");
            }
            states_.add(oc.label, rules.offCoil(request));
        }

        // AHU off-coil setpoints
        if (setpoint_config_) {
            const ConfigReader::SetpointConfig& sp = *setpoint_config_;
            OffCoilSetpointRequest request(states_.get(sp.crah_off_coil),
                                           states_.get(sp.crah_on_coil).dryBulb(),
                                           states_.get(sp.winter_state));
            request.cool_margin = sp.cool_margin;
            request.dehumidification_margin = sp.dehumidification_margin;
            request.target_enthalpy = sp.target_enthalpy;

            OffCoilSetpoints setpoints = rules.deriveOffCoilSetpoints(request);
            states_.add("OC Max Cool", setpoints.max_cooling);
            states_.add("OC Dehum", setpoints.dehumidification);
            states_.add("OC Enthalpy", setpoints.enthalpy_cooling);
            states_.add("OC Heat", setpoints.humidification_heating);
        }
    } catch (const std::exception& e) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "State resolution failed: %s", e.what());
    }

    states_resolved_ = true;

    if (rank == 0) {
        PetscPrintf(comm, "Atmosphere: %s\n", context_.describe().c_str());
        PetscPrintf(comm, "Resolved %d states\n", static_cast<int>(states_.size()));
    }

    PetscFunctionReturn(0);
}

// =============================================================================
// System flows
// =============================================================================

PetscErrorCode DesignStudy::computeSystemFlows() {
    PetscFunctionBeginUser;

    if (!states_resolved_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "States must be resolved before system flows");
    }
    if (!system_config_) {
        PetscFunctionReturn(0);
    }

    try {
        const ConfigReader::SystemConfig& sc = *system_config_;
        SystemFlowRequest request(sc.it_load, states_.get(sc.crah_on_coil),
                                  states_.get(sc.crah_off_coil), states_.get(sc.ahu_off_coil));
        request.auxiliary_load_factor = sc.auxiliary_load_factor;
        request.ahu_volume_flow = sc.ahu_volume_flow;
        request.ahu_flow_fraction = sc.ahu_flow_fraction;
        request.ahu_pressure_drop = sc.ahu_pressure_drop;

        DerivationRules rules(converter_);
        flows_ = rules.computeSystemFlows(request);
    } catch (const std::exception& e) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "System flow sizing failed: %s", e.what());
    }

    PetscFunctionReturn(0);
}

// =============================================================================
// Processes
// =============================================================================

double DesignStudy::processMassFlow(const ConfigReader::ProcessConfig& proc,
                                    const AirState& entering) const {
    if (proc.mass_flow) {
        return *proc.mass_flow;
    }
    if (proc.volume_flow) {
        return ProcessEvaluator::massFlowFromVolumeFlow(*proc.volume_flow, entering);
    }
    if (proc.flow_source == "AHU" || proc.flow_source == "CRAH") {
        if (!flows_) {
            throw InvalidInputError("Process '" + proc.name + "' uses " + proc.flow_source +
                                    " flow but no [SYSTEM] section is configured");
        }
        return proc.flow_source == "AHU" ? flows_->ahu_mass_flow : flows_->crah_mass_flow;
    }
    throw InvalidInputError("Process '" + proc.name + "' has no mass flow");
}

AirState DesignStudy::leavingState(const ConfigReader::ProcessConfig& proc,
                                   const AirState& entering, const DerivationRules& rules) {
    if (proc.to_dry_bulb) {
        if (states_.contains(proc.to)) {
            throw InvalidInputError("Process '" + proc.name + "' derives '" + proc.to +
                                    "', which is already defined");
        }
        AirState leaving = proc.sensible_heat_ratio
            ? rules.backSolveSensibleHeatRatio(SensibleHeatRatioRequest(
                  entering, KnownStateRole::ENTERING, *proc.to_dry_bulb, *proc.sensible_heat_ratio))
            : rules.heatingForHumidification(*proc.to_dry_bulb, entering);
        states_.add(proc.to, leaving);
        return leaving;
    }
    return states_.get(proc.to);
}

PetscErrorCode DesignStudy::evaluateProcesses() {
    PetscFunctionBeginUser;

    if (!states_resolved_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "States must be resolved before processes");
    }

    try {
        ProcessEvaluator evaluator(converter_);
        DerivationRules rules(converter_);

        // Mixed streams first, they may feed processes
        for (const auto& mix : mix_configs_) {
            states_.add(mix.label, evaluator.mix(states_.get(mix.stream_a), mix.mass_flow_a,
                                                 states_.get(mix.stream_b), mix.mass_flow_b));
        }

        for (const auto& proc : process_configs_) {
            const AirState entering = states_.get(proc.from);
            const AirState leaving = leavingState(proc, entering, rules);
            const double mass_flow = processMassFlow(proc, entering);
            process_log_.add(evaluator.evaluate(proc.name, entering, leaving, mass_flow),
                             proc.from, proc.to);
        }
    } catch (const std::exception& e) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Process evaluation failed: %s", e.what());
    }

    PetscFunctionReturn(0);
}

// =============================================================================
// Chart
// =============================================================================

PetscErrorCode DesignStudy::generateChart() {
    PetscFunctionBeginUser;

    chart_series_.clear();
    if (!chart_config_.enabled) {
        PetscFunctionReturn(0);
    }
    if (!states_resolved_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "States must be resolved before the chart");
    }

    ChartDomain domain = chart_config_.domain;
    domain.pressure = context_.pressure();

    IsoLineGenerator generator(converter_);
    std::vector<IsoLineSpec> specs;
    try {
        specs = generator.chartFamilySpecs(domain);
    } catch (const std::exception& e) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Invalid chart configuration: %s", e.what());
    }

    // Round-robin: line i belongs to rank i % size.
    // Packed as [index, npoints, t0, w0, t1, w1, ...] per owned line.
    std::vector<double> local;
    int local_error = 0;
    std::string error_message;
    for (size_t i = static_cast<size_t>(rank); i < specs.size(); i += static_cast<size_t>(size)) {
        try {
            std::vector<ChartPoint> points = generator.generate(specs[i]).points();
            local.push_back(static_cast<double>(i));
            local.push_back(static_cast<double>(points.size()));
            for (const auto& p : points) {
                local.push_back(p.dry_bulb);
                local.push_back(p.humidity_ratio);
            }
        } catch (const std::exception& e) {
            local_error = 1;
            error_message = e.what();
            break;
        }
    }

    // All ranks must agree before the collective gather
    int global_error = 0;
    MPI_Allreduce(&local_error, &global_error, 1, MPI_INT, MPI_MAX, comm);
    if (global_error) {
        if (local_error) {
            SETERRQ(PETSC_COMM_SELF, PETSC_ERR_NOT_CONVERGED, "Iso-line generation failed: %s",
                    error_message.c_str());
        }
        SETERRQ(PETSC_COMM_SELF, PETSC_ERR_NOT_CONVERGED,
                "Iso-line generation failed on another rank");
    }

    int local_count = static_cast<int>(local.size());
    std::vector<int> counts(rank == 0 ? size : 0);
    MPI_Gather(&local_count, 1, MPI_INT, counts.data(), 1, MPI_INT, 0, comm);

    std::vector<int> displs;
    std::vector<double> gathered;
    if (rank == 0) {
        displs.assign(size, 0);
        int total = 0;
        for (int r = 0; r < size; ++r) {
            displs[r] = total;
            total += counts[r];
        }
        gathered.resize(total);
    }
    MPI_Gatherv(local.data(), local_count, MPI_DOUBLE, gathered.data(), counts.data(),
                displs.data(), MPI_DOUBLE, 0, comm);

    if (rank == 0) {
        std::vector<PsychroChartViz::ChartSeries> ordered(specs.size());
        size_t pos = 0;
        while (pos < gathered.size()) {
            const size_t index = static_cast<size_t>(gathered[pos]);
            const size_t npoints = static_cast<size_t>(gathered[pos + 1]);
            pos += 2;

            PsychroChartViz::ChartSeries& series = ordered[index];
            series.kind = specs[index].kind;
            series.value = specs[index].value;
            series.label = specs[index].label.empty()
                ? IsoLineGenerator::defaultLabel(specs[index].kind, specs[index].value)
                : specs[index].label;
            series.points.reserve(npoints);
            for (size_t k = 0; k < npoints; ++k) {
                series.points.push_back(ChartPoint{gathered[pos], gathered[pos + 1]});
                pos += 2;
            }
        }
        chart_series_ = ordered;

        PetscPrintf(comm, "Generated %d iso-lines on %d rank(s)\n",
                    static_cast<int>(chart_series_.size()), size);
    }

    PetscFunctionReturn(0);
}

// =============================================================================
// Output
// =============================================================================

PetscErrorCode DesignStudy::writeOutput() {
    PetscFunctionBeginUser;

    if (rank != 0) PetscFunctionReturn(0);

    const std::string& prefix = output_config_.prefix;
    try {
        ReportUnits units(output_config_.output_units);

        if (output_config_.write_states) {
            states_.writeCSV(prefix + "_states.csv", units);
            PetscPrintf(comm, "  States:    %s_states.csv\n", prefix.c_str());
        }
        if (output_config_.write_processes) {
            process_log_.writeCSV(prefix + "_processes.csv", units);
            PetscPrintf(comm, "  Processes: %s_processes.csv\n", prefix.c_str());
        }
        if (flows_) {
            std::ofstream out(prefix + "_system.txt");
            if (!out) {
                throw std::runtime_error("Cannot open file: " + prefix + "_system.txt");
            }
            out << "System Flows\n";
            out << "============\n\n";
            out << "Sensible load [kW]:         " << flows_->sensible_load / 1000.0 << "\n";
            out << "CRAH mass flow [kg/s]:      " << flows_->crah_mass_flow << "\n";
            out << "CRAH volume flow [m3/s]:    " << flows_->crah_volume_flow << "\n";
            out << "AHU volume flow [m3/s]:     " << flows_->ahu_volume_flow << "\n";
            out << "AHU mass flow [kg/s]:       " << flows_->ahu_mass_flow << "\n";
            out << "Fan power [kW]:             " << flows_->fan_power / 1000.0 << "\n";
            out << "Fan temperature rise [K]:   " << flows_->fan_temperature_rise << "\n";
            PetscPrintf(comm, "  System:    %s_system.txt\n", prefix.c_str());
        }
        if (output_config_.write_chart && chart_config_.enabled) {
            PsychroChartViz viz("", units);
            viz.setTitle("Psychrometric Chart (" + context_.describe() + ")");
            viz.setDryBulbRange(chart_config_.domain.t_min, chart_config_.domain.t_max);
            for (const auto& series : chart_series_) {
                viz.addSeries(series);
            }
            viz.addStates(states_);
            viz.addProcesses(process_log_);
            std::string script = viz.writeChart(prefix + "_chart");
            PetscPrintf(comm, "  Chart:     %s\n", script.c_str());
        }
    } catch (const std::exception& e) {
        SETERRQ(PETSC_COMM_SELF, PETSC_ERR_FILE_WRITE, "%s", e.what());
    }

    PetscFunctionReturn(0);
}

PetscErrorCode DesignStudy::printSummary() {
    PetscFunctionBeginUser;

    if (rank != 0) PetscFunctionReturn(0);

    PetscPrintf(comm, "\n%-24s %8s %8s %8s %7s %8s %8s\n",
                "State", "Tdb[C]", "Twb[C]", "Tdp[C]", "RH[%]", "W[g/kg]", "h[kJ/kg]");
    for (const auto& entry : states_.entries()) {
        const AirState& s = entry.second;
        PetscPrintf(comm, "%-24s %8.2f %8.2f %8.2f %7.1f %8.3f %8.2f\n",
                    entry.first.c_str(), s.dryBulb(), s.wetBulb(), s.dewPoint(),
                    100.0 * s.relativeHumidity(), 1000.0 * s.humidityRatio(),
                    s.enthalpy() / 1000.0);
    }

    if (!process_log_.empty()) {
        PetscPrintf(comm, "\n%-28s %9s %10s %10s %10s %6s\n",
                    "Process", "m[kg/s]", "Qs[kW]", "Ql[kW]", "Qt[kW]", "SHR");
        for (const auto& entry : process_log_.entries()) {
            const ProcessResult& r = entry.result;
            if (r.sensible_heat_ratio) {
                PetscPrintf(comm, "%-28s %9.4f %10.2f %10.2f %10.2f %6.3f\n",
                            r.name.c_str(), r.mass_flow, r.sensible_heat / 1000.0,
                            r.latent_heat / 1000.0, r.total_heat / 1000.0,
                            *r.sensible_heat_ratio);
            } else {
                PetscPrintf(comm, "%-28s %9.4f %10.2f %10.2f %10.2f %6s\n",
                            r.name.c_str(), r.mass_flow, r.sensible_heat / 1000.0,
                            r.latent_heat / 1000.0, r.total_heat / 1000.0, "-");
            }
        }
    }

    if (flows_) {
        PetscPrintf(comm, "\nSystem flows:\n");
        PetscPrintf(comm, "  Sensible load:     %.1f kW\n", flows_->sensible_load / 1000.0);
        PetscPrintf(comm, "  CRAH flow:         %.2f kg/s (%.2f m3/s)\n",
                    flows_->crah_mass_flow, flows_->crah_volume_flow);
        PetscPrintf(comm, "  AHU flow:          %.4f kg/s (%.4f m3/s)\n",
                    flows_->ahu_mass_flow, flows_->ahu_volume_flow);
        PetscPrintf(comm, "  Fan power:         %.3f kW (rise %.3f K)\n",
                    flows_->fan_power / 1000.0, flows_->fan_temperature_rise);
    }
    PetscPrintf(comm, "\n");

    PetscFunctionReturn(0);
}

PetscErrorCode DesignStudy::run() {
    PetscFunctionBeginUser;

    PetscErrorCode ierr;

    ierr = resolveStates(); CHKERRQ(ierr);
    ierr = computeSystemFlows(); CHKERRQ(ierr);
    ierr = evaluateProcesses(); CHKERRQ(ierr);
    ierr = generateChart(); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

} // namespace MASE
