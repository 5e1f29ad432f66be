#include "PsychroChartViz.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <stdexcept>
#include <sys/stat.h>

namespace MASE {

PsychroChartViz::PsychroChartViz(const std::string& output_dir, const ReportUnits& units)
    : output_dir_(output_dir), units_(units) {}

void PsychroChartViz::ensureOutputDir() const {
    if (output_dir_.empty()) return;
    if (mkdir(output_dir_.c_str(), 0755) != 0 && errno != EEXIST) {
        throw std::runtime_error("Cannot create output directory " + output_dir_ + ": " +
                                 std::strerror(errno));
    }
}

std::string PsychroChartViz::path(const std::string& filename) const {
    return output_dir_.empty() ? filename : output_dir_ + "/" + filename;
}

std::string PsychroChartViz::getLineStyle(IsoLineKind kind) const {
    switch (kind) {
        case IsoLineKind::SATURATION:
            return "lc rgb '#000000' lw 2.5";
        case IsoLineKind::RELATIVE_HUMIDITY:
            return "lc rgb '#969696' lw 1 dt 3";
        case IsoLineKind::ENTHALPY:
            return "lc rgb '#64b4ff' lw 1 dt 2";
        case IsoLineKind::WET_BULB:
            return "lc rgb '#c8c864' lw 1 dt 4";
    }
    return "lc rgb '#000000'";
}

// =============================================================================
// Content
// =============================================================================

void PsychroChartViz::addSeries(const ChartSeries& series) {
    series_.push_back(series);
}

void PsychroChartViz::addIsoLine(const IsoLine& line) {
    ChartSeries series;
    series.kind = line.kind();
    series.value = line.value();
    series.label = line.label();
    series.points = line.points();
    series_.push_back(series);
}

void PsychroChartViz::addStates(const StateTable& states) {
    for (const auto& entry : states.entries()) {
        states_.push_back(StateMarker{entry.first, entry.second.dryBulb(),
                                      entry.second.humidityRatio()});
    }
}

void PsychroChartViz::addProcesses(const ProcessLog& log) {
    for (const auto& entry : log.entries()) {
        const ProcessResult& r = entry.result;
        if (!r.entering_state || !r.leaving_state) continue;
        processes_.push_back(ProcessArrow{
            r.name,
            ChartPoint{r.entering_state->dryBulb(), r.entering_state->humidityRatio()},
            ChartPoint{r.leaving_state->dryBulb(), r.leaving_state->humidityRatio()}});
    }
}

void PsychroChartViz::setDryBulbRange(double t_min, double t_max) {
    if (!(t_min < t_max)) {
        throw std::runtime_error("Chart dry-bulb range must be increasing");
    }
    t_min_ = t_min;
    t_max_ = t_max;
    has_range_ = true;
}

// =============================================================================
// Output
// =============================================================================

std::string PsychroChartViz::writeChart(const std::string& name) const {
    ensureOutputDir();

    auto x = [&](double t) { return units_.convert(t, "temperature"); };
    auto y = [&](double w) { return units_.convert(w, "humidity_ratio"); };

    // Iso-lines, one gnuplot index block each
    std::vector<const ChartSeries*> written;
    double y_max = 0.0;
    {
        std::ofstream data(path(name + "_lines.dat"));
        if (!data) {
            throw std::runtime_error("Cannot open file: " + path(name + "_lines.dat"));
        }
        data << std::setprecision(8);
        for (const auto& s : series_) {
            if (s.points.empty()) continue;
            if (!written.empty()) data << "\n\n";
            data << "# " << toString(s.kind) << " " << s.value << " " << s.label << "\n";
            for (const auto& p : s.points) {
                data << x(p.dry_bulb) << " " << y(p.humidity_ratio) << "\n";
                if (s.kind == IsoLineKind::SATURATION) {
                    y_max = std::max(y_max, y(p.humidity_ratio));
                }
            }
            written.push_back(&s);
        }
    }

    {
        std::ofstream data(path(name + "_states.dat"));
        if (!data) {
            throw std::runtime_error("Cannot open file: " + path(name + "_states.dat"));
        }
        data << std::setprecision(8);
        data << "# Tdb W label\n";
        for (const auto& m : states_) {
            data << x(m.dry_bulb) << " " << y(m.humidity_ratio) << " \"" << m.label << "\"\n";
        }
    }

    {
        std::ofstream data(path(name + "_processes.dat"));
        if (!data) {
            throw std::runtime_error("Cannot open file: " + path(name + "_processes.dat"));
        }
        data << std::setprecision(8);
        data << "# Tdb W dTdb dW name\n";
        for (const auto& p : processes_) {
            data << x(p.from.dry_bulb) << " " << y(p.from.humidity_ratio) << " "
                 << x(p.to.dry_bulb) - x(p.from.dry_bulb) << " "
                 << y(p.to.humidity_ratio) - y(p.from.humidity_ratio)
                 << " \"" << p.name << "\"\n";
        }
    }

    // Create gnuplot script
    std::string script_file = path(name + ".gp");
    std::ofstream script(script_file);
    if (!script) {
        throw std::runtime_error("Cannot open file: " + script_file);
    }

    script << "set terminal pngcairo size 1400,900 enhanced font 'Arial,12'\n";
    script << "set output '" << name << ".png'\n\n";

    script << "set title '" << title_ << "' font 'Arial,16'\n";
    script << "set xlabel 'Dry-bulb temperature [" << units_.unitFor("temperature")
           << "]' font 'Arial,14'\n";
    script << "set ylabel 'Humidity ratio [" << units_.unitFor("humidity_ratio")
           << "]' font 'Arial,14'\n";
    script << "set y2tics\n";
    script << "set grid\n";
    script << "set key outside right\n\n";

    if (has_range_) {
        script << "set xrange [" << x(t_min_) << ":" << x(t_max_) << "]\n";
    }
    if (y_max > 0.0) {
        script << "set yrange [0:" << y_max << "]\n";
    }
    script << "\n";

    script << "plot ";
    bool first = true;
    auto next = [&]() {
        if (!first) script << ", \\\n     ";
        first = false;
    };
    for (size_t i = 0; i < written.size(); ++i) {
        next();
        script << "'" << name << "_lines.dat' index " << i << " using 1:2 with lines "
               << getLineStyle(written[i]->kind);
        if (written[i]->kind == IsoLineKind::SATURATION) {
            script << " title 'Saturation'";
        } else {
            script << " notitle";
        }
    }
    if (!processes_.empty()) {
        next();
        script << "'" << name << "_processes.dat' using 1:2:3:4 with vectors head filled "
               << "lc rgb '#e74c3c' lw 2 title 'Processes'";
    }
    if (!states_.empty()) {
        next();
        script << "'" << name << "_states.dat' using 1:2 with points pt 7 ps 1.2 "
               << "lc rgb '#0066cc' title 'States'";
        script << ", \\\n     '" << name << "_states.dat' using 1:2:3 with labels "
               << "offset char 1,0.5 left font 'Arial,10' notitle";
    }
    if (first) {
        // Nothing to draw; keep the script valid
        script << "NaN notitle";
    }
    script << "\n";
    script.close();

    return script_file;
}

bool PsychroChartViz::render(const std::string& name) const {
    std::string dir = output_dir_.empty() ? "." : output_dir_;
    std::string cmd = "cd '" + dir + "' && gnuplot '" + name + ".gp' 2>/dev/null";
    return std::system(cmd.c_str()) == 0;
}

} // namespace MASE
