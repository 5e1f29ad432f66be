#ifndef PSYCHRO_CHART_VIZ_HPP
#define PSYCHRO_CHART_VIZ_HPP

#include "IsoLineGenerator.hpp"
#include "StateTable.hpp"
#include <vector>
#include <string>

namespace MASE {

/**
 * @brief Psychrometric chart export for gnuplot
 *
 * Writes plain data files plus a gnuplot script:
 * - <name>_lines.dat: one indexed block per iso-line, headed by
 *   "# KIND value label"
 * - <name>_states.dat: state markers with quoted labels
 * - <name>_processes.dat: process arrows (Tdb, W, dTdb, dW)
 * - <name>.gp: script rendering <name>.png
 *
 * Axes are dry-bulb and humidity ratio in the report units.
 */
class PsychroChartViz {
public:
    /**
     * @brief Materialized iso-line with its metadata
     */
    struct ChartSeries {
        IsoLineKind kind = IsoLineKind::SATURATION;
        double value = 0.0;
        std::string label;
        std::vector<ChartPoint> points;
    };

    struct StateMarker {
        std::string label;
        double dry_bulb;
        double humidity_ratio;
    };

    struct ProcessArrow {
        std::string name;
        ChartPoint from;
        ChartPoint to;
    };

    explicit PsychroChartViz(const std::string& output_dir = "output",
                             const ReportUnits& units = ReportUnits());

    void addSeries(const ChartSeries& series);
    void addIsoLine(const IsoLine& line);
    void addStates(const StateTable& states);

    // Entries without both states are skipped
    void addProcesses(const ProcessLog& log);

    void setTitle(const std::string& title) { title_ = title; }
    void setDryBulbRange(double t_min, double t_max);

    const std::vector<ChartSeries>& series() const { return series_; }
    const std::vector<StateMarker>& states() const { return states_; }
    const std::vector<ProcessArrow>& processes() const { return processes_; }

    /**
     * @brief Write data files and script
     * @return Path of the gnuplot script
     * @throws std::runtime_error if a file cannot be written
     */
    std::string writeChart(const std::string& name) const;

    /**
     * @brief Run gnuplot on a written script
     * @return true if gnuplot exited successfully
     */
    bool render(const std::string& name) const;

    void setOutputDir(const std::string& dir) { output_dir_ = dir; }
    const std::string& outputDir() const { return output_dir_; }

private:
    std::string output_dir_;
    ReportUnits units_;
    std::string title_ = "Psychrometric Chart";
    double t_min_ = -10.0;
    double t_max_ = 50.0;
    bool has_range_ = false;

    std::vector<ChartSeries> series_;
    std::vector<StateMarker> states_;
    std::vector<ProcessArrow> processes_;

    void ensureOutputDir() const;
    std::string path(const std::string& filename) const;
    std::string getLineStyle(IsoLineKind kind) const;
};

} // namespace MASE

#endif // PSYCHRO_CHART_VIZ_HPP
