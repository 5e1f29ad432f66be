#ifndef ISO_LINE_GENERATOR_HPP
#define ISO_LINE_GENERATOR_HPP

#include "MASE.hpp"
#include "AtmosphericModel.hpp"
#include "MoistAirProperties.hpp"
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace MASE {

/**
 * @brief One chart coordinate: dry-bulb (x) and humidity ratio (y)
 */
struct ChartPoint {
    double dry_bulb;            // degC
    double humidity_ratio;      // kg/kg
};

/**
 * @brief Parameters of one iso-line
 *
 * steps is the number of dry-bulb intervals, so a fully feasible line
 * has steps + 1 points. value is ignored for SATURATION.
 */
struct IsoLineSpec {
    IsoLineKind kind = IsoLineKind::SATURATION;
    double value = 0.0;                             // fraction, J/kg or degC
    double t_min = 0.0;                             // degC
    double t_max = 50.0;                            // degC
    int steps = 100;
    double pressure = AtmosphereConstants::P0_STD;  // Pa
    std::string label;
};

/**
 * @brief Lazily evaluated iso-line
 *
 * Iterating resolves one sample per increment. begin() always restarts
 * from the first sample, and the same spec always yields the same points.
 *
 * Edge policy: samples before the first feasible one are skipped; once a
 * feasible point has been produced, the line ends at the next infeasible
 * sample. A line with no feasible sample is empty, which is not an error.
 * Convergence failures are not infeasibility and propagate to the caller.
 *
 * Iterators share ownership of the spec and converter, so they stay valid
 * after the IsoLine they came from is destroyed.
 */
class IsoLine {
    struct Source;

public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ChartPoint;
        using difference_type = std::ptrdiff_t;
        using pointer = const ChartPoint*;
        using reference = const ChartPoint&;

        const_iterator() = default;

        reference operator*() const { return point_; }
        pointer operator->() const { return &point_; }

        const_iterator& operator++();
        const_iterator operator++(int);

        bool operator==(const const_iterator& other) const;
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        friend class IsoLine;
        const_iterator(std::shared_ptr<const Source> source, int index, const ChartPoint& point);

        std::shared_ptr<const Source> source_;  // null marks the end
        int index_ = -1;
        ChartPoint point_{0.0, 0.0};
    };

    IsoLine(const IsoLineSpec& spec, const PropertyConverter& converter);

    const_iterator begin() const;
    const_iterator end() const { return const_iterator(); }

    // Materialize the whole line
    std::vector<ChartPoint> points() const;
    bool empty() const { return begin() == end(); }

    IsoLineKind kind() const { return spec().kind; }
    double value() const { return spec().value; }
    const std::string& label() const { return spec().label; }
    const IsoLineSpec& spec() const;

    double sampleDryBulb(int index) const;

private:
    std::shared_ptr<const Source> source_;
};

/**
 * @brief Dry-bulb window and value lists for a standard chart family
 */
struct ChartDomain {
    double t_min = -10.0;                           // degC
    double t_max = 50.0;                            // degC
    int steps = 120;
    double pressure = AtmosphereConstants::P0_STD;  // Pa
    std::vector<double> rh_values = {0.1, 0.2, 0.3, 0.4, 0.5, 0.6, 0.7, 0.8, 0.9};
    std::vector<double> enthalpy_values = {0.0, 10000.0, 20000.0, 30000.0, 40000.0, 50000.0,
                                           60000.0, 70000.0, 80000.0, 90000.0, 100000.0};
    std::vector<double> wet_bulb_values = {0.0, 5.0, 10.0, 15.0, 20.0, 25.0, 30.0};
};

/**
 * @brief Builds validated iso-lines and chart families
 */
class IsoLineGenerator {
public:
    IsoLineGenerator();
    explicit IsoLineGenerator(const PropertyConverter& converter);

    // Throws InvalidInputError for a malformed spec
    IsoLine generate(const IsoLineSpec& spec) const;

    IsoLine generate(IsoLineKind kind, double value, double t_min, double t_max,
                     int steps, double pressure) const;

    // Uniform spacing no wider than step_size, last sample exactly at t_max
    IsoLine generateWithStepSize(IsoLineKind kind, double value, double t_min, double t_max,
                                 double step_size, double pressure) const;

    /**
     * @brief Saturation curve, RH lines, enthalpy lines and wet-bulb lines
     *
     * Lines are returned in that order, each in the order of its value list.
     */
    std::vector<IsoLine> chartFamily(const ChartDomain& domain) const;

    // Flattened specs of chartFamily(), in the same order
    std::vector<IsoLineSpec> chartFamilySpecs(const ChartDomain& domain) const;

    static std::string defaultLabel(IsoLineKind kind, double value);

private:
    void validate(const IsoLineSpec& spec) const;

    PropertyConverter converter_;
};

} // namespace MASE

#endif // ISO_LINE_GENERATOR_HPP
