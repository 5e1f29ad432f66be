#include "IsoLineGenerator.hpp"
#include "PsychroError.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace MASE {

// =============================================================================
// IsoLine
// =============================================================================

struct IsoLine::Source {
    IsoLineSpec spec;
    PropertyConverter converter;

    double sampleDryBulb(int index) const;
    std::optional<ChartPoint> sample(int index) const;
};

double IsoLine::Source::sampleDryBulb(int index) const {
    if (index >= spec.steps) {
        return spec.t_max;
    }
    return spec.t_min + (spec.t_max - spec.t_min) * static_cast<double>(index) / spec.steps;
}

std::optional<ChartPoint> IsoLine::Source::sample(int index) const {
    const double tdb = sampleDryBulb(index);

    StateInput input;
    switch (spec.kind) {
        case IsoLineKind::SATURATION:
            input = StateInput::dryBulbRelativeHumidity(tdb, 1.0);
            break;
        case IsoLineKind::RELATIVE_HUMIDITY:
            input = StateInput::dryBulbRelativeHumidity(tdb, spec.value);
            break;
        case IsoLineKind::ENTHALPY:
            input = StateInput::dryBulbEnthalpy(tdb, spec.value);
            break;
        case IsoLineKind::WET_BULB:
            input = StateInput::dryBulbWetBulb(tdb, spec.value);
            break;
    }

    try {
        PropertySet props = converter.resolve(input, spec.pressure);
        return ChartPoint{tdb, props.humidity_ratio};
    } catch (const InvalidInputError&) {
        // Infeasible sample: outside the line's physical domain
        return std::nullopt;
    }
}

IsoLine::const_iterator::const_iterator(std::shared_ptr<const Source> source, int index,
                                        const ChartPoint& point)
    : source_(std::move(source)), index_(index), point_(point) {}

IsoLine::const_iterator& IsoLine::const_iterator::operator++() {
    if (!source_) {
        return *this;
    }
    int next = index_ + 1;
    std::optional<ChartPoint> p;
    if (next <= source_->spec.steps) {
        p = source_->sample(next);
    }
    if (p) {
        index_ = next;
        point_ = *p;
    } else {
        *this = const_iterator();
    }
    return *this;
}

IsoLine::const_iterator IsoLine::const_iterator::operator++(int) {
    const_iterator previous = *this;
    ++(*this);
    return previous;
}

bool IsoLine::const_iterator::operator==(const const_iterator& other) const {
    if (!source_ || !other.source_) {
        return source_ == other.source_;
    }
    return source_ == other.source_ && index_ == other.index_;
}

IsoLine::IsoLine(const IsoLineSpec& spec, const PropertyConverter& converter)
    : source_(std::make_shared<const Source>(Source{spec, converter})) {}

const IsoLineSpec& IsoLine::spec() const {
    return source_->spec;
}

double IsoLine::sampleDryBulb(int index) const {
    return source_->sampleDryBulb(index);
}

IsoLine::const_iterator IsoLine::begin() const {
    for (int i = 0; i <= source_->spec.steps; ++i) {
        std::optional<ChartPoint> p = source_->sample(i);
        if (p) {
            return const_iterator(source_, i, *p);
        }
    }
    return end();
}

std::vector<ChartPoint> IsoLine::points() const {
    std::vector<ChartPoint> result;
    result.reserve(static_cast<size_t>(source_->spec.steps) + 1);
    for (const ChartPoint& p : *this) {
        result.push_back(p);
    }
    return result;
}

// =============================================================================
// IsoLineGenerator
// =============================================================================

IsoLineGenerator::IsoLineGenerator() : converter_() {}

IsoLineGenerator::IsoLineGenerator(const PropertyConverter& converter) : converter_(converter) {}

void IsoLineGenerator::validate(const IsoLineSpec& spec) const {
    if (!std::isfinite(spec.t_min) || !std::isfinite(spec.t_max) || spec.t_min >= spec.t_max) {
        throw InvalidInputError("Iso-line dry-bulb domain must satisfy t_min < t_max");
    }
    if (spec.steps < 1) {
        throw InvalidInputError("Iso-line needs at least one step");
    }
    if (!std::isfinite(spec.pressure) || spec.pressure <= 0.0) {
        throw InvalidInputError("Iso-line pressure must be finite and positive");
    }
    if (spec.kind != IsoLineKind::SATURATION && !std::isfinite(spec.value)) {
        throw InvalidInputError("Iso-line value must be finite");
    }
    if (spec.kind == IsoLineKind::RELATIVE_HUMIDITY && (spec.value < 0.0 || spec.value > 1.0)) {
        throw InvalidInputError("Relative-humidity line value must be within [0, 1]");
    }
}

IsoLine IsoLineGenerator::generate(const IsoLineSpec& spec) const {
    validate(spec);
    IsoLineSpec s = spec;
    if (s.label.empty()) {
        s.label = defaultLabel(s.kind, s.value);
    }
    return IsoLine(s, converter_);
}

IsoLine IsoLineGenerator::generate(IsoLineKind kind, double value, double t_min, double t_max,
                                   int steps, double pressure) const {
    IsoLineSpec spec;
    spec.kind = kind;
    spec.value = value;
    spec.t_min = t_min;
    spec.t_max = t_max;
    spec.steps = steps;
    spec.pressure = pressure;
    return generate(spec);
}

IsoLine IsoLineGenerator::generateWithStepSize(IsoLineKind kind, double value, double t_min,
                                               double t_max, double step_size,
                                               double pressure) const {
    if (!std::isfinite(step_size) || step_size <= 0.0) {
        throw InvalidInputError("Iso-line step size must be finite and positive");
    }
    if (!std::isfinite(t_min) || !std::isfinite(t_max) || t_min >= t_max) {
        throw InvalidInputError("Iso-line dry-bulb domain must satisfy t_min < t_max");
    }
    int steps = static_cast<int>(std::ceil((t_max - t_min) / step_size - 1e-9));
    return generate(kind, value, t_min, t_max, std::max(steps, 1), pressure);
}

std::vector<IsoLineSpec> IsoLineGenerator::chartFamilySpecs(const ChartDomain& domain) const {
    std::vector<IsoLineSpec> specs;

    auto add = [&](IsoLineKind kind, double value) {
        IsoLineSpec spec;
        spec.kind = kind;
        spec.value = value;
        spec.t_min = domain.t_min;
        spec.t_max = domain.t_max;
        spec.steps = domain.steps;
        spec.pressure = domain.pressure;
        spec.label = defaultLabel(kind, value);
        validate(spec);
        specs.push_back(spec);
    };

    add(IsoLineKind::SATURATION, 1.0);
    for (double rh : domain.rh_values) add(IsoLineKind::RELATIVE_HUMIDITY, rh);
    for (double h : domain.enthalpy_values) add(IsoLineKind::ENTHALPY, h);
    for (double twb : domain.wet_bulb_values) add(IsoLineKind::WET_BULB, twb);
    return specs;
}

std::vector<IsoLine> IsoLineGenerator::chartFamily(const ChartDomain& domain) const {
    std::vector<IsoLine> lines;
    for (const IsoLineSpec& spec : chartFamilySpecs(domain)) {
        lines.emplace_back(spec, converter_);
    }
    return lines;
}

std::string IsoLineGenerator::defaultLabel(IsoLineKind kind, double value) {
    std::ostringstream ss;
    switch (kind) {
        case IsoLineKind::SATURATION:
            ss << "Saturation";
            break;
        case IsoLineKind::RELATIVE_HUMIDITY:
            ss << "RH " << std::lround(value * 100.0) << "%";
            break;
        case IsoLineKind::ENTHALPY:
            ss << "h " << value / 1000.0 << " kJ/kg";
            break;
        case IsoLineKind::WET_BULB:
            ss << "Twb " << value << " C";
            break;
    }
    return ss.str();
}

} // namespace MASE
