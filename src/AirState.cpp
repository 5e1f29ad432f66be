#include "AirState.hpp"
#include "AtmosphericModel.hpp"
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace MASE {

AirState::AirState(const PropertySet& props) : props_(props) {}

AirState AirState::create(const StateInput& input, double pressure,
                          const PropertyConverter& converter) {
    return AirState(converter.resolve(input, pressure));
}

AirState AirState::create(const StateInput& input, const AtmosphericContext& context,
                          const PropertyConverter& converter) {
    return AirState(converter.resolve(input, context));
}

AirState AirState::fromDescriptors(const DescriptorSet& descriptors, double pressure,
                                   const PropertyConverter& converter) {
    return AirState(converter.resolveDescriptors(descriptors, pressure));
}

AirState AirState::fromDryBulbRelativeHumidity(double t_dry_bulb, double relative_humidity,
                                               double pressure) {
    return create(StateInput::dryBulbRelativeHumidity(t_dry_bulb, relative_humidity), pressure);
}

AirState AirState::fromDryBulbWetBulb(double t_dry_bulb, double t_wet_bulb, double pressure) {
    return create(StateInput::dryBulbWetBulb(t_dry_bulb, t_wet_bulb), pressure);
}

AirState AirState::fromDryBulbDewPoint(double t_dry_bulb, double t_dew_point, double pressure) {
    return create(StateInput::dryBulbDewPoint(t_dry_bulb, t_dew_point), pressure);
}

AirState AirState::fromDryBulbHumidityRatio(double t_dry_bulb, double humidity_ratio,
                                            double pressure) {
    return create(StateInput::dryBulbHumidityRatio(t_dry_bulb, humidity_ratio), pressure);
}

AirState AirState::fromDryBulbEnthalpy(double t_dry_bulb, double enthalpy, double pressure) {
    return create(StateInput::dryBulbEnthalpy(t_dry_bulb, enthalpy), pressure);
}

StateInput AirState::asInput(InputPair pair) const {
    switch (pair) {
        case InputPair::DRY_BULB_RELATIVE_HUMIDITY:
            return StateInput::dryBulbRelativeHumidity(props_.dry_bulb, props_.relative_humidity);
        case InputPair::DRY_BULB_WET_BULB:
            return StateInput::dryBulbWetBulb(props_.dry_bulb, props_.wet_bulb);
        case InputPair::DRY_BULB_DEW_POINT:
            return StateInput::dryBulbDewPoint(props_.dry_bulb, props_.dew_point);
        case InputPair::DRY_BULB_HUMIDITY_RATIO:
            return StateInput::dryBulbHumidityRatio(props_.dry_bulb, props_.humidity_ratio);
        case InputPair::DRY_BULB_ENTHALPY:
            return StateInput::dryBulbEnthalpy(props_.dry_bulb, props_.enthalpy);
    }
    return StateInput::dryBulbHumidityRatio(props_.dry_bulb, props_.humidity_ratio);
}

bool AirState::isConsistentWith(const AirState& other) const {
    const PropertySet& a = props_;
    const PropertySet& b = other.props_;
    return std::abs(a.dry_bulb - b.dry_bulb) <= ConsistencyTolerance::TEMPERATURE
        && std::abs(a.wet_bulb - b.wet_bulb) <= ConsistencyTolerance::TEMPERATURE
        && (a.dew_point == b.dew_point
            || std::abs(a.dew_point - b.dew_point) <= ConsistencyTolerance::TEMPERATURE)
        && std::abs(a.humidity_ratio - b.humidity_ratio) <= ConsistencyTolerance::HUMIDITY_RATIO
        && std::abs(a.enthalpy - b.enthalpy) <= ConsistencyTolerance::ENTHALPY
        && std::abs(a.relative_humidity - b.relative_humidity) <= ConsistencyTolerance::RELATIVE_HUMIDITY
        && a.pressure == b.pressure;
}

std::string AirState::describe() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2)
       << "Tdb=" << props_.dry_bulb << " C"
       << ", Twb=" << props_.wet_bulb << " C"
       << ", Tdp=" << props_.dew_point << " C"
       << ", RH=" << 100.0 * props_.relative_humidity << " %"
       << ", W=" << std::setprecision(3) << 1000.0 * props_.humidity_ratio << " g/kg"
       << ", h=" << std::setprecision(2) << props_.enthalpy / 1000.0 << " kJ/kg"
       << ", P=" << std::setprecision(0) << props_.pressure << " Pa";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const AirState& state) {
    return os << state.describe();
}

} // namespace MASE
