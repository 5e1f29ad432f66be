#ifndef AIR_STATE_HPP
#define AIR_STATE_HPP

#include "MoistAirProperties.hpp"
#include <iosfwd>
#include <string>

namespace MASE {

class AtmosphericContext;

/**
 * @brief Immutable thermodynamic state of moist air
 *
 * Created only through the factories, which run the PropertyConverter;
 * a call either yields a fully consistent state or throws. There are no
 * setters. Copies are independent values.
 */
class AirState {
public:
    static AirState create(const StateInput& input, double pressure,
                           const PropertyConverter& converter = PropertyConverter());
    static AirState create(const StateInput& input, const AtmosphericContext& context,
                           const PropertyConverter& converter = PropertyConverter());
    static AirState fromDescriptors(const DescriptorSet& descriptors, double pressure,
                                    const PropertyConverter& converter = PropertyConverter());

    // Convenience factories, one per supported pair
    static AirState fromDryBulbRelativeHumidity(double t_dry_bulb, double relative_humidity,
                                                double pressure);
    static AirState fromDryBulbWetBulb(double t_dry_bulb, double t_wet_bulb, double pressure);
    static AirState fromDryBulbDewPoint(double t_dry_bulb, double t_dew_point, double pressure);
    static AirState fromDryBulbHumidityRatio(double t_dry_bulb, double humidity_ratio,
                                             double pressure);
    static AirState fromDryBulbEnthalpy(double t_dry_bulb, double enthalpy, double pressure);

    double dryBulb() const { return props_.dry_bulb; }
    double humidityRatio() const { return props_.humidity_ratio; }
    double relativeHumidity() const { return props_.relative_humidity; }
    double wetBulb() const { return props_.wet_bulb; }
    double dewPoint() const { return props_.dew_point; }
    double enthalpy() const { return props_.enthalpy; }
    double specificVolume() const { return props_.specific_volume; }
    double density() const { return props_.density; }
    double specificHeat() const { return props_.specific_heat; }
    double pressure() const { return props_.pressure; }
    double vaporPressure() const { return props_.vapor_pressure; }
    double saturationVaporPressure() const { return props_.saturation_vapor_pressure; }

    const PropertySet& properties() const { return props_; }

    // This state's own properties expressed as the given input pair
    StateInput asInput(InputPair pair) const;

    // Same state within ConsistencyTolerance
    bool isConsistentWith(const AirState& other) const;

    std::string describe() const;

private:
    explicit AirState(const PropertySet& props);

    PropertySet props_;
};

std::ostream& operator<<(std::ostream& os, const AirState& state);

} // namespace MASE

#endif // AIR_STATE_HPP
