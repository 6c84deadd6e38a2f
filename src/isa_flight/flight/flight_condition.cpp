#include "isa_flight/flight/flight_condition.hpp"
#include "isa_flight/errors.hpp"
#include "isa_flight/units.hpp"

#include <cmath>

namespace isa_flight {

FlightCondition::FlightCondition(const FlightConditionData& data, const DisplayUnits& units)
    : data_(data), units_(units) {
}

bool FlightCondition::hasCalibratedAirspeed() const {
    return !std::isnan(data_.cas);
}

Eigen::VectorXd FlightCondition::toVector() const {
    Eigen::VectorXd vec(utils::flightConditionDim());
    vec(utils::index(FlightConditionIndex::MACH)) = data_.mach;
    vec(utils::index(FlightConditionIndex::ALTITUDE)) = data_.altitude;
    vec(utils::index(FlightConditionIndex::EAS)) = data_.eas;
    vec(utils::index(FlightConditionIndex::CAS)) = data_.cas;
    vec(utils::index(FlightConditionIndex::TAS)) = data_.tas;
    vec(utils::index(FlightConditionIndex::SPEED_OF_SOUND)) = data_.speed_of_sound;
    vec(utils::index(FlightConditionIndex::PRESSURE)) = data_.pressure;
    vec(utils::index(FlightConditionIndex::TEMPERATURE)) = data_.temperature;
    vec(utils::index(FlightConditionIndex::DENSITY)) = data_.density;
    vec(utils::index(FlightConditionIndex::VISCOSITY)) = data_.viscosity;
    vec(utils::index(FlightConditionIndex::KINEMATIC_VISCOSITY)) = data_.kinematic_viscosity;
    vec(utils::index(FlightConditionIndex::DYNAMIC_PRESSURE)) = data_.dynamic_pressure;
    vec(utils::index(FlightConditionIndex::REYNOLDS_PER_LENGTH)) = data_.reynolds_per_length;
    vec(utils::index(FlightConditionIndex::DELTA_T)) = data_.delta_T;
    return vec;
}

FlightCondition FlightCondition::fromVector(const Eigen::VectorXd& vec, const DisplayUnits& units) {
    if (vec.size() != utils::flightConditionDim()) {
        throw DimensionError("Flight condition vector must have 14 elements", static_cast<long>(vec.size()));
    }
    FlightConditionData data{};
    data.mach = vec(utils::index(FlightConditionIndex::MACH));
    data.altitude = vec(utils::index(FlightConditionIndex::ALTITUDE));
    data.eas = vec(utils::index(FlightConditionIndex::EAS));
    data.cas = vec(utils::index(FlightConditionIndex::CAS));
    data.tas = vec(utils::index(FlightConditionIndex::TAS));
    data.speed_of_sound = vec(utils::index(FlightConditionIndex::SPEED_OF_SOUND));
    data.pressure = vec(utils::index(FlightConditionIndex::PRESSURE));
    data.temperature = vec(utils::index(FlightConditionIndex::TEMPERATURE));
    data.density = vec(utils::index(FlightConditionIndex::DENSITY));
    data.viscosity = vec(utils::index(FlightConditionIndex::VISCOSITY));
    data.kinematic_viscosity = vec(utils::index(FlightConditionIndex::KINEMATIC_VISCOSITY));
    data.dynamic_pressure = vec(utils::index(FlightConditionIndex::DYNAMIC_PRESSURE));
    data.reynolds_per_length = vec(utils::index(FlightConditionIndex::REYNOLDS_PER_LENGTH));
    data.delta_T = vec(utils::index(FlightConditionIndex::DELTA_T));
    return FlightCondition(data, units);
}

std::ostream& operator<<(std::ostream& os, const FlightCondition& fc) {
    const std::string dist_unit = units::lengthLabel(fc.feet());
    const std::string vel_unit = units::speedLabel(fc.knots());
    const std::string temp_unit = units::temperatureLabel(fc.celsius());

    os << "Flight condition defined by:\n"
       << "Mach number = " << fc.mach() << "\n"
       << "Altitude = " << fc.altitude() << " " << dist_unit << "\n"
       << "Equivalent Air Speed = " << fc.eas() << " " << vel_unit << "\n";
    if (fc.hasCalibratedAirspeed()) {
        os << "Calibrated Air Speed = " << fc.cas() << " " << vel_unit << "\n";
    } else {
        os << "Calibrated Air Speed = n/a (supersonic)\n";
    }
    os << "True Air Speed = " << fc.tas() << " " << vel_unit << "\n"
       << "Sound Speed = " << fc.speedOfSound() << " " << vel_unit << "\n"
       << "Pressure = " << fc.pressure() << " Pa\n"
       << "Temperature = " << fc.temperature() << " " << temp_unit << "\n"
       << "Density = " << fc.density() << " kg/m3\n"
       << "Viscosity = " << fc.viscosity() << " Pa*s\n"
       << "Kinematic viscosity = " << fc.kinematicViscosity() << " m2/s\n"
       << "Dynamic pressure = " << fc.dynamicPressure() << " Pa\n"
       << "Reynolds / distance = " << fc.reynoldsPerLength() << " " << dist_unit << "^-1\n"
       << "Temperature deviation from ISA = " << fc.deltaT() << " " << temp_unit << "\n";
    return os;
}

} // namespace isa_flight
