#pragma once

#include "isa_flight/types.hpp"
#include <Eigen/Dense>
#include <ostream>

namespace isa_flight {

/**
 * @brief Raw magnitudes of a flight condition
 *
 * Altitude, airspeeds, speed of sound, temperature and Reynolds number per
 * length follow the display units they are paired with. Everything else is SI.
 */
struct FlightConditionData {
    double mach;                 // Mach number
    double altitude;             // ft or m
    double eas;                  // Equivalent airspeed, kts or m/s
    double cas;                  // Calibrated airspeed, kts or m/s (NaN when supersonic and not given)
    double tas;                  // True airspeed, kts or m/s
    double speed_of_sound;       // kts or m/s
    double pressure;             // Pa
    double temperature;          // C or K
    double density;              // kg/m^3
    double viscosity;            // Pa*s
    double kinematic_viscosity;  // m^2/s
    double dynamic_pressure;     // Pa
    double reynolds_per_length;  // 1/ft or 1/m
    double delta_T;              // Deviation from ISA temperature [K, same as C]
};

/**
 * @brief Complete, consistent flight condition
 *
 * Built by FlightLevelSolver or by re-projecting another condition into new
 * display units. There are no setters.
 */
class FlightCondition {
public:
    /**
     * @brief Constructor
     * @param data Magnitudes already expressed in the given units
     * @param units Display units of data
     */
    FlightCondition(const FlightConditionData& data, const DisplayUnits& units);

    double mach() const { return data_.mach; }
    double altitude() const { return data_.altitude; }
    double eas() const { return data_.eas; }
    double cas() const { return data_.cas; }
    double tas() const { return data_.tas; }
    double speedOfSound() const { return data_.speed_of_sound; }
    double pressure() const { return data_.pressure; }
    double temperature() const { return data_.temperature; }
    double density() const { return data_.density; }
    double viscosity() const { return data_.viscosity; }
    double kinematicViscosity() const { return data_.kinematic_viscosity; }
    double dynamicPressure() const { return data_.dynamic_pressure; }
    double reynoldsPerLength() const { return data_.reynolds_per_length; }
    double deltaT() const { return data_.delta_T; }

    bool feet() const { return units_.feet; }
    bool knots() const { return units_.knots; }
    bool celsius() const { return units_.celsius; }

    const FlightConditionData& data() const { return data_; }
    const DisplayUnits& units() const { return units_; }

    /**
     * @brief Whether a calibrated airspeed exists for this condition
     */
    bool hasCalibratedAirspeed() const;

    /**
     * @brief Export as a vector indexed by FlightConditionIndex
     * @return Vector of utils::flightConditionDim() elements
     */
    Eigen::VectorXd toVector() const;

    /**
     * @brief Rebuild from an exported vector
     * @param vec Vector indexed by FlightConditionIndex
     * @param units Units the vector was exported in
     */
    static FlightCondition fromVector(const Eigen::VectorXd& vec, const DisplayUnits& units);

private:
    FlightConditionData data_;
    DisplayUnits units_;
};

std::ostream& operator<<(std::ostream& os, const FlightCondition& fc);

} // namespace isa_flight
