#pragma once

namespace isa_flight {

/**
 * @brief Slot indices of an exported flight condition vector
 */
enum class FlightConditionIndex {
    MACH = 0,                       // Mach number (0)
    ALTITUDE,                       // Altitude (1)
    EAS, CAS, TAS,                  // Airspeeds (2-4)
    SPEED_OF_SOUND,                 // Speed of sound (5)
    PRESSURE,                       // Static pressure (6)
    TEMPERATURE,                    // Static temperature (7)
    DENSITY,                        // Density (8)
    VISCOSITY,                      // Dynamic viscosity (9)
    KINEMATIC_VISCOSITY,            // Kinematic viscosity (10)
    DYNAMIC_PRESSURE,               // Dynamic pressure (11)
    REYNOLDS_PER_LENGTH,            // Reynolds number per unit length (12)
    DELTA_T                         // Deviation from ISA temperature (13)
};

/**
 * @brief Units used to present length, speed and temperature magnitudes
 *
 * Pressure, density and viscosities are always SI.
 */
struct DisplayUnits {
    bool feet;      // Length in feet (true) or meters (false)
    bool knots;     // Speed in knots (true) or m/s (false)
    bool celsius;   // Temperature in Celsius (true) or Kelvin (false)

    DisplayUnits() : feet(false), knots(false), celsius(false) {}

    DisplayUnits(bool ft, bool kts, bool cel) : feet(ft), knots(kts), celsius(cel) {}

    bool operator==(const DisplayUnits& other) const {
        return feet == other.feet && knots == other.knots && celsius == other.celsius;
    }

    bool operator!=(const DisplayUnits& other) const { return !(*this == other); }
};

namespace utils {

    /**
     * @brief Length of an exported flight condition vector
     */
    inline constexpr int flightConditionDim() { return 14; }

    inline constexpr int index(FlightConditionIndex i) { return static_cast<int>(i); }

    /**
     * @brief SI display units
     */
    inline DisplayUnits siUnits() { return DisplayUnits(false, false, false); }

    /**
     * @brief Feet, knots and Celsius
     */
    inline DisplayUnits aviationUnits() { return DisplayUnits(true, true, true); }
}

} // namespace isa_flight
