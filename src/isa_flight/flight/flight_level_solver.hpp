#pragma once

#include "isa_flight/types.hpp"
#include "isa_flight/flight/flight_condition.hpp"
#include "isa_flight/flight/flight_input.hpp"
#include <memory>

namespace isa_flight {

/**
 * @brief Numerical settings of the flight level solver
 */
struct SolverSettings {
    int max_iterations;          // Bisection budget for the altitude solve
    double altitude_tolerance;   // Half-width at which the altitude solve stops [m]
    double cas_mach_limit;       // Mach at which the subsonic CAS relation stops applying

    // Default constructor
    SolverSettings() : max_iterations(200), altitude_tolerance(1e-9), cas_mach_limit(1.0) {}

    SolverSettings(int iterations, double tolerance, double mach_limit)
        : max_iterations(iterations), altitude_tolerance(tolerance), cas_mach_limit(mach_limit) {}
};

/**
 * @brief Reconstructs a flight condition from two independent inputs
 *
 * Pressure at the flight level comes either from the altitude or from the
 * airspeed relations; in the latter case altitude is recovered by inverting
 * the ISA pressure profile numerically.
 */
class FlightLevelSolver {
public:
    /**
     * @brief Constructor with default settings
     */
    FlightLevelSolver();

    /**
     * @brief Constructor
     * @param settings Numerical settings
     */
    explicit FlightLevelSolver(const SolverSettings& settings);

    /**
     * @brief Solve a flight condition
     * @param input Supported pair of inputs, in the requested display units
     * @param delta_T Deviation from ISA temperature [K]
     * @param units Display units of inputs and result
     * @return Complete flight condition
     * @throws InvalidInputError if Mach or a speed is negative or not finite, or
     *         the temperature deviation leaves no positive static temperature
     * @throws OutOfRangeError if the altitude is outside the ISA model
     * @throws AltitudeSolveError if no altitude matches the flight-level pressure
     * @throws UnsupportedRegimeError if a calibrated airspeed input is not subsonic
     */
    FlightCondition solve(const FlightInput& input, double delta_T = 0.0,
                          const DisplayUnits& units = DisplayUnits()) const;

    /**
     * @brief Validate a two-of-five selection and solve it
     * @throws InvalidInputCountError unless exactly two fields are set
     * @throws InvalidInputPairError if the pair is not supported
     */
    FlightCondition solve(const FlightInputSelection& selection, double delta_T = 0.0,
                          const DisplayUnits& units = DisplayUnits()) const;

    /**
     * @brief Altitude at which the ISA pressure equals a given value
     * @param pressure Static pressure [Pa]
     * @return Altitude [m]
     * @throws AltitudeSolveError if the pressure is not reached inside the model
     *         range or the solve does not converge
     */
    double solveAltitude(double pressure) const;

    /**
     * @brief Get settings
     */
    const SolverSettings& getSettings() const { return settings_; }

private:
    SolverSettings settings_;
};

/**
 * @brief Copy of a condition expressed in other display units
 *
 * Pressure, density, dynamic pressure and viscosities stay SI.
 */
FlightCondition withDisplayUnits(const FlightCondition& condition, const DisplayUnits& units);

/**
 * @brief Create flight level solver
 * @param settings Numerical settings
 * @return Shared pointer to solver
 */
std::shared_ptr<FlightLevelSolver> createFlightLevelSolver(const SolverSettings& settings = SolverSettings());

} // namespace isa_flight
