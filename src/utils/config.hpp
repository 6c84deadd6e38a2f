#pragma once

#include "../isa_flight/flight/flight_input.hpp"
#include "../isa_flight/flight/flight_level_solver.hpp"
#include "../isa_flight/types.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace isa_flight {
namespace config {

/**
 * @brief Flight condition request read from a configuration file
 */
struct FlightCase {
    FlightInputSelection selection;  // Inputs, in the units below
    double delta_T = 0.0;            // Deviation from ISA temperature [K]
    DisplayUnits units;
};

/**
 * @brief Read solver settings from the "solver" section of a YAML node
 *
 * Missing keys keep their defaults.
 *
 * @param root Document root
 * @return Solver settings
 * @throws ConfigError on wrong types or non-positive values
 */
SolverSettings solverSettingsFromNode(const YAML::Node& root);

/**
 * @brief Read a flight case from the "flight" and "units" sections of a YAML node
 * @param root Document root
 * @return Flight case; the input pair is validated later by the solver
 * @throws ConfigError on wrong types or a missing "flight" section
 */
FlightCase flightCaseFromNode(const YAML::Node& root);

/**
 * @brief Load solver settings from YAML configuration
 * @param filename Path to solver.yaml
 * @return Solver settings
 */
SolverSettings loadSolverSettings(const std::string& filename = "configs/solver.yaml");

/**
 * @brief Load a flight case from YAML configuration
 * @param filename Path to flight_case.yaml
 * @return Flight case
 */
FlightCase loadFlightCase(const std::string& filename = "configs/flight_case.yaml");

} // namespace config
} // namespace isa_flight
