#include <iostream>
#include <iomanip>
#include <string>
#include "../src/isa_flight/errors.hpp"
#include "../src/isa_flight/flight/flight_level_solver.hpp"
#include "../src/utils/config.hpp"

using namespace isa_flight;

int main(int argc, char* argv[]) {
    std::cout << "=== ISA Flight Level Demo ===" << std::endl;
    std::cout << std::fixed << std::setprecision(4);

    config::FlightCase flight_case;
    SolverSettings settings;
    try {
        if (argc > 1) {
            flight_case = config::loadFlightCase(argv[1]);
            std::cout << "Flight case: " << argv[1] << std::endl;
        } else {
            flight_case.selection.mach = 0.8;
            flight_case.selection.altitude = 11000.0;
            std::cout << "Flight case: built-in (Mach 0.8 at 11000 m)" << std::endl;
        }
        if (argc > 2) {
            settings = config::loadSolverSettings(argv[2]);
            std::cout << "Solver settings: " << argv[2] << std::endl;
        }
    } catch (const ConfigError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    auto solver = createFlightLevelSolver(settings);

    try {
        FlightInput input = selectFlightInput(flight_case.selection);
        std::cout << "Inputs: " << inputName(input) << std::endl;
        std::cout << "Temperature deviation [K]: " << flight_case.delta_T << std::endl;

        FlightCondition condition = solver->solve(input, flight_case.delta_T, flight_case.units);

        std::cout << "\n--- Requested Units ---" << std::endl;
        std::cout << condition;

        if (condition.units() != utils::siUnits()) {
            std::cout << "\n--- SI Units ---" << std::endl;
            std::cout << withDisplayUnits(condition, utils::siUnits());
        }

        std::cout << "\n--- Condition Vector (" << utils::flightConditionDim() << " elements) ---" << std::endl;
        std::cout << "[" << condition.toVector().transpose() << "]" << std::endl;
    } catch (const IsaFlightError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n=== Demo Complete ===" << std::endl;
    return 0;
}
