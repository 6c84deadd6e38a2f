#pragma once

#include <optional>
#include <string>
#include <variant>

namespace isa_flight {

// The six input pairs that define a flight condition. Magnitudes are in the
// display units requested for the solve (altitude in ft or m, speeds in kts
// or m/s).

struct MachAltitude {
    double mach;
    double altitude;
};

struct MachEas {
    double mach;
    double eas;
};

struct MachCas {
    double mach;
    double cas;
};

struct AltitudeEas {
    double altitude;
    double eas;
};

struct AltitudeCas {
    double altitude;
    double cas;
};

struct AltitudeTas {
    double altitude;
    double tas;
};

using FlightInput = std::variant<MachAltitude, MachEas, MachCas, AltitudeEas, AltitudeCas, AltitudeTas>;

/**
 * @brief Two-of-five selection as it comes from files or command lines
 */
struct FlightInputSelection {
    std::optional<double> mach;
    std::optional<double> altitude;
    std::optional<double> eas;
    std::optional<double> cas;
    std::optional<double> tas;

    /**
     * @brief Number of fields that hold a value
     */
    int count() const;
};

/**
 * @brief Turn a selection into one of the supported input pairs
 * @param selection Fields set by the caller
 * @return Matching input pair
 * @throws InvalidInputCountError unless exactly two fields are set
 * @throws InvalidInputPairError if the two fields do not define a flight level
 */
FlightInput selectFlightInput(const FlightInputSelection& selection);

/**
 * @brief Short name of the pair, e.g. "{mach, altitude}"
 */
std::string inputName(const FlightInput& input);

} // namespace isa_flight
