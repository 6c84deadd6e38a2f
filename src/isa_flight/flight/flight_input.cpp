#include "isa_flight/flight/flight_input.hpp"
#include "isa_flight/errors.hpp"

#include <sstream>
#include <vector>

namespace isa_flight {

int FlightInputSelection::count() const {
    return static_cast<int>(mach.has_value()) + static_cast<int>(altitude.has_value()) +
           static_cast<int>(eas.has_value()) + static_cast<int>(cas.has_value()) +
           static_cast<int>(tas.has_value());
}

static std::string filled_names(const FlightInputSelection& s) {
    std::vector<std::string> names;
    if (s.mach) names.push_back("mach");
    if (s.altitude) names.push_back("altitude");
    if (s.eas) names.push_back("eas");
    if (s.cas) names.push_back("cas");
    if (s.tas) names.push_back("tas");

    std::ostringstream out;
    out << "{";
    for (size_t i = 0; i < names.size(); ++i) {
        out << (i > 0 ? ", " : "") << names[i];
    }
    out << "}";
    return out.str();
}

FlightInput selectFlightInput(const FlightInputSelection& selection) {
    const int n = selection.count();
    if (n != 2) {
        std::ostringstream msg;
        msg << "From the available input options for Mach number, altitude, EAS, CAS and TAS, "
            << "2 must be defined instead of " << n << ".";
        throw InvalidInputCountError(msg.str(), n);
    }

    if (selection.mach && selection.altitude) {
        return MachAltitude{*selection.mach, *selection.altitude};
    }
    if (selection.mach && selection.eas) {
        return MachEas{*selection.mach, *selection.eas};
    }
    if (selection.mach && selection.cas) {
        return MachCas{*selection.mach, *selection.cas};
    }
    if (selection.altitude && selection.eas) {
        return AltitudeEas{*selection.altitude, *selection.eas};
    }
    if (selection.altitude && selection.cas) {
        return AltitudeCas{*selection.altitude, *selection.cas};
    }
    if (selection.altitude && selection.tas) {
        return AltitudeTas{*selection.altitude, *selection.tas};
    }

    throw InvalidInputPairError("Pair of values " + filled_names(selection) +
                                " is not valid to define a flight level.");
}

namespace {

struct InputNamer {
    std::string operator()(const MachAltitude&) const { return "{mach, altitude}"; }
    std::string operator()(const MachEas&) const { return "{mach, eas}"; }
    std::string operator()(const MachCas&) const { return "{mach, cas}"; }
    std::string operator()(const AltitudeEas&) const { return "{altitude, eas}"; }
    std::string operator()(const AltitudeCas&) const { return "{altitude, cas}"; }
    std::string operator()(const AltitudeTas&) const { return "{altitude, tas}"; }
};

} // namespace

std::string inputName(const FlightInput& input) {
    return std::visit(InputNamer{}, input);
}

} // namespace isa_flight
