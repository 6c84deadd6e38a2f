#include "config.hpp"
#include "../isa_flight/errors.hpp"

#include <optional>

namespace isa_flight {
namespace config {

namespace {

template <typename T>
T read_value(const YAML::Node& section, const std::string& key, const T& fallback) {
    const YAML::Node node = section[key];
    if (!node) {
        return fallback;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value for '" + key + "': " + e.what());
    }
}

std::optional<double> read_optional(const YAML::Node& section, const std::string& key) {
    const YAML::Node node = section[key];
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<double>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value for '" + key + "': " + e.what());
    }
}

YAML::Node load_file(const std::string& filename) {
    try {
        return YAML::LoadFile(filename);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot open config file: " + filename);
    } catch (const YAML::ParserException& e) {
        throw ConfigError("Cannot parse config file " + filename + ": " + e.what());
    }
}

} // namespace

SolverSettings solverSettingsFromNode(const YAML::Node& root) {
    SolverSettings settings;
    const YAML::Node section = root["solver"];
    if (!section) {
        return settings;
    }

    settings.max_iterations = read_value<int>(section, "max_iterations", settings.max_iterations);
    settings.altitude_tolerance = read_value<double>(section, "altitude_tolerance", settings.altitude_tolerance);
    settings.cas_mach_limit = read_value<double>(section, "cas_mach_limit", settings.cas_mach_limit);

    if (settings.max_iterations <= 0) {
        throw ConfigError("solver.max_iterations must be positive");
    }
    if (!(settings.altitude_tolerance > 0.0)) {
        throw ConfigError("solver.altitude_tolerance must be positive");
    }
    if (!(settings.cas_mach_limit > 0.0 && settings.cas_mach_limit <= 1.0)) {
        throw ConfigError("solver.cas_mach_limit must be in (0, 1]");
    }
    return settings;
}

FlightCase flightCaseFromNode(const YAML::Node& root) {
    const YAML::Node flight = root["flight"];
    if (!flight || !flight.IsMap()) {
        throw ConfigError("Missing 'flight' section");
    }

    FlightCase fc;
    fc.selection.mach = read_optional(flight, "mach");
    fc.selection.altitude = read_optional(flight, "altitude");
    fc.selection.eas = read_optional(flight, "eas");
    fc.selection.cas = read_optional(flight, "cas");
    fc.selection.tas = read_optional(flight, "tas");
    fc.delta_T = read_value<double>(flight, "delta_t", 0.0);

    const YAML::Node units = root["units"];
    if (units) {
        fc.units.feet = read_value<bool>(units, "feet", false);
        fc.units.knots = read_value<bool>(units, "knots", false);
        fc.units.celsius = read_value<bool>(units, "celsius", false);
    }
    return fc;
}

SolverSettings loadSolverSettings(const std::string& filename) {
    return solverSettingsFromNode(load_file(filename));
}

FlightCase loadFlightCase(const std::string& filename) {
    return flightCaseFromNode(load_file(filename));
}

} // namespace config
} // namespace isa_flight
