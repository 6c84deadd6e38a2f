#include "isa_flight/flight/flight_level_solver.hpp"
#include "isa_flight/core/root_finding.hpp"
#include "isa_flight/environment/isa_atmosphere.hpp"
#include "isa_flight/errors.hpp"
#include "isa_flight/units.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <sstream>

namespace isa_flight {

using environment::A0;
using environment::IsaAtmosphere;
using environment::P0;
using environment::RHO0;

namespace {

// Visitor spreading a pair back into named optional fields
struct SelectionOf {
    FlightInputSelection operator()(const MachAltitude& in) const {
        FlightInputSelection s;
        s.mach = in.mach;
        s.altitude = in.altitude;
        return s;
    }
    FlightInputSelection operator()(const MachEas& in) const {
        FlightInputSelection s;
        s.mach = in.mach;
        s.eas = in.eas;
        return s;
    }
    FlightInputSelection operator()(const MachCas& in) const {
        FlightInputSelection s;
        s.mach = in.mach;
        s.cas = in.cas;
        return s;
    }
    FlightInputSelection operator()(const AltitudeEas& in) const {
        FlightInputSelection s;
        s.altitude = in.altitude;
        s.eas = in.eas;
        return s;
    }
    FlightInputSelection operator()(const AltitudeCas& in) const {
        FlightInputSelection s;
        s.altitude = in.altitude;
        s.cas = in.cas;
        return s;
    }
    FlightInputSelection operator()(const AltitudeTas& in) const {
        FlightInputSelection s;
        s.altitude = in.altitude;
        s.tas = in.tas;
        return s;
    }
};

// Subsonic impact pressure over static pressure for a speed ratio v/a
inline double impact_pressure_ratio(double speed_ratio) {
    return std::pow(1.0 + 0.2 * speed_ratio * speed_ratio, 3.5) - 1.0;
}

// Mach and airspeeds must be finite and non-negative
inline void check_input(const std::optional<double>& v, const char* name) {
    if (v && !(std::isfinite(*v) && *v >= 0.0)) {
        std::ostringstream msg;
        msg << "Input " << name << " = " << *v << " must be finite and non-negative";
        throw InvalidInputError(msg.str(), *v);
    }
}

inline std::optional<double> speed_to_si(const std::optional<double>& v, bool knots) {
    if (!v) return std::nullopt;
    return knots ? units::knotsToMetersPerSecond(*v) : *v;
}

inline double speed_to_display(const std::optional<double>& given, double si, bool knots) {
    if (given) return *given;
    return knots ? units::metersPerSecondToKnots(si) : si;
}

} // namespace

FlightLevelSolver::FlightLevelSolver() : settings_() {
}

FlightLevelSolver::FlightLevelSolver(const SolverSettings& settings) : settings_(settings) {
}

FlightCondition FlightLevelSolver::solve(const FlightInputSelection& selection, double delta_T,
                                         const DisplayUnits& display) const {
    return solve(selectFlightInput(selection), delta_T, display);
}

FlightCondition FlightLevelSolver::solve(const FlightInput& input, double delta_T,
                                         const DisplayUnits& display) const {
    const FlightInputSelection given = std::visit(SelectionOf{}, input);
    check_input(given.mach, "mach");
    check_input(given.eas, "eas");
    check_input(given.cas, "cas");
    check_input(given.tas, "tas");
    if (!std::isfinite(delta_T)) {
        throw InvalidInputError("Temperature deviation must be finite", delta_T);
    }

    // Work in SI whatever the requested units
    std::optional<double> h_si;
    if (given.altitude) {
        h_si = display.feet ? units::feetToMeters(*given.altitude) : *given.altitude;
    }
    const std::optional<double> eas_si = speed_to_si(given.eas, display.knots);
    const std::optional<double> cas_si = speed_to_si(given.cas, display.knots);
    const std::optional<double> tas_si = speed_to_si(given.tas, display.knots);

    if (cas_si && *cas_si / A0 >= settings_.cas_mach_limit) {
        std::ostringstream msg;
        msg << "Calibrated airspeed " << *cas_si << " m/s is not subsonic; "
            << "only the subsonic CAS relation is available";
        throw UnsupportedRegimeError(msg.str(), *cas_si / A0);
    }
    if (cas_si && given.mach && *given.mach >= settings_.cas_mach_limit) {
        std::ostringstream msg;
        msg << "Mach " << *given.mach << " with calibrated airspeed needs the supersonic CAS relation";
        throw UnsupportedRegimeError(msg.str(), *given.mach);
    }

    // Pressure at flight level, then altitude if it was not given
    double p_fl;
    double h_fl;
    if (h_si) {
        h_fl = *h_si;
        p_fl = IsaAtmosphere::pressure(h_fl);
    } else {
        const double mach = *given.mach;
        if (eas_si) {
            p_fl = std::pow(*eas_si / A0 / mach, 2) * P0;
        } else {
            p_fl = P0 * impact_pressure_ratio(*cas_si / A0) / impact_pressure_ratio(mach);
        }
        h_fl = solveAltitude(p_fl);
    }

    const double T_fl = IsaAtmosphere::temperature(h_fl, delta_T);
    if (!(T_fl > 0.0)) {
        std::ostringstream msg;
        msg << "Temperature deviation " << delta_T << " K gives a static temperature of "
            << T_fl << " K at " << h_fl << " m";
        throw InvalidInputError(msg.str(), delta_T);
    }
    const double rho_fl = IsaAtmosphere::density(h_fl, delta_T);
    const double mu_fl = IsaAtmosphere::viscosity(h_fl, delta_T);
    const double nu_fl = mu_fl / rho_fl;
    const double a_fl = IsaAtmosphere::soundSpeed(h_fl, delta_T);

    double mach_fl;
    if (given.mach) {
        mach_fl = *given.mach;
    } else if (tas_si) {
        mach_fl = *tas_si / a_fl;
    } else if (eas_si) {
        mach_fl = *eas_si / A0 * std::sqrt(P0 / p_fl);
    } else {
        mach_fl = std::sqrt(5.0 * (std::pow(P0 / p_fl * impact_pressure_ratio(*cas_si / A0) + 1.0,
                                            2.0 / 7.0) - 1.0));
        if (mach_fl >= settings_.cas_mach_limit) {
            std::ostringstream msg;
            msg << "Calibrated airspeed " << *cas_si << " m/s at " << h_fl
                << " m resolves to Mach " << mach_fl << "; only the subsonic CAS relation is available";
            throw UnsupportedRegimeError(msg.str(), mach_fl);
        }
    }

    // Speeds that were not inputs
    const double tas_fl = tas_si ? *tas_si : a_fl * mach_fl;
    const double eas_fl = eas_si ? *eas_si : tas_fl * std::sqrt(rho_fl / RHO0);
    double cas_fl;
    if (cas_si) {
        cas_fl = *cas_si;
    } else if (mach_fl < settings_.cas_mach_limit) {
        cas_fl = A0 * std::sqrt(5.0 * (std::pow(p_fl / P0 * impact_pressure_ratio(mach_fl) + 1.0,
                                                2.0 / 7.0) - 1.0));
    } else {
        cas_fl = std::numeric_limits<double>::quiet_NaN();
    }

    FlightConditionData data{};
    data.mach = mach_fl;
    data.pressure = p_fl;
    data.density = rho_fl;
    data.viscosity = mu_fl;
    data.kinematic_viscosity = nu_fl;
    data.dynamic_pressure = rho_fl * tas_fl * tas_fl / 2.0;
    data.reynolds_per_length = tas_fl / nu_fl;
    data.delta_T = delta_T;

    // Requested units; caller-supplied values are kept verbatim
    if (given.altitude) {
        data.altitude = *given.altitude;
    } else {
        data.altitude = display.feet ? units::metersToFeet(h_fl) : h_fl;
    }
    if (display.feet) {
        data.reynolds_per_length /= units::metersToFeet(1.0);
    }
    data.eas = speed_to_display(given.eas, eas_fl, display.knots);
    data.cas = speed_to_display(given.cas, cas_fl, display.knots);
    data.tas = speed_to_display(given.tas, tas_fl, display.knots);
    data.speed_of_sound = display.knots ? units::metersPerSecondToKnots(a_fl) : a_fl;
    data.temperature = display.celsius ? units::kelvinToCelsius(T_fl) : T_fl;

    return FlightCondition(data, display);
}

double FlightLevelSolver::solveAltitude(double pressure) const {
    auto residual = [pressure](double h) { return IsaAtmosphere::pressure(h) - pressure; };
    core::RootResult result = core::find_root_bisection(
        residual, environment::H_MIN, environment::H_MAX,
        settings_.max_iterations, settings_.altitude_tolerance);

    if (!result.bracketed) {
        std::ostringstream msg;
        msg << "Pressure " << pressure << " Pa is not reached between "
            << environment::H_MIN << " m and " << environment::H_MAX << " m";
        throw AltitudeSolveError(msg.str(), pressure);
    }
    if (!result.converged) {
        std::ostringstream msg;
        msg << "Altitude for pressure " << pressure << " Pa did not converge within "
            << settings_.max_iterations << " iterations";
        throw AltitudeSolveError(msg.str(), pressure);
    }
    return result.root;
}

FlightCondition withDisplayUnits(const FlightCondition& condition, const DisplayUnits& display) {
    FlightConditionData data = condition.data();
    const DisplayUnits& from = condition.units();

    if (display.feet && !from.feet) {
        data.altitude = units::metersToFeet(data.altitude);
        data.reynolds_per_length /= units::metersToFeet(1.0);
    } else if (!display.feet && from.feet) {
        data.altitude = units::feetToMeters(data.altitude);
        data.reynolds_per_length /= units::feetToMeters(1.0);
    }
    if (display.knots && !from.knots) {
        data.eas = units::metersPerSecondToKnots(data.eas);
        data.cas = units::metersPerSecondToKnots(data.cas);
        data.tas = units::metersPerSecondToKnots(data.tas);
        data.speed_of_sound = units::metersPerSecondToKnots(data.speed_of_sound);
    } else if (!display.knots && from.knots) {
        data.eas = units::knotsToMetersPerSecond(data.eas);
        data.cas = units::knotsToMetersPerSecond(data.cas);
        data.tas = units::knotsToMetersPerSecond(data.tas);
        data.speed_of_sound = units::knotsToMetersPerSecond(data.speed_of_sound);
    }
    if (display.celsius && !from.celsius) {
        data.temperature = units::kelvinToCelsius(data.temperature);
    } else if (!display.celsius && from.celsius) {
        data.temperature = units::celsiusToKelvin(data.temperature);
    }

    return FlightCondition(data, display);
}

std::shared_ptr<FlightLevelSolver> createFlightLevelSolver(const SolverSettings& settings) {
    return std::make_shared<FlightLevelSolver>(settings);
}

} // namespace isa_flight
