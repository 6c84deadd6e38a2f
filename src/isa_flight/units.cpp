#include "isa_flight/units.hpp"

namespace isa_flight {
namespace units {

double feetToMeters(double feet) {
    return kMetersPerFoot * feet;
}

double metersToFeet(double meters) {
    return meters / kMetersPerFoot;
}

double knotsToMetersPerSecond(double knots) {
    return kMetersPerSecondPerKnot * knots;
}

double metersPerSecondToKnots(double mps) {
    return mps / kMetersPerSecondPerKnot;
}

double kelvinToCelsius(double kelvin) {
    return kelvin - kKelvinAtZeroCelsius;
}

double celsiusToKelvin(double celsius) {
    return celsius + kKelvinAtZeroCelsius;
}

std::string lengthLabel(bool feet) {
    return feet ? "ft" : "m";
}

std::string speedLabel(bool knots) {
    return knots ? "kts" : "m/s";
}

std::string temperatureLabel(bool celsius) {
    return celsius ? "C" : "K";
}

} // namespace units
} // namespace isa_flight
