#pragma once

#include <string>

namespace isa_flight {
namespace units {

constexpr double kMetersPerFoot = 0.3048;
constexpr double kMetersPerSecondPerKnot = 0.5144444;
constexpr double kKelvinAtZeroCelsius = 273.15;

double feetToMeters(double feet);
double metersToFeet(double meters);

double knotsToMetersPerSecond(double knots);
double metersPerSecondToKnots(double mps);

double kelvinToCelsius(double kelvin);
double celsiusToKelvin(double celsius);

// Display labels
std::string lengthLabel(bool feet);
std::string speedLabel(bool knots);
std::string temperatureLabel(bool celsius);

} // namespace units
} // namespace isa_flight
