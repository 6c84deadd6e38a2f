#pragma once

#include <Eigen/Dense>
#include <array>

namespace isa_flight {
namespace environment {

// Sea-level reference values
constexpr double P0 = 101325.0;      // Pressure [Pa]
constexpr double T0 = 288.15;        // Temperature [K]
constexpr double RHO0 = 1.225;       // Density [kg/m^3]
constexpr double MU0 = 1.7894e-5;    // Dynamic viscosity [Pa*s]

constexpr double GAMMA = 1.4;                  // Ratio of specific heats
constexpr double G0 = 9.80665;                 // Standard gravity [m/s^2]
constexpr double R_GAS = P0 / (RHO0 * T0);     // Specific gas constant [J/(kg*K)]
constexpr double SUTHERLAND_CONSTANT = 110.0;  // [K]

// Validity range of the layered model [m]
constexpr double H_MIN = -610.0;
constexpr double H_MAX = 84852.0;

constexpr int kLayerCount = 7;

// Base altitude of every layer plus the top of the last one [m]
constexpr std::array<double, kLayerCount + 1> kLayerBoundaries = {
    0.0, 11000.0, 20000.0, 32000.0, 47000.0, 51000.0, 71000.0, 84852.0};

// Temperature lapse rate per layer [K/m]
constexpr std::array<double, kLayerCount> kLapseRates = {
    -6.5e-3, 0.0, 1.0e-3, 2.8e-3, 0.0, -2.8e-3, -2.0e-3};

// Sea-level speed of sound sqrt(GAMMA * R_GAS * T0) [m/s]
constexpr double A0 = 340.2939905434711;

struct AtmosphereLayer {
    double base_altitude;     // m
    double lapse_rate;        // K/m
    double base_temperature;  // K
    double base_pressure;     // Pa
    double base_density;      // kg/m^3
};

struct AtmosphereState {
    double temperature;    // K
    double pressure;       // Pa
    double density;        // kg/m^3
    double viscosity;      // Pa*s
    double speed_of_sound; // m/s
};

/**
 * @brief Atmosphere quantities sampled over a set of altitudes
 *
 * Every vector has the length of the altitude vector it was computed from.
 */
struct AtmosphereProfile {
    Eigen::VectorXd altitude;        // m
    Eigen::VectorXd temperature;     // K
    Eigen::VectorXd pressure;        // Pa
    Eigen::VectorXd density;         // kg/m^3
    Eigen::VectorXd viscosity;       // Pa*s
    Eigen::VectorXd speed_of_sound;  // m/s
};

/**
 * @brief International Standard Atmosphere between -610 m and 84852 m
 *
 * Seven layers, each with a constant lapse rate. Base values of layers above
 * sea level are derived from the layer below on first use.
 */
class IsaAtmosphere {
public:
    /**
     * @brief Layer table, built once on first access
     * @return Layers ordered by increasing base altitude
     */
    static const std::array<AtmosphereLayer, kLayerCount>& layers();

    /**
     * @brief Index of the layer containing an altitude
     *
     * Altitudes at or below sea level map to the first layer. A boundary
     * altitude belongs to the layer below it.
     *
     * @param altitude Altitude [m]
     * @return Layer index in [0, 6]
     * @throws OutOfRangeError if altitude is outside [H_MIN, H_MAX]
     */
    static int layerIndex(double altitude);

    /**
     * @brief Temperature
     * @param altitude Altitude [m]
     * @param delta_T Deviation from ISA temperature [K]
     * @return Temperature [K]
     */
    static double temperature(double altitude, double delta_T = 0.0);

    /**
     * @brief Pressure, independent of the temperature deviation
     * @param altitude Altitude [m]
     * @return Pressure [Pa]
     */
    static double pressure(double altitude);

    /**
     * @brief Density
     *
     * With a non-zero deviation the closed form no longer applies and density
     * comes from the ideal-gas law at the ISA pressure.
     *
     * @param altitude Altitude [m]
     * @param delta_T Deviation from ISA temperature [K]
     * @return Density [kg/m^3]
     */
    static double density(double altitude, double delta_T = 0.0);

    /**
     * @brief Dynamic viscosity from Sutherland's law
     * @param altitude Altitude [m]
     * @param delta_T Deviation from ISA temperature [K]
     * @return Viscosity [Pa*s]
     */
    static double viscosity(double altitude, double delta_T = 0.0);

    /**
     * @brief Speed of sound
     * @param altitude Altitude [m]
     * @param delta_T Deviation from ISA temperature [K]
     * @return Speed of sound [m/s]
     */
    static double soundSpeed(double altitude, double delta_T = 0.0);

    /**
     * @brief All atmosphere quantities at one altitude
     */
    static AtmosphereState computeState(double altitude, double delta_T = 0.0);

    /**
     * @brief All atmosphere quantities over a vector of altitudes
     * @throws OutOfRangeError on the first altitude outside the model range
     */
    static AtmosphereProfile computeProfile(const Eigen::VectorXd& altitudes, double delta_T = 0.0);
};

} // namespace environment
} // namespace isa_flight
