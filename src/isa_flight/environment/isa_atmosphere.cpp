#include "isa_flight/environment/isa_atmosphere.hpp"
#include "isa_flight/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace isa_flight {
namespace environment {

// Deviations below this are treated as standard day
static constexpr double kDeltaTZeroTolerance = 1e-12;

static inline double sutherland_viscosity(double T) {
    return MU0 * std::pow(T / T0, 1.5) * (T0 + SUTHERLAND_CONSTANT) / (T + SUTHERLAND_CONSTANT);
}

static inline double layer_temperature(const AtmosphereLayer &layer, double h) {
    return layer.base_temperature + layer.lapse_rate * (h - layer.base_altitude);
}

static inline double layer_pressure(const AtmosphereLayer &layer, double h) {
    if (layer.lapse_rate == 0.0) {
        return layer.base_pressure *
               std::exp(-G0 * (h - layer.base_altitude) / (R_GAS * layer.base_temperature));
    }
    return layer.base_pressure *
           std::pow(layer_temperature(layer, h) / layer.base_temperature,
                    -G0 / (R_GAS * layer.lapse_rate));
}

static inline double layer_density(const AtmosphereLayer &layer, double h) {
    if (layer.lapse_rate == 0.0) {
        return layer.base_density *
               std::exp(-G0 * (h - layer.base_altitude) / (R_GAS * layer.base_temperature));
    }
    return layer.base_density *
           std::pow(layer_temperature(layer, h) / layer.base_temperature,
                    -G0 / (R_GAS * layer.lapse_rate) - 1.0);
}

// Layer i is seeded from the closed form of layer i-1 evaluated at its base,
// so the table has to be filled bottom-up.
static std::array<AtmosphereLayer, kLayerCount> build_layer_table() {
    std::array<AtmosphereLayer, kLayerCount> table{};
    table[0] = {kLayerBoundaries[0], kLapseRates[0], T0, P0, RHO0};
    for (int i = 1; i < kLayerCount; ++i) {
        const AtmosphereLayer &below = table[i - 1];
        const double h = kLayerBoundaries[i];
        table[i] = {h, kLapseRates[i],
                    layer_temperature(below, h),
                    layer_pressure(below, h),
                    layer_density(below, h)};
    }
    return table;
}

const std::array<AtmosphereLayer, kLayerCount>& IsaAtmosphere::layers() {
    static const std::array<AtmosphereLayer, kLayerCount> table = build_layer_table();
    return table;
}

int IsaAtmosphere::layerIndex(double altitude) {
    if (!(altitude >= H_MIN)) {
        std::ostringstream msg;
        msg << "Height " << altitude << " set lower than ISA minimum " << H_MIN;
        throw OutOfRangeError(msg.str(), altitude);
    }
    if (altitude > H_MAX) {
        std::ostringstream msg;
        msg << "Height " << altitude << " set higher than ISA maximum " << H_MAX;
        throw OutOfRangeError(msg.str(), altitude);
    }
    if (altitude <= 0.0) {
        return 0;
    }
    // First boundary at or above the altitude closes the containing layer
    auto it = std::lower_bound(kLayerBoundaries.begin(), kLayerBoundaries.end(), altitude);
    return static_cast<int>(it - kLayerBoundaries.begin()) - 1;
}

double IsaAtmosphere::temperature(double altitude, double delta_T) {
    const AtmosphereLayer &layer = layers()[layerIndex(altitude)];
    return layer_temperature(layer, altitude) + delta_T;
}

double IsaAtmosphere::pressure(double altitude) {
    const AtmosphereLayer &layer = layers()[layerIndex(altitude)];
    return layer_pressure(layer, altitude);
}

double IsaAtmosphere::density(double altitude, double delta_T) {
    if (std::abs(delta_T) < kDeltaTZeroTolerance) {
        const AtmosphereLayer &layer = layers()[layerIndex(altitude)];
        return layer_density(layer, altitude);
    }
    return pressure(altitude) / (R_GAS * temperature(altitude, delta_T));
}

double IsaAtmosphere::viscosity(double altitude, double delta_T) {
    return sutherland_viscosity(temperature(altitude, delta_T));
}

double IsaAtmosphere::soundSpeed(double altitude, double delta_T) {
    return std::sqrt(GAMMA * R_GAS * temperature(altitude, delta_T));
}

AtmosphereState IsaAtmosphere::computeState(double altitude, double delta_T) {
    AtmosphereState out{};
    out.temperature = temperature(altitude, delta_T);
    out.pressure = pressure(altitude);
    out.density = density(altitude, delta_T);
    out.viscosity = sutherland_viscosity(out.temperature);
    out.speed_of_sound = std::sqrt(GAMMA * R_GAS * out.temperature);
    return out;
}

AtmosphereProfile IsaAtmosphere::computeProfile(const Eigen::VectorXd& altitudes, double delta_T) {
    const Eigen::Index n = altitudes.size();
    AtmosphereProfile profile;
    profile.altitude = altitudes;
    profile.temperature.resize(n);
    profile.pressure.resize(n);
    profile.density.resize(n);
    profile.viscosity.resize(n);
    profile.speed_of_sound.resize(n);

    for (Eigen::Index i = 0; i < n; ++i) {
        AtmosphereState state = computeState(altitudes(i), delta_T);
        profile.temperature(i) = state.temperature;
        profile.pressure(i) = state.pressure;
        profile.density(i) = state.density;
        profile.viscosity(i) = state.viscosity;
        profile.speed_of_sound(i) = state.speed_of_sound;
    }
    return profile;
}

} // namespace environment
} // namespace isa_flight
