#include <gtest/gtest.h>
#include <Eigen/Dense>
#include "../src/isa_flight/environment/isa_atmosphere.hpp"
#include "../src/isa_flight/errors.hpp"
#include <cmath>

using namespace isa_flight;
using namespace isa_flight::environment;

class IsaAtmosphereTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Reference base values of the upper layers
        expected_base_pressure_ = {101325.0, 22632.04, 5474.878, 868.0158, 110.9058, 66.93854, 3.956393};
        expected_base_density_ = {1.225, 0.3639177, 0.08803469, 0.01322497, 1.427527e-3, 8.616012e-4, 6.421058e-5};
    }

    std::array<double, kLayerCount> expected_base_pressure_;
    std::array<double, kLayerCount> expected_base_density_;
};

TEST_F(IsaAtmosphereTest, DerivedConstants) {
    EXPECT_NEAR(R_GAS, 287.0529, 1e-4);
    EXPECT_NEAR(A0, 340.294, 1e-3);
    EXPECT_NEAR(A0, std::sqrt(GAMMA * R_GAS * T0), 1e-12);
}

// Usable from other translation units' static initialisers
static_assert(A0 > 340.0 && A0 < 341.0, "sea-level speed of sound is a compile-time constant");

TEST_F(IsaAtmosphereTest, SeaLevelValuesAreExact) {
    EXPECT_EQ(IsaAtmosphere::temperature(0.0), 288.15);
    EXPECT_EQ(IsaAtmosphere::pressure(0.0), 101325.0);
    EXPECT_EQ(IsaAtmosphere::density(0.0), 1.225);
    EXPECT_NEAR(IsaAtmosphere::viscosity(0.0), MU0, 1e-15);
    EXPECT_NEAR(IsaAtmosphere::soundSpeed(0.0), A0, 1e-12);
}

TEST_F(IsaAtmosphereTest, TropopauseTemperature) {
    EXPECT_NEAR(IsaAtmosphere::temperature(11000.0), 216.65, 1e-9);
    EXPECT_NEAR(IsaAtmosphere::temperature(15000.0), 216.65, 1e-9);
    EXPECT_NEAR(IsaAtmosphere::temperature(32000.0), 228.65, 1e-9);
    EXPECT_NEAR(IsaAtmosphere::temperature(47000.0), 270.65, 1e-9);
    EXPECT_NEAR(IsaAtmosphere::temperature(71000.0), 214.65, 1e-9);
}

TEST_F(IsaAtmosphereTest, LayerTableIsBootstrappedInOrder) {
    const auto& layers = IsaAtmosphere::layers();
    for (int i = 0; i < kLayerCount; ++i) {
        EXPECT_EQ(layers[i].base_altitude, kLayerBoundaries[i]);
        EXPECT_EQ(layers[i].lapse_rate, kLapseRates[i]);
        EXPECT_NEAR(layers[i].base_pressure, expected_base_pressure_[i], expected_base_pressure_[i] * 1e-6);
        EXPECT_NEAR(layers[i].base_density, expected_base_density_[i], expected_base_density_[i] * 1e-6);
    }
    // Same table on every call
    EXPECT_EQ(&IsaAtmosphere::layers(), &layers);
}

TEST_F(IsaAtmosphereTest, LayerIndex) {
    EXPECT_EQ(IsaAtmosphere::layerIndex(-610.0), 0);
    EXPECT_EQ(IsaAtmosphere::layerIndex(-100.0), 0);
    EXPECT_EQ(IsaAtmosphere::layerIndex(0.0), 0);
    EXPECT_EQ(IsaAtmosphere::layerIndex(5000.0), 0);
    EXPECT_EQ(IsaAtmosphere::layerIndex(11000.0), 0);  // Boundary belongs to the layer below
    EXPECT_EQ(IsaAtmosphere::layerIndex(11000.5), 1);
    EXPECT_EQ(IsaAtmosphere::layerIndex(25000.0), 2);
    EXPECT_EQ(IsaAtmosphere::layerIndex(40000.0), 3);
    EXPECT_EQ(IsaAtmosphere::layerIndex(50000.0), 4);
    EXPECT_EQ(IsaAtmosphere::layerIndex(60000.0), 5);
    EXPECT_EQ(IsaAtmosphere::layerIndex(84852.0), 6);
}

TEST_F(IsaAtmosphereTest, OutOfRangeAltitudes) {
    EXPECT_THROW(IsaAtmosphere::layerIndex(-700.0), OutOfRangeError);
    EXPECT_THROW(IsaAtmosphere::layerIndex(90000.0), OutOfRangeError);
    EXPECT_THROW(IsaAtmosphere::layerIndex(std::nan("")), OutOfRangeError);
    EXPECT_THROW(IsaAtmosphere::pressure(84852.1), OutOfRangeError);
    EXPECT_THROW(IsaAtmosphere::density(-611.0), OutOfRangeError);

    try {
        IsaAtmosphere::temperature(90000.0);
        FAIL() << "Expected OutOfRangeError";
    } catch (const OutOfRangeError& e) {
        EXPECT_EQ(e.altitude(), 90000.0);
    }
}

TEST_F(IsaAtmosphereTest, PressureContinuousAcrossBoundaries) {
    const auto& layers = IsaAtmosphere::layers();
    for (int i = 1; i < kLayerCount; ++i) {
        const double h = layers[i].base_altitude;
        // Top of layer i-1 equals base of layer i
        EXPECT_NEAR(IsaAtmosphere::pressure(h), layers[i].base_pressure, layers[i].base_pressure * 1e-12);
        EXPECT_NEAR(IsaAtmosphere::pressure(h + 1e-3), layers[i].base_pressure, layers[i].base_pressure * 1e-6);
        EXPECT_NEAR(IsaAtmosphere::density(h + 1e-3), layers[i].base_density, layers[i].base_density * 1e-6);
    }
}

TEST_F(IsaAtmosphereTest, PressureStrictlyDecreasing) {
    Eigen::VectorXd altitudes = Eigen::VectorXd::LinSpaced(5000, H_MIN, H_MAX);
    AtmosphereProfile profile = IsaAtmosphere::computeProfile(altitudes);
    for (Eigen::Index i = 1; i < altitudes.size(); ++i) {
        ASSERT_LT(profile.pressure(i), profile.pressure(i - 1)) << "at h = " << altitudes(i);
    }
    EXPECT_NEAR(profile.pressure(altitudes.size() - 1), 0.37338, 1e-4);
}

TEST_F(IsaAtmosphereTest, PressureIgnoresTemperatureDeviation) {
    const double h = 8000.0;
    EXPECT_EQ(IsaAtmosphere::computeState(h, 20.0).pressure, IsaAtmosphere::pressure(h));
    EXPECT_EQ(IsaAtmosphere::computeState(h, -20.0).pressure, IsaAtmosphere::pressure(h));
}

TEST_F(IsaAtmosphereTest, DensityWithTemperatureDeviationUsesIdealGas) {
    const double h = 5000.0;
    const double delta_T = 15.0;
    const double expected = IsaAtmosphere::pressure(h) / (R_GAS * IsaAtmosphere::temperature(h, delta_T));
    EXPECT_NEAR(IsaAtmosphere::density(h, delta_T), expected, 1e-12);
    EXPECT_NEAR(IsaAtmosphere::density(h, delta_T), 0.695318, 1e-6);
    // Standard day closed form agrees with the ideal-gas law
    EXPECT_NEAR(IsaAtmosphere::density(h), IsaAtmosphere::pressure(h) / (R_GAS * IsaAtmosphere::temperature(h)), 1e-12);
}

TEST_F(IsaAtmosphereTest, TemperatureDeviationShiftsTemperature) {
    EXPECT_NEAR(IsaAtmosphere::temperature(3000.0, 10.0) - IsaAtmosphere::temperature(3000.0), 10.0, 1e-12);
    EXPECT_GT(IsaAtmosphere::soundSpeed(3000.0, 10.0), IsaAtmosphere::soundSpeed(3000.0));
    EXPECT_GT(IsaAtmosphere::viscosity(3000.0, 10.0), IsaAtmosphere::viscosity(3000.0));
}

TEST_F(IsaAtmosphereTest, ViscosityAndSoundSpeedAtTropopause) {
    EXPECT_NEAR(IsaAtmosphere::viscosity(11000.0), 1.421941e-5, 1e-11);
    EXPECT_NEAR(IsaAtmosphere::soundSpeed(11000.0), 295.0695, 1e-4);
}

TEST_F(IsaAtmosphereTest, ComputeStateMatchesScalarFunctions) {
    const double h = 27000.0;
    const double delta_T = -5.0;
    AtmosphereState state = IsaAtmosphere::computeState(h, delta_T);
    EXPECT_EQ(state.temperature, IsaAtmosphere::temperature(h, delta_T));
    EXPECT_EQ(state.pressure, IsaAtmosphere::pressure(h));
    EXPECT_EQ(state.density, IsaAtmosphere::density(h, delta_T));
    EXPECT_NEAR(state.viscosity, IsaAtmosphere::viscosity(h, delta_T), 1e-18);
    EXPECT_NEAR(state.speed_of_sound, IsaAtmosphere::soundSpeed(h, delta_T), 1e-12);
}

TEST_F(IsaAtmosphereTest, ProfileRejectsOutOfRangeAltitude) {
    Eigen::VectorXd altitudes(3);
    altitudes << 0.0, 50000.0, 90000.0;
    EXPECT_THROW(IsaAtmosphere::computeProfile(altitudes), OutOfRangeError);
}
