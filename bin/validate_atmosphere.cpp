#include <iostream>
#include <iomanip>
#include <cmath>
#include <Eigen/Dense>
#include "../src/isa_flight/environment/isa_atmosphere.hpp"

using namespace isa_flight::environment;

/**
 * @brief Print the bootstrapped layer table
 */
void printLayerTable() {
    std::cout << "=== ISA Layer Table ===" << std::endl;
    std::cout << std::setw(4) << "i" << std::setw(12) << "h0 [m]" << std::setw(12) << "L [K/m]"
              << std::setw(12) << "T0 [K]" << std::setw(16) << "P0 [Pa]" << std::setw(16) << "rho0 [kg/m3]"
              << std::endl;
    const auto& layers = IsaAtmosphere::layers();
    for (int i = 0; i < kLayerCount; ++i) {
        const AtmosphereLayer& l = layers[i];
        std::cout << std::setw(4) << i << std::setw(12) << l.base_altitude << std::setw(12) << l.lapse_rate
                  << std::setw(12) << l.base_temperature << std::setw(16) << l.base_pressure
                  << std::setw(16) << l.base_density << std::endl;
    }
}

/**
 * @brief Pressure must match the next layer's base value at each boundary
 */
bool validateContinuity() {
    std::cout << "\n--- Pressure continuity at layer boundaries ---" << std::endl;
    bool pass = true;
    const auto& layers = IsaAtmosphere::layers();
    for (int i = 1; i < kLayerCount; ++i) {
        const double h = layers[i].base_altitude;
        const double below = IsaAtmosphere::pressure(h - 1e-6);
        const double above = IsaAtmosphere::pressure(h + 1e-6);
        const double jump = std::abs(above - below) / layers[i].base_pressure;
        std::cout << "h = " << h << " m: relative jump " << jump << std::endl;
        if (jump > 1e-8) pass = false;
    }
    std::cout << (pass ? "✓ PASS" : "✗ FAIL") << std::endl;
    return pass;
}

/**
 * @brief Pressure must decrease strictly over the whole model range
 */
bool validateMonotonicity() {
    std::cout << "\n--- Pressure monotonicity ---" << std::endl;
    const int n = 2000;
    Eigen::VectorXd altitudes = Eigen::VectorXd::LinSpaced(n, H_MIN, H_MAX);
    AtmosphereProfile profile = IsaAtmosphere::computeProfile(altitudes);

    int violations = 0;
    for (int i = 1; i < n; ++i) {
        if (!(profile.pressure(i) < profile.pressure(i - 1))) ++violations;
    }
    std::cout << "Samples: " << n << ", violations: " << violations << std::endl;
    std::cout << "Pressure range [Pa]: " << profile.pressure.minCoeff() << " - "
              << profile.pressure.maxCoeff() << std::endl;
    bool pass = violations == 0;
    std::cout << (pass ? "✓ PASS" : "✗ FAIL") << std::endl;
    return pass;
}

int main() {
    std::cout << std::fixed << std::setprecision(6);

    printLayerTable();
    bool pass1 = validateContinuity();
    bool pass2 = validateMonotonicity();

    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Continuity: " << (pass1 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Monotonicity: " << (pass2 ? "PASS" : "FAIL") << std::endl;

    if (pass1 && pass2) {
        std::cout << "\n✓ Atmosphere validation PASSED" << std::endl;
        return 0;
    }
    std::cout << "\n✗ Atmosphere validation FAILED" << std::endl;
    return 1;
}
