#pragma once

#include <stdexcept>
#include <string>

namespace isa_flight {

/**
 * @brief Base class for every error raised by the library
 */
class IsaFlightError : public std::runtime_error {
public:
    explicit IsaFlightError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Altitude outside the range covered by the ISA layers
 */
class OutOfRangeError : public IsaFlightError {
public:
    OutOfRangeError(const std::string& message, double altitude)
        : IsaFlightError(message), altitude_(altitude) {}

    double altitude() const { return altitude_; }

private:
    double altitude_;
};

/**
 * @brief A flight condition was requested with other than two inputs
 */
class InvalidInputCountError : public IsaFlightError {
public:
    InvalidInputCountError(const std::string& message, int count)
        : IsaFlightError(message), count_(count) {}

    int count() const { return count_; }

private:
    int count_;
};

/**
 * @brief Two inputs were given but they do not define a flight condition
 */
class InvalidInputPairError : public IsaFlightError {
public:
    explicit InvalidInputPairError(const std::string& message) : IsaFlightError(message) {}
};

/**
 * @brief Input outside its physical domain, or a condition with non-positive temperature
 */
class InvalidInputError : public IsaFlightError {
public:
    InvalidInputError(const std::string& message, double value)
        : IsaFlightError(message), value_(value) {}

    double value() const { return value_; }

private:
    double value_;
};

/**
 * @brief Altitude could not be recovered from the flight-level pressure
 */
class AltitudeSolveError : public IsaFlightError {
public:
    AltitudeSolveError(const std::string& message, double pressure)
        : IsaFlightError(message), pressure_(pressure) {}

    double pressure() const { return pressure_; }

private:
    double pressure_;
};

/**
 * @brief Calibrated airspeed relation used outside the subsonic regime
 */
class UnsupportedRegimeError : public IsaFlightError {
public:
    UnsupportedRegimeError(const std::string& message, double mach)
        : IsaFlightError(message), mach_(mach) {}

    double mach() const { return mach_; }

private:
    double mach_;
};

/**
 * @brief Configuration file missing, malformed or holding invalid values
 */
class ConfigError : public IsaFlightError {
public:
    explicit ConfigError(const std::string& message) : IsaFlightError(message) {}
};

/**
 * @brief Flight condition vector of the wrong size
 */
class DimensionError : public IsaFlightError {
public:
    DimensionError(const std::string& message, long size)
        : IsaFlightError(message), size_(size) {}

    long size() const { return size_; }

private:
    long size_;
};

} // namespace isa_flight
