#include <gtest/gtest.h>
#include "../src/isa_flight/flight/flight_input.hpp"
#include "../src/isa_flight/errors.hpp"

using namespace isa_flight;

class FlightInputTest : public ::testing::Test {
protected:
    FlightInputSelection selectionOf(bool mach, bool altitude, bool eas, bool cas, bool tas) {
        FlightInputSelection s;
        if (mach) s.mach = 0.5;
        if (altitude) s.altitude = 3000.0;
        if (eas) s.eas = 120.0;
        if (cas) s.cas = 125.0;
        if (tas) s.tas = 140.0;
        return s;
    }
};

TEST_F(FlightInputTest, CountsFilledFields) {
    EXPECT_EQ(selectionOf(false, false, false, false, false).count(), 0);
    EXPECT_EQ(selectionOf(true, false, true, false, false).count(), 2);
    EXPECT_EQ(selectionOf(true, true, true, true, true).count(), 5);
}

TEST_F(FlightInputTest, SupportedPairs) {
    FlightInput in = selectFlightInput(selectionOf(true, true, false, false, false));
    ASSERT_TRUE(std::holds_alternative<MachAltitude>(in));
    EXPECT_EQ(std::get<MachAltitude>(in).mach, 0.5);
    EXPECT_EQ(std::get<MachAltitude>(in).altitude, 3000.0);

    in = selectFlightInput(selectionOf(true, false, true, false, false));
    ASSERT_TRUE(std::holds_alternative<MachEas>(in));
    EXPECT_EQ(std::get<MachEas>(in).eas, 120.0);

    in = selectFlightInput(selectionOf(true, false, false, true, false));
    ASSERT_TRUE(std::holds_alternative<MachCas>(in));
    EXPECT_EQ(std::get<MachCas>(in).cas, 125.0);

    in = selectFlightInput(selectionOf(false, true, true, false, false));
    ASSERT_TRUE(std::holds_alternative<AltitudeEas>(in));

    in = selectFlightInput(selectionOf(false, true, false, true, false));
    ASSERT_TRUE(std::holds_alternative<AltitudeCas>(in));

    in = selectFlightInput(selectionOf(false, true, false, false, true));
    ASSERT_TRUE(std::holds_alternative<AltitudeTas>(in));
    EXPECT_EQ(std::get<AltitudeTas>(in).tas, 140.0);
}

TEST_F(FlightInputTest, WrongInputCount) {
    EXPECT_THROW(selectFlightInput(selectionOf(false, false, false, false, false)), InvalidInputCountError);
    EXPECT_THROW(selectFlightInput(selectionOf(true, false, false, false, false)), InvalidInputCountError);
    EXPECT_THROW(selectFlightInput(selectionOf(true, true, true, false, false)), InvalidInputCountError);
    EXPECT_THROW(selectFlightInput(selectionOf(true, true, true, true, true)), InvalidInputCountError);

    try {
        selectFlightInput(selectionOf(true, true, true, false, false));
        FAIL() << "Expected InvalidInputCountError";
    } catch (const InvalidInputCountError& e) {
        EXPECT_EQ(e.count(), 3);
    }
}

TEST_F(FlightInputTest, UnsupportedPairs) {
    EXPECT_THROW(selectFlightInput(selectionOf(false, false, true, true, false)), InvalidInputPairError);
    EXPECT_THROW(selectFlightInput(selectionOf(true, false, false, false, true)), InvalidInputPairError);
    EXPECT_THROW(selectFlightInput(selectionOf(false, false, true, false, true)), InvalidInputPairError);
    EXPECT_THROW(selectFlightInput(selectionOf(false, false, false, true, true)), InvalidInputPairError);
}

TEST_F(FlightInputTest, ErrorsShareBaseClass) {
    EXPECT_THROW(selectFlightInput(selectionOf(false, false, true, true, false)), IsaFlightError);
    EXPECT_THROW(selectFlightInput(selectionOf(true, false, false, false, false)), std::runtime_error);
}

TEST_F(FlightInputTest, InputNames) {
    EXPECT_EQ(inputName(MachAltitude{0.8, 11000.0}), "{mach, altitude}");
    EXPECT_EQ(inputName(MachCas{0.5, 100.0}), "{mach, cas}");
    EXPECT_EQ(inputName(AltitudeTas{1000.0, 100.0}), "{altitude, tas}");
}
