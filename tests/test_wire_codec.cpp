#include <gtest/gtest.h>
#include "signing_errors.hpp"
#include "wire_codec.hpp"

#include <cstdlib>
#include <limits>
#include <string>

TEST(FloatToWire, IntegersHaveNoFraction) {
    EXPECT_EQ(float_to_wire(90000), "90000");
    EXPECT_EQ(float_to_wire(1), "1");
    EXPECT_EQ(float_to_wire(100), "100");
}

TEST(FloatToWire, TrailingZerosAreDropped) {
    EXPECT_EQ(float_to_wire(0.001), "0.001");
    EXPECT_EQ(float_to_wire(1670.1), "1670.1");
    EXPECT_EQ(float_to_wire(0.0147), "0.0147");
    EXPECT_EQ(float_to_wire(0.1), "0.1");
}

TEST(FloatToWire, EightDecimalsWithoutExponent) {
    EXPECT_EQ(float_to_wire(0.00000001), "0.00000001");
    EXPECT_EQ(float_to_wire(12345.12345678), "12345.12345678");
}

TEST(FloatToWire, NegativeZeroIsZero) {
    EXPECT_EQ(float_to_wire(-0.0), "0");
    EXPECT_EQ(float_to_wire(0.0), "0");
    // rounds to -0.00000000 and is within tolerance
    EXPECT_EQ(float_to_wire(-1e-13), "0");
}

TEST(FloatToWire, NegativeValuesKeepSign) {
    EXPECT_EQ(float_to_wire(-1.5), "-1.5");
    EXPECT_EQ(float_to_wire(-0.001), "-0.001");
}

TEST(FloatToWire, RejectsNinthDecimal) {
    EXPECT_THROW(float_to_wire(0.123456785), PrecisionLossError);
    EXPECT_THROW(float_to_wire(1.000000001), PrecisionLossError);
    EXPECT_THROW(float_to_wire(1e-9), PrecisionLossError);
}

TEST(FloatToWire, RejectsNonFinite) {
    EXPECT_THROW(float_to_wire(std::numeric_limits<double>::infinity()), PrecisionLossError);
    EXPECT_THROW(float_to_wire(std::numeric_limits<double>::quiet_NaN()), PrecisionLossError);
}

TEST(FloatToWire, ReparsesToInputAndIsStable) {
    const double xs[] = {0.001, 1670.1, 0.0147, 90000, 3.14159265, 42.5, 0.00012345};
    for (double x : xs) {
        const std::string a = float_to_wire(x);
        const std::string b = float_to_wire(x);
        EXPECT_EQ(a, b);
        EXPECT_LT(std::abs(std::strtod(a.c_str(), nullptr) - x), 1e-12) << a;
    }
}

TEST(FloatToInt, ScalesAndRounds) {
    EXPECT_EQ(float_to_int_for_hashing(1000), 100000000000LL);
    EXPECT_EQ(float_to_usd_int(1.5), 1500000);
    EXPECT_EQ(float_to_usd_int(0.000001), 1);
    EXPECT_EQ(float_to_int(0.1, 8), 10000000);
    EXPECT_EQ(float_to_int(-2.25, 2), -225);
}

TEST(FloatToInt, RejectsRoundingBeyondTolerance) {
    EXPECT_THROW(float_to_usd_int(0.0000005), PrecisionLossError);
    EXPECT_THROW(float_to_int(1.2345, 2), PrecisionLossError);
    EXPECT_THROW(float_to_int(std::numeric_limits<double>::infinity(), 6), PrecisionLossError);
}

TEST(FloatToInt, RejectsOutOfRange) {
    EXPECT_THROW(float_to_int(1e300, 8), PrecisionLossError);
}
