#include "wire_codec.hpp"
#include "signing_errors.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>

static constexpr double kWireTolerance = 1e-12;
static constexpr double kIntTolerance  = 1e-3;

// C locale radix ('.') assumed
static std::string fixed8(double x) {
    char buf[512];
    int n = std::snprintf(buf, sizeof(buf), "%.8f", x);
    if (n < 0 || n >= (int)sizeof(buf))
        throw PrecisionLossError("float_to_wire: value out of range");
    return std::string(buf, (std::size_t)n);
}

std::string float_to_wire(double x) {
    if (!std::isfinite(x))
        throw PrecisionLossError("float_to_wire: non-finite value");

    std::string rounded = fixed8(x);
    double back = std::strtod(rounded.c_str(), nullptr);
    if (std::abs(back - x) >= kWireTolerance)
        throw PrecisionLossError("float_to_wire causes rounding: " + rounded);

    // normalize: drop trailing zeros, then a dangling '.'
    auto dot = rounded.find('.');
    if (dot != std::string::npos) {
        auto last = rounded.find_last_not_of('0');
        rounded.erase(last + 1);
        if (rounded.back() == '.') rounded.pop_back();
    }

    if (rounded == "-0") return "0";
    return rounded;
}

std::int64_t float_to_int(double x, int power) {
    if (!std::isfinite(x))
        throw PrecisionLossError("float_to_int: non-finite value");

    const double with_decimals = x * std::pow(10.0, power);
    const double nearest = std::round(with_decimals);
    if (std::abs(nearest - with_decimals) >= kIntTolerance)
        throw PrecisionLossError("float_to_int causes rounding");

    // 2^63 is exactly representable; anything at or beyond it does not fit
    if (nearest >= 9223372036854775808.0 || nearest < -9223372036854775808.0)
        throw PrecisionLossError("float_to_int: value out of int64 range");

    return static_cast<std::int64_t>(nearest);
}

std::uint64_t timestamp_ms() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}
