#pragma once
#include <cstdint>
#include <string>

// ---- Numeric wire codec ----
// Every magnitude that ends up in a signed action crosses from double into
// its canonical decimal string or scaled integer here, and never goes back.

// Rounds to 8 decimals and renders the shortest plain decimal:
// no exponent, no trailing zeros, no "-0".
//   90000        -> "90000"
//   0.001        -> "0.001"
//   0.123456785  -> PrecisionLossError
// Throws PrecisionLossError when |reparsed - x| >= 1e-12 or x is not finite.
std::string float_to_wire(double x);

// round(x * 10^power). Throws PrecisionLossError when the rounding delta is >= 1e-3
// or the result does not fit in int64.
std::int64_t float_to_int(double x, int power);

inline std::int64_t float_to_int_for_hashing(double x) { return float_to_int(x, 8); }
inline std::int64_t float_to_usd_int(double x) { return float_to_int(x, 6); }

// Wall clock in milliseconds, the usual nonce
std::uint64_t timestamp_ms();
