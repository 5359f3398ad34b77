#pragma once
#include <cstdint>
#include <string>
#include <utility>

// Client order id: 16 bytes, always "0x" + 32 lowercase hex chars.
// Validated at construction, immutable afterwards.
class Cloid {
public:
    // 1 -> "0x00000000000000000000000000000001"
    static Cloid from_int(std::uint64_t cloid);

    // Requires the "0x" prefix and exactly 32 hex digits (either case).
    // Throws InvalidCloidError otherwise.
    static Cloid from_str(const std::string& cloid);

    const std::string& to_raw() const { return raw_; }

    bool operator==(const Cloid& o) const { return raw_ == o.raw_; }
    bool operator!=(const Cloid& o) const { return raw_ != o.raw_; }

private:
    explicit Cloid(std::string raw) : raw_(std::move(raw)) {}

    std::string raw_;
};
