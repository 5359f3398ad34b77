#pragma once
#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <vector>

struct Signature {
    std::array<std::uint8_t, 32> r{};
    std::array<std::uint8_t, 32> s{};
    int v = 27;   // always 27 or 28

    // {"r": "0x<64 hex>", "s": "0x<64 hex>", "v": 27}
    nlohmann::ordered_json to_json() const;

    bool operator==(const Signature& o) const { return r == o.r && s == o.s && v == o.v; }
};

// Splits 65 raw bytes r || s || v. Hardware wallets return v as 0/1,
// software wallets as 27/28; both normalize to 27/28.
// Throws InvalidSignatureError on a wrong length or any other v.
Signature split_signature(const std::vector<std::uint8_t>& raw);
