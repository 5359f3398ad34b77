#pragma once
#include <array>
#include <cstdint>
#include <string>

// 20-byte account address (vault / subaccount routing address)
class Address {
public:
    // "0x"-prefixed or bare, exactly 40 hex digits.
    // Throws MalformedAddressError otherwise.
    static Address parse(const std::string& text);

    const std::array<std::uint8_t, 20>& bytes() const { return bytes_; }

    // "0x" + 40 lowercase hex
    std::string to_hex() const;

    bool operator==(const Address& o) const { return bytes_ == o.bytes_; }

private:
    Address() = default;

    std::array<std::uint8_t, 20> bytes_{};
};
