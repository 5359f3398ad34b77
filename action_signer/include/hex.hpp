#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Lowercase hex, optionally with a "0x" prefix
std::string hex_encode(const std::uint8_t* data, std::size_t len, bool with_prefix = false);

template <typename Bytes>
std::string hex_encode(const Bytes& bytes, bool with_prefix = false) {
    return hex_encode(bytes.data(), bytes.size(), with_prefix);
}

// Strips an optional "0x"/"0X" prefix. Returns nullopt on odd length or a non-hex digit.
std::optional<std::vector<std::uint8_t>> hex_decode(const std::string& text);

bool is_hex_digit(char c);
