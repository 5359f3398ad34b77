#include "hex.hpp"

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

bool is_hex_digit(char c) {
    return hex_value(c) >= 0;
}

std::string hex_encode(const std::uint8_t* data, std::size_t len, bool with_prefix) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2 + (with_prefix ? 2 : 0));
    if (with_prefix) out += "0x";
    for (std::size_t i = 0; i < len; i++) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> hex_decode(const std::string& text) {
    std::size_t start = 0;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) start = 2;
    if ((text.size() - start) % 2 != 0) return std::nullopt;

    std::vector<std::uint8_t> out;
    out.reserve((text.size() - start) / 2);
    for (std::size_t i = start; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}
