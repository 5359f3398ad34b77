#include "cloid.hpp"
#include "hex.hpp"
#include "signing_errors.hpp"

#include <cctype>
#include <cstdio>

Cloid Cloid::from_int(std::uint64_t cloid) {
    char buf[35];
    std::snprintf(buf, sizeof(buf), "0x%032llx", static_cast<unsigned long long>(cloid));
    return Cloid(buf);
}

Cloid Cloid::from_str(const std::string& cloid) {
    if (cloid.size() < 2 || cloid[0] != '0' || cloid[1] != 'x')
        throw InvalidCloidError("cloid is not a hex string: " + cloid);
    if (cloid.size() - 2 != 32)
        throw InvalidCloidError("cloid is not 16 bytes: " + cloid);

    std::string raw = "0x";
    for (std::size_t i = 2; i < cloid.size(); i++) {
        char c = cloid[i];
        if (!is_hex_digit(c))
            throw InvalidCloidError("cloid has a non-hex digit: " + cloid);
        raw.push_back((char)std::tolower((unsigned char)c));
    }
    return Cloid(std::move(raw));
}
