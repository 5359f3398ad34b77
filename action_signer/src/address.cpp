#include "address.hpp"
#include "hex.hpp"
#include "signing_errors.hpp"

#include <algorithm>

Address Address::parse(const std::string& text) {
    std::string body = text;
    if (body.size() >= 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X'))
        body = body.substr(2);

    if (body.size() != 40)
        throw MalformedAddressError("address must be 40 hex chars: " + text);

    auto raw = hex_decode(body);
    if (!raw)
        throw MalformedAddressError("address is not hex: " + text);

    Address a;
    std::copy(raw->begin(), raw->end(), a.bytes_.begin());
    return a;
}

std::string Address::to_hex() const {
    return hex_encode(bytes_, true);
}
