#include "signature.hpp"
#include "hex.hpp"
#include "signing_errors.hpp"

#include <algorithm>
#include <string>

nlohmann::ordered_json Signature::to_json() const {
    nlohmann::ordered_json j;
    j["r"] = hex_encode(r, true);
    j["s"] = hex_encode(s, true);
    j["v"] = v;
    return j;
}

Signature split_signature(const std::vector<std::uint8_t>& raw) {
    if (raw.size() != 65)
        throw InvalidSignatureError("bad sig length: " + std::to_string(raw.size()));

    const std::uint8_t vv = raw[64];
    if (vv != 0 && vv != 1 && vv != 27 && vv != 28)
        throw InvalidSignatureError("bad sig v " + std::to_string(vv));

    Signature sig;
    std::copy(raw.begin(), raw.begin() + 32, sig.r.begin());
    std::copy(raw.begin() + 32, raw.begin() + 64, sig.s.begin());
    sig.v = (vv == 0 || vv == 27) ? 27 : 28;
    return sig;
}
