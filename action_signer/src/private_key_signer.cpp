#include "private_key_signer.hpp"
#include "hex.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <stdexcept>

PrivateKeySigner::PrivateKeySigner(const std::string& private_key_hex) {
    auto raw = hex_decode(private_key_hex);
    if (!raw || raw->size() != key_.size())
        throw std::invalid_argument("private key must be 32 bytes of hex");

    std::copy(raw->begin(), raw->end(), key_.begin());
    OPENSSL_cleanse(raw->data(), raw->size());

    try {
        check_private_key(key_);
        address_ = address_from_public_key(public_key_xy(key_));
    } catch (...) {
        OPENSSL_cleanse(key_.data(), key_.size());
        throw;
    }
}

PrivateKeySigner::~PrivateKeySigner() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

std::vector<std::uint8_t> PrivateKeySigner::sign_typed_data(const TypedDataDomain& domain,
                                                            const TypedDataSchema& types,
                                                            const PhantomAgent& message) {
    const Hash32 digest = typed_data_digest(domain, types, message);
    const RecoverableSignature sig = ecdsa_sign_digest(key_, digest);

    std::vector<std::uint8_t> out;
    out.reserve(65);
    out.insert(out.end(), sig.r.begin(), sig.r.end());
    out.insert(out.end(), sig.s.begin(), sig.s.end());
    // recovery ids 2/3 (R.x >= n) have no 27/28 encoding; probability ~2^-127
    if (sig.recovery_id > 1)
        throw std::runtime_error("secp256k1: unencodable recovery id");
    out.push_back(static_cast<std::uint8_t>(27 + sig.recovery_id));
    return out;
}
