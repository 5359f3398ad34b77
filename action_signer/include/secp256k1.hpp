#pragma once
#include "keccak.hpp"
#include "signature.hpp"

#include <array>
#include <cstdint>
#include <string>

using PrivateKey = std::array<std::uint8_t, 32>;

struct RecoverableSignature {
    std::array<std::uint8_t, 32> r{};
    std::array<std::uint8_t, 32> s{};   // low-s (s <= n/2)
    int recovery_id = 0;                // 0..3, parity of R.y plus 2 if R.x >= n
};

// Throws std::invalid_argument unless 1 <= key <= n-1
void check_private_key(const PrivateKey& key);

// Deterministic ECDSA over secp256k1 (RFC 6979, HMAC-SHA256).
// Same key and digest always give the same signature.
RecoverableSignature ecdsa_sign_digest(const PrivateKey& key, const Hash32& digest);

// Uncompressed public key without the 0x04 tag: X || Y
std::array<std::uint8_t, 64> public_key_xy(const PrivateKey& key);

// "0x" + last 20 bytes of keccak(X || Y), lowercase
std::string address_from_public_key(const std::array<std::uint8_t, 64>& xy);

// Verifier side: recovers the signing address from a 27/28 signature.
// Throws InvalidSignatureError if r/s are out of range or no point recovers.
std::string recover_address(const Hash32& digest, const Signature& sig);
