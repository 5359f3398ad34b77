#pragma once
#include "secp256k1.hpp"
#include "signer.hpp"

#include <string>

// In-memory secp256k1 key. Signs EIP-712 digests deterministically and returns
// r || s || v with v in {27, 28}, byte-identical to common Ethereum wallets.
class PrivateKeySigner : public ISigner {
public:
    // 64 hex digits, "0x" optional. Throws std::invalid_argument on bad hex,
    // wrong length, or a key outside [1, n-1].
    explicit PrivateKeySigner(const std::string& private_key_hex);
    ~PrivateKeySigner() override;

    PrivateKeySigner(const PrivateKeySigner&) = delete;
    PrivateKeySigner& operator=(const PrivateKeySigner&) = delete;

    // "0x" + 40 lowercase hex
    const std::string& address() const { return address_; }

    std::vector<std::uint8_t> sign_typed_data(const TypedDataDomain& domain,
                                              const TypedDataSchema& types,
                                              const PhantomAgent& message) override;

private:
    PrivateKey key_{};
    std::string address_;
};
