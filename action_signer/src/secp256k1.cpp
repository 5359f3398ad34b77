#include "secp256k1.hpp"
#include "hex.hpp"
#include "signing_errors.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/obj_mac.h>

#include <cstring>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

struct BnDeleter      { void operator()(BIGNUM* b) const   { BN_clear_free(b); } };
struct BnCtxDeleter   { void operator()(BN_CTX* c) const   { BN_CTX_free(c); } };
struct EcGroupDeleter { void operator()(EC_GROUP* g) const { EC_GROUP_free(g); } };
struct EcPointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };

using BnPtr      = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr   = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;

using Bytes32 = std::array<std::uint8_t, 32>;

static void check(int ok, const char* what) {
    if (ok != 1) throw std::runtime_error(std::string("secp256k1: ") + what + " failed");
}

template <typename T>
static T* check_ptr(T* p, const char* what) {
    if (!p) throw std::runtime_error(std::string("secp256k1: ") + what + " failed");
    return p;
}

static BnPtr bn_new() {
    return BnPtr(check_ptr(BN_new(), "BN_new"));
}

static BnPtr bn_from(const std::uint8_t* data, std::size_t len) {
    return BnPtr(check_ptr(BN_bin2bn(data, (int)len, nullptr), "BN_bin2bn"));
}

static Bytes32 bn_to_32be(const BIGNUM* bn) {
    Bytes32 out{};
    if (BN_bn2binpad(bn, out.data(), (int)out.size()) != (int)out.size())
        throw std::runtime_error("secp256k1: BN_bn2binpad failed");
    return out;
}

static EcGroupPtr secp_group() {
    return EcGroupPtr(check_ptr(EC_GROUP_new_by_curve_name(NID_secp256k1), "EC_GROUP_new_by_curve_name"));
}

static Bytes32 hmac_sha256(const Bytes32& key, const std::vector<std::uint8_t>& msg) {
    Bytes32 out{};
    unsigned int outlen = 0;
    const unsigned char* res = HMAC(EVP_sha256(),
                                    key.data(), (int)key.size(),
                                    msg.data(), msg.size(),
                                    out.data(), &outlen);
    if (!res || outlen != out.size())
        throw std::runtime_error("secp256k1: HMAC-SHA256 failed");
    return out;
}

static std::vector<std::uint8_t> concat(std::initializer_list<std::pair<const std::uint8_t*, std::size_t>> parts) {
    std::vector<std::uint8_t> out;
    for (const auto& p : parts) out.insert(out.end(), p.first, p.first + p.second);
    return out;
}

void check_private_key(const PrivateKey& key) {
    auto group = secp_group();
    const BIGNUM* n = EC_GROUP_get0_order(group.get());
    BnPtr d = bn_from(key.data(), key.size());
    if (BN_is_zero(d.get()) || BN_cmp(d.get(), n) >= 0)
        throw std::invalid_argument("private key out of range");
}

RecoverableSignature ecdsa_sign_digest(const PrivateKey& key, const Hash32& digest) {
    check_private_key(key);

    auto group = secp_group();
    BnCtxPtr ctx(check_ptr(BN_CTX_new(), "BN_CTX_new"));
    const BIGNUM* n = EC_GROUP_get0_order(group.get());

    BnPtr d = bn_from(key.data(), key.size());
    BnPtr e = bn_from(digest.data(), digest.size());
    check(BN_nnmod(e.get(), e.get(), n, ctx.get()), "BN_nnmod");

    BnPtr half_n = bn_new();
    check(BN_rshift1(half_n.get(), n), "BN_rshift1");

    // RFC 6979 3.2: x = int2octets(d), h1 = bits2octets(digest)
    const Bytes32 h1 = bn_to_32be(e.get());
    Bytes32 v;
    Bytes32 k;
    v.fill(0x01);
    k.fill(0x00);

    const std::uint8_t zero = 0x00;
    const std::uint8_t one  = 0x01;

    k = hmac_sha256(k, concat({{v.data(), 32}, {&zero, 1}, {key.data(), 32}, {h1.data(), 32}}));
    v = hmac_sha256(k, {v.begin(), v.end()});
    k = hmac_sha256(k, concat({{v.data(), 32}, {&one, 1}, {key.data(), 32}, {h1.data(), 32}}));
    v = hmac_sha256(k, {v.begin(), v.end()});

    EcPointPtr R(check_ptr(EC_POINT_new(group.get()), "EC_POINT_new"));
    BnPtr kbn = bn_new();
    BnPtr rx = bn_new();
    BnPtr ry = bn_new();
    BnPtr r = bn_new();
    BnPtr s = bn_new();
    BnPtr tmp = bn_new();

    for (;;) {
        v = hmac_sha256(k, {v.begin(), v.end()});
        check_ptr(BN_bin2bn(v.data(), (int)v.size(), kbn.get()), "BN_bin2bn");

        if (!BN_is_zero(kbn.get()) && BN_cmp(kbn.get(), n) < 0) {
            check(EC_POINT_mul(group.get(), R.get(), kbn.get(), nullptr, nullptr, ctx.get()), "EC_POINT_mul");
            check(EC_POINT_get_affine_coordinates(group.get(), R.get(), rx.get(), ry.get(), ctx.get()),
                  "EC_POINT_get_affine_coordinates");
            check(BN_nnmod(r.get(), rx.get(), n, ctx.get()), "BN_nnmod");

            if (!BN_is_zero(r.get())) {
                BnPtr kinv(check_ptr(BN_mod_inverse(nullptr, kbn.get(), n, ctx.get()), "BN_mod_inverse"));

                // s = k^-1 (e + r*d) mod n
                check(BN_mod_mul(tmp.get(), r.get(), d.get(), n, ctx.get()), "BN_mod_mul");
                check(BN_mod_add(tmp.get(), tmp.get(), e.get(), n, ctx.get()), "BN_mod_add");
                check(BN_mod_mul(s.get(), kinv.get(), tmp.get(), n, ctx.get()), "BN_mod_mul");

                if (!BN_is_zero(s.get())) {
                    int recid = BN_is_odd(ry.get()) ? 1 : 0;
                    if (BN_cmp(rx.get(), n) >= 0) recid |= 2;

                    // low-s; negating s mirrors R, so the parity bit flips
                    if (BN_cmp(s.get(), half_n.get()) > 0) {
                        check(BN_sub(s.get(), n, s.get()), "BN_sub");
                        recid ^= 1;
                    }

                    RecoverableSignature out;
                    out.r = bn_to_32be(r.get());
                    out.s = bn_to_32be(s.get());
                    out.recovery_id = recid;
                    OPENSSL_cleanse(k.data(), k.size());
                    OPENSSL_cleanse(v.data(), v.size());
                    return out;
                }
            }
        }

        // RFC 6979 3.2 step h.3
        k = hmac_sha256(k, concat({{v.data(), 32}, {&zero, 1}}));
        v = hmac_sha256(k, {v.begin(), v.end()});
    }
}

std::array<std::uint8_t, 64> public_key_xy(const PrivateKey& key) {
    check_private_key(key);

    auto group = secp_group();
    BnCtxPtr ctx(check_ptr(BN_CTX_new(), "BN_CTX_new"));
    BnPtr d = bn_from(key.data(), key.size());

    EcPointPtr Q(check_ptr(EC_POINT_new(group.get()), "EC_POINT_new"));
    check(EC_POINT_mul(group.get(), Q.get(), d.get(), nullptr, nullptr, ctx.get()), "EC_POINT_mul");

    BnPtr x = bn_new();
    BnPtr y = bn_new();
    check(EC_POINT_get_affine_coordinates(group.get(), Q.get(), x.get(), y.get(), ctx.get()),
          "EC_POINT_get_affine_coordinates");

    std::array<std::uint8_t, 64> out{};
    const Bytes32 xb = bn_to_32be(x.get());
    const Bytes32 yb = bn_to_32be(y.get());
    std::memcpy(out.data(), xb.data(), 32);
    std::memcpy(out.data() + 32, yb.data(), 32);
    return out;
}

std::string address_from_public_key(const std::array<std::uint8_t, 64>& xy) {
    const Hash32 h = keccak_256(xy.data(), xy.size());
    return hex_encode(h.data() + 12, 20, true);
}

std::string recover_address(const Hash32& digest, const Signature& sig) {
    if (sig.v != 27 && sig.v != 28)
        throw InvalidSignatureError("bad sig v " + std::to_string(sig.v));

    auto group = secp_group();
    BnCtxPtr ctx(check_ptr(BN_CTX_new(), "BN_CTX_new"));
    const BIGNUM* n = EC_GROUP_get0_order(group.get());

    BnPtr r = bn_from(sig.r.data(), sig.r.size());
    BnPtr s = bn_from(sig.s.data(), sig.s.size());
    if (BN_is_zero(r.get()) || BN_cmp(r.get(), n) >= 0 ||
        BN_is_zero(s.get()) || BN_cmp(s.get(), n) >= 0)
        throw InvalidSignatureError("signature r/s out of range");

    // v 27/28 only encodes the parity; R.x == r
    EcPointPtr R(check_ptr(EC_POINT_new(group.get()), "EC_POINT_new"));
    if (EC_POINT_set_compressed_coordinates(group.get(), R.get(), r.get(), sig.v - 27, ctx.get()) != 1)
        throw InvalidSignatureError("signature r is not an x coordinate on the curve");

    BnPtr e = bn_from(digest.data(), digest.size());
    check(BN_nnmod(e.get(), e.get(), n, ctx.get()), "BN_nnmod");

    // Q = r^-1 (s*R - e*G) = u1*G + u2*R, u1 = -e/r, u2 = s/r
    BnPtr rinv(check_ptr(BN_mod_inverse(nullptr, r.get(), n, ctx.get()), "BN_mod_inverse"));
    BnPtr zero = bn_new();
    BN_zero(zero.get());
    BnPtr u1 = bn_new();
    BnPtr u2 = bn_new();
    check(BN_mod_sub(u1.get(), zero.get(), e.get(), n, ctx.get()), "BN_mod_sub");
    check(BN_mod_mul(u1.get(), u1.get(), rinv.get(), n, ctx.get()), "BN_mod_mul");
    check(BN_mod_mul(u2.get(), s.get(), rinv.get(), n, ctx.get()), "BN_mod_mul");

    EcPointPtr Q(check_ptr(EC_POINT_new(group.get()), "EC_POINT_new"));
    check(EC_POINT_mul(group.get(), Q.get(), u1.get(), R.get(), u2.get(), ctx.get()), "EC_POINT_mul");
    if (EC_POINT_is_at_infinity(group.get(), Q.get()) == 1)
        throw InvalidSignatureError("recovered point at infinity");

    BnPtr x = bn_new();
    BnPtr y = bn_new();
    check(EC_POINT_get_affine_coordinates(group.get(), Q.get(), x.get(), y.get(), ctx.get()),
          "EC_POINT_get_affine_coordinates");

    std::array<std::uint8_t, 64> xy{};
    const Bytes32 xb = bn_to_32be(x.get());
    const Bytes32 yb = bn_to_32be(y.get());
    std::memcpy(xy.data(), xb.data(), 32);
    std::memcpy(xy.data() + 32, yb.data(), 32);
    return address_from_public_key(xy);
}
