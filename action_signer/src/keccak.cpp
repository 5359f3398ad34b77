#include "keccak.hpp"

#include <cstring>

static const std::uint64_t kRoundConstants[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL,
    0x8000000080008000ULL, 0x000000000000808BULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008AULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800AULL, 0x800000008000000AULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

// rho offsets and pi lane order, walking from lane 1
static const int kRotations[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};
static const int kPiLanes[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

static inline std::uint64_t rotl64(std::uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

static void keccak_f1600(std::uint64_t st[25]) {
    for (int round = 0; round < 24; round++) {
        std::uint64_t bc[5];

        // theta
        for (int i = 0; i < 5; i++)
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        for (int i = 0; i < 5; i++) {
            std::uint64_t t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) st[i + j] ^= t;
        }

        // rho + pi
        std::uint64_t t = st[1];
        for (int i = 0; i < 24; i++) {
            int j = kPiLanes[i];
            std::uint64_t tmp = st[j];
            st[j] = rotl64(t, kRotations[i]);
            t = tmp;
        }

        // chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; i++) bc[i] = st[j + i];
            for (int i = 0; i < 5; i++)
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
        }

        // iota
        st[0] ^= kRoundConstants[round];
    }
}

Keccak256::Keccak256() {
    std::memset(state_, 0, sizeof(state_));
    std::memset(buf_, 0, sizeof(buf_));
}

void Keccak256::absorb_block(const std::uint8_t* block) {
    for (std::size_t i = 0; i < kRate / 8; i++) {
        std::uint64_t lane = 0;
        for (int b = 0; b < 8; b++)
            lane |= static_cast<std::uint64_t>(block[i * 8 + b]) << (8 * b);
        state_[i] ^= lane;
    }
    keccak_f1600(state_);
}

void Keccak256::update(const std::uint8_t* data, std::size_t len) {
    while (len > 0) {
        std::size_t take = kRate - buf_len_;
        if (take > len) take = len;
        std::memcpy(buf_ + buf_len_, data, take);
        buf_len_ += take;
        data += take;
        len -= take;

        if (buf_len_ == kRate) {
            absorb_block(buf_);
            buf_len_ = 0;
        }
    }
}

Hash32 Keccak256::finalize() {
    // pad10*1 with the Keccak domain byte 0x01
    std::memset(buf_ + buf_len_, 0, kRate - buf_len_);
    buf_[buf_len_] ^= 0x01;
    buf_[kRate - 1] ^= 0x80;
    absorb_block(buf_);

    Hash32 out{};
    for (std::size_t i = 0; i < out.size(); i++)
        out[i] = static_cast<std::uint8_t>(state_[i / 8] >> (8 * (i % 8)));
    return out;
}

Hash32 keccak_256(const std::uint8_t* data, std::size_t len) {
    Keccak256 k;
    k.update(data, len);
    return k.finalize();
}

Hash32 keccak_256(const std::vector<std::uint8_t>& data) {
    return keccak_256(data.data(), data.size());
}

Hash32 keccak_256(const std::string& data) {
    return keccak_256(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}
