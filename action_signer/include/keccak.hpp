#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using Hash32 = std::array<std::uint8_t, 32>;

// Keccak-256 as used by Ethereum (original 0x01 padding, not FIPS-202 SHA3).
// Incremental: update() any number of times, then finalize() once.
class Keccak256 {
public:
    Keccak256();

    void update(const std::uint8_t* data, std::size_t len);
    void update(const std::vector<std::uint8_t>& data) { update(data.data(), data.size()); }
    void update(const Hash32& data) { update(data.data(), data.size()); }

    Hash32 finalize();

private:
    static constexpr std::size_t kRate = 136;

    void absorb_block(const std::uint8_t* block);

    std::uint64_t state_[25];
    std::uint8_t buf_[kRate];
    std::size_t buf_len_ = 0;
};

Hash32 keccak_256(const std::uint8_t* data, std::size_t len);
Hash32 keccak_256(const std::vector<std::uint8_t>& data);
Hash32 keccak_256(const std::string& data);
