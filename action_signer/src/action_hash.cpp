#include "action_hash.hpp"
#include "hex.hpp"
#include "log.hpp"

#include <string>

static void append_u64_be(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8)
        out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFF));
}

std::vector<std::uint8_t> action_hash_input(const nlohmann::ordered_json& action,
                                            const std::optional<Address>& vault_address,
                                            std::uint64_t nonce) {
    std::vector<std::uint8_t> data = nlohmann::ordered_json::to_msgpack(action);
    data.reserve(data.size() + 8 + 1 + 20);

    append_u64_be(data, nonce);

    if (!vault_address) {
        data.push_back(0x00);
    } else {
        data.push_back(0x01);
        const auto& b = vault_address->bytes();
        data.insert(data.end(), b.begin(), b.end());
    }
    return data;
}

Hash32 action_hash(const nlohmann::ordered_json& action,
                   const std::optional<Address>& vault_address,
                   std::uint64_t nonce) {
    const auto data = action_hash_input(action, vault_address, nonce);
    const Hash32 h = keccak_256(data);

    if (debug_enabled()) {
        log_debug("ActionHash",
                  "input=" + hex_encode(data) +
                  " nonce=" + std::to_string(nonce) +
                  " vault=" + (vault_address ? vault_address->to_hex() : std::string("none")) +
                  " hash=" + hex_encode(h, true));
    }
    return h;
}

Hash32 action_hash(const Action& action,
                   const std::optional<Address>& vault_address,
                   std::uint64_t nonce) {
    return action_hash(action_to_json(action), vault_address, nonce);
}
