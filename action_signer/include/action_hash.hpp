#pragma once
#include "action_encoder.hpp"
#include "address.hpp"
#include "keccak.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <vector>

// Bytes fed to keccak for an L1 action:
//   msgpack(action) || nonce (8 bytes, big-endian) || 0x00
//   msgpack(action) || nonce (8 bytes, big-endian) || 0x01 || vault (20 bytes)
std::vector<std::uint8_t> action_hash_input(const nlohmann::ordered_json& action,
                                            const std::optional<Address>& vault_address,
                                            std::uint64_t nonce);

// keccak256 of action_hash_input(); becomes the phantom agent's connectionId
Hash32 action_hash(const nlohmann::ordered_json& action,
                   const std::optional<Address>& vault_address,
                   std::uint64_t nonce);

Hash32 action_hash(const Action& action,
                   const std::optional<Address>& vault_address,
                   std::uint64_t nonce);
