#pragma once
#include "action_encoder.hpp"
#include "address.hpp"
#include "signature.hpp"
#include "signer.hpp"
#include "typed_data.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>

// source "a" on mainnet, "b" everywhere else
PhantomAgent construct_phantom_agent(const Hash32& hash, bool is_mainnet);

// Signs an already computed action hash under the fixed phantom domain
Signature sign_phantom_agent(ISigner& signer, const Hash32& hash, bool is_mainnet);

// hash -> phantom agent -> signature.
// Either everything succeeds or an exception propagates; no partial output.
Signature sign_l1_action(ISigner& signer,
                         const Action& action,
                         const std::optional<Address>& vault_address,
                         std::uint64_t nonce,
                         bool is_mainnet);

// Same, for an action object built by hand (must already be in wire key order)
Signature sign_l1_action(ISigner& signer,
                         const nlohmann::ordered_json& action,
                         const std::optional<Address>& vault_address,
                         std::uint64_t nonce,
                         bool is_mainnet);
