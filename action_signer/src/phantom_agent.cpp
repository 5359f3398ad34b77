#include "phantom_agent.hpp"
#include "action_hash.hpp"
#include "hex.hpp"
#include "log.hpp"

PhantomAgent construct_phantom_agent(const Hash32& hash, bool is_mainnet) {
    PhantomAgent agent;
    agent.source = is_mainnet ? "a" : "b";
    agent.connection_id = hash;
    return agent;
}

Signature sign_phantom_agent(ISigner& signer, const Hash32& hash, bool is_mainnet) {
    const PhantomAgent agent = construct_phantom_agent(hash, is_mainnet);

    if (debug_enabled())
        log_debug("PhantomAgent", "source=" + agent.source + " connectionId=" + hex_encode(hash, true));

    return split_signature(signer.sign_typed_data(phantom_domain(), agent_schema(), agent));
}

Signature sign_l1_action(ISigner& signer,
                         const Action& action,
                         const std::optional<Address>& vault_address,
                         std::uint64_t nonce,
                         bool is_mainnet) {
    return sign_phantom_agent(signer, action_hash(action, vault_address, nonce), is_mainnet);
}

Signature sign_l1_action(ISigner& signer,
                         const nlohmann::ordered_json& action,
                         const std::optional<Address>& vault_address,
                         std::uint64_t nonce,
                         bool is_mainnet) {
    return sign_phantom_agent(signer, action_hash(action, vault_address, nonce), is_mainnet);
}
