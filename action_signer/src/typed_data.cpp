#include "typed_data.hpp"

#include <cstring>
#include <stdexcept>

static void store_u256_be(std::uint64_t v, std::uint8_t out[32]) {
    std::memset(out, 0, 32);
    for (int i = 0; i < 8; i++) {
        out[31 - i] = static_cast<std::uint8_t>(v & 0xFFu);
        v >>= 8;
    }
}

const TypedDataDomain& phantom_domain() {
    static const TypedDataDomain domain{"Exchange", "1", 1337, {}};
    return domain;
}

const TypedDataSchema& agent_schema() {
    static const TypedDataSchema schema{
        "Agent",
        {
            {"source", "string"},
            {"connectionId", "bytes32"},
        }
    };
    return schema;
}

std::string encode_type(const TypedDataSchema& schema) {
    std::string out = schema.primary_type + "(";
    for (std::size_t i = 0; i < schema.fields.size(); i++) {
        if (i > 0) out += ",";
        out += schema.fields[i].type + " " + schema.fields[i].name;
    }
    out += ")";
    return out;
}

Hash32 domain_separator(const TypedDataDomain& domain) {
    static const Hash32 type_hash = keccak_256(std::string(
        "EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)"));

    std::uint8_t chain_id[32];
    store_u256_be(domain.chain_id, chain_id);

    std::uint8_t contract[32];
    std::memset(contract, 0, 12);
    std::memcpy(contract + 12, domain.verifying_contract.data(), 20);

    Keccak256 k;
    k.update(type_hash);
    k.update(keccak_256(domain.name));
    k.update(keccak_256(domain.version));
    k.update(chain_id, 32);
    k.update(contract, 32);
    return k.finalize();
}

Hash32 hash_struct(const TypedDataSchema& schema, const PhantomAgent& agent) {
    Keccak256 k;
    k.update(keccak_256(encode_type(schema)));

    for (const auto& f : schema.fields) {
        if (f.name == "source" && f.type == "string") {
            k.update(keccak_256(agent.source));
        } else if (f.name == "connectionId" && f.type == "bytes32") {
            k.update(agent.connection_id);
        } else {
            throw std::invalid_argument("unsupported typed-data field: " + f.type + " " + f.name);
        }
    }
    return k.finalize();
}

Hash32 typed_data_digest(const TypedDataDomain& domain,
                         const TypedDataSchema& schema,
                         const PhantomAgent& agent) {
    static const std::uint8_t prefix[2] = {0x19, 0x01};

    Keccak256 k;
    k.update(prefix, 2);
    k.update(domain_separator(domain));
    k.update(hash_struct(schema, agent));
    return k.finalize();
}
