#pragma once
#include "keccak.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// EIP-712 domain. verifying_contract is a raw 20-byte address.
struct TypedDataDomain {
    std::string name;
    std::string version;
    std::uint64_t chain_id = 0;
    std::array<std::uint8_t, 20> verifying_contract{};
};

struct TypedDataField {
    std::string name;
    std::string type;   // "string" or "bytes32"
};

struct TypedDataSchema {
    std::string primary_type;
    std::vector<TypedDataField> fields;
};

// Message signed for every L1 action. Lives for one signing call only.
struct PhantomAgent {
    std::string source;      // "a" mainnet, "b" testnet
    Hash32 connection_id{};  // action hash
};

// Fixed protocol constants: Exchange / "1" / chain 1337 / zero contract
const TypedDataDomain& phantom_domain();

// Agent(string source,bytes32 connectionId)
const TypedDataSchema& agent_schema();

// "Agent(string source,bytes32 connectionId)"
std::string encode_type(const TypedDataSchema& schema);

Hash32 domain_separator(const TypedDataDomain& domain);

// keccak(typeHash || encoded fields) in schema field order.
// Throws std::invalid_argument on a field name or type the agent does not carry.
Hash32 hash_struct(const TypedDataSchema& schema, const PhantomAgent& agent);

// keccak(0x19 0x01 || domainSeparator || hashStruct(agent))
Hash32 typed_data_digest(const TypedDataDomain& domain,
                         const TypedDataSchema& schema,
                         const PhantomAgent& agent);
