#pragma once
#include "action_encoder.hpp"
#include "address.hpp"
#include "signature.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

/* ================= config.json ================= */

struct PlaceOrderConfig {
    bool is_mainnet = false;
    std::string endpoint;                       // base URL, network default when absent
    std::optional<Address> vault_address;
    std::optional<std::uint64_t> nonce;         // wall clock when absent
    bool send = false;                          // POST to the exchange, otherwise print only
    Action action;
};

const char* default_endpoint(bool is_mainnet);

// Throws InvalidOrderTypeError / InvalidCloidError / MalformedAddressError /
// PrecisionLossError on bad protocol fields and nlohmann::json::exception on
// missing or mistyped keys.
PlaceOrderConfig parse_place_order_config(const nlohmann::json& j);

// {"type": "order" | "cancel" | "cancelByCloid" | "batchModify" | "scheduleCancel", ...}
Action action_from_json(const nlohmann::json& j);

OrderRequest order_request_from_json(const nlohmann::json& j);

// {"limit": {"tif": ...}} or {"trigger": {"triggerPx", "isMarket", "tpsl"}}
OrderType order_type_from_json(const nlohmann::json& j);

/* ================= Request body ================= */

// {action, nonce, signature, vaultAddress?}
nlohmann::ordered_json build_exchange_request(const Action& action,
                                              std::uint64_t nonce,
                                              const Signature& signature,
                                              const std::optional<Address>& vault_address);
