#include "request_config.hpp"
#include "signing_errors.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

static std::string to_lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

const char* default_endpoint(bool is_mainnet) {
    return is_mainnet ? "https://api.hyperliquid.xyz" : "https://api.hyperliquid-testnet.xyz";
}

OrderType order_type_from_json(const json& j) {
    if (j.is_object() && j.contains("limit")) {
        const auto& l = j.at("limit");
        LimitOrderType lt;
        lt.tif = parse_tif(l.at("tif").get<std::string>());
        return lt;
    }
    if (j.is_object() && j.contains("trigger")) {
        const auto& t = j.at("trigger");
        TriggerOrderType tt;
        tt.trigger_px = t.at("triggerPx").get<double>();
        tt.is_market = t.at("isMarket").get<bool>();
        tt.tpsl = parse_tpsl(t.at("tpsl").get<std::string>());
        return tt;
    }
    throw InvalidOrderTypeError("Invalid order type: " + j.dump());
}

OrderRequest order_request_from_json(const json& j) {
    OrderRequest o;
    o.asset = j.at("asset").get<int>();
    o.is_buy = j.at("isBuy").get<bool>();
    o.sz = j.at("sz").get<double>();
    o.limit_px = j.at("limitPx").get<double>();
    o.reduce_only = j.value("reduceOnly", false);
    o.order_type = order_type_from_json(j.at("orderType"));
    if (j.contains("cloid") && !j["cloid"].is_null())
        o.cloid = Cloid::from_str(j["cloid"].get<std::string>());
    return o;
}

static OidOrCloid oid_or_cloid_from_json(const json& j) {
    if (j.contains("cloid") && !j["cloid"].is_null())
        return Cloid::from_str(j["cloid"].get<std::string>());
    return j.at("oid").get<std::uint64_t>();
}

Action action_from_json(const json& j) {
    const std::string type = j.at("type").get<std::string>();

    if (type == "order") {
        std::vector<OrderWire> wires;
        for (const auto& o : j.at("orders"))
            wires.push_back(order_request_to_order_wire(order_request_from_json(o)));
        return order_wires_to_order_action(std::move(wires), parse_grouping(j.value("grouping", "na")));
    }
    if (type == "cancel") {
        CancelAction a;
        for (const auto& c : j.at("cancels"))
            a.cancels.push_back(cancel_request_to_wire({c.at("asset").get<int>(), c.at("oid").get<std::uint64_t>()}));
        return a;
    }
    if (type == "cancelByCloid") {
        CancelByCloidAction a;
        for (const auto& c : j.at("cancels")) {
            CancelByCloidRequest req{c.at("asset").get<int>(), Cloid::from_str(c.at("cloid").get<std::string>())};
            a.cancels.push_back(cancel_by_cloid_request_to_wire(req));
        }
        return a;
    }
    if (type == "batchModify" || type == "modify") {
        ModifyAction a;
        for (const auto& m : j.at("modifies")) {
            ModifyRequest req{oid_or_cloid_from_json(m), order_request_from_json(m.at("order"))};
            a.modifies.push_back(modify_request_to_wire(req));
        }
        return a;
    }
    if (type == "scheduleCancel") {
        ScheduleCancelAction a;
        if (j.contains("time") && !j["time"].is_null())
            a.time = j["time"].get<std::uint64_t>();
        return a;
    }
    throw InvalidOrderTypeError("unknown action type: " + type);
}

PlaceOrderConfig parse_place_order_config(const json& j) {
    PlaceOrderConfig c;

    const std::string network = to_lower(j.value("network", "testnet"));
    if (network != "mainnet" && network != "testnet")
        throw std::invalid_argument("network must be mainnet or testnet: " + network);
    c.is_mainnet = (network == "mainnet");

    c.endpoint = j.value("endpoint", std::string(default_endpoint(c.is_mainnet)));

    if (j.contains("vaultAddress") && !j["vaultAddress"].is_null())
        c.vault_address = Address::parse(j["vaultAddress"].get<std::string>());

    if (j.contains("nonce") && !j["nonce"].is_null())
        c.nonce = j["nonce"].get<std::uint64_t>();

    c.send = j.value("send", false);
    c.action = action_from_json(j.at("action"));
    return c;
}

nlohmann::ordered_json build_exchange_request(const Action& action,
                                              std::uint64_t nonce,
                                              const Signature& signature,
                                              const std::optional<Address>& vault_address) {
    nlohmann::ordered_json req;
    req["action"] = action_to_json(action);
    req["nonce"] = nonce;
    req["signature"] = signature.to_json();
    if (vault_address) req["vaultAddress"] = vault_address->to_hex();
    return req;
}
