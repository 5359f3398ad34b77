#include <gtest/gtest.h>
#include "request_config.hpp"
#include "signing_errors.hpp"

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using json = nlohmann::json;

static json order_config() {
    return json::parse(R"({
        "network": "testnet",
        "nonce": 1700000000000,
        "send": false,
        "action": {
            "type": "order",
            "orders": [{
                "asset": 0, "isBuy": true, "sz": 0.001, "limitPx": 90000,
                "reduceOnly": false, "orderType": {"limit": {"tif": "Gtc"}}
            }]
        }
    })");
}

static std::vector<std::string> keys_of(const nlohmann::ordered_json& j) {
    std::vector<std::string> out;
    for (auto it = j.begin(); it != j.end(); ++it) out.push_back(it.key());
    return out;
}

TEST(RequestConfig, ParsesOrder) {
    const PlaceOrderConfig c = parse_place_order_config(order_config());
    EXPECT_FALSE(c.is_mainnet);
    EXPECT_EQ(c.endpoint, "https://api.hyperliquid-testnet.xyz");
    EXPECT_FALSE(c.vault_address.has_value());
    ASSERT_TRUE(c.nonce.has_value());
    EXPECT_EQ(*c.nonce, 1700000000000ULL);
    EXPECT_FALSE(c.send);

    const auto* oa = std::get_if<OrderAction>(&c.action);
    ASSERT_NE(oa, nullptr);
    ASSERT_EQ(oa->orders.size(), 1u);
    EXPECT_EQ(oa->orders[0].p, "90000");
    EXPECT_EQ(oa->orders[0].s, "0.001");
    EXPECT_EQ(oa->grouping, Grouping::Na);
}

TEST(RequestConfig, NetworkDefaultsAndEndpoint) {
    json j = order_config();
    j["network"] = "Mainnet";
    const PlaceOrderConfig c = parse_place_order_config(j);
    EXPECT_TRUE(c.is_mainnet);
    EXPECT_EQ(c.endpoint, "https://api.hyperliquid.xyz");

    j["endpoint"] = "http://127.0.0.1:3001";
    EXPECT_EQ(parse_place_order_config(j).endpoint, "http://127.0.0.1:3001");

    j["network"] = "devnet";
    EXPECT_THROW(parse_place_order_config(j), std::invalid_argument);
}

TEST(RequestConfig, VaultAddress) {
    json j = order_config();
    j["vaultAddress"] = "0x1719884EB866CB12B2287399B15F7DB5E7D775EA";
    const PlaceOrderConfig c = parse_place_order_config(j);
    ASSERT_TRUE(c.vault_address.has_value());
    EXPECT_EQ(c.vault_address->to_hex(), "0x1719884eb866cb12b2287399b15f7db5e7d775ea");

    j["vaultAddress"] = "0x1234";
    EXPECT_THROW(parse_place_order_config(j), MalformedAddressError);
}

TEST(RequestConfig, RejectsUnknownTags) {
    json j = order_config();
    j["action"]["orders"][0]["orderType"] = {{"market", json::object()}};
    EXPECT_THROW(parse_place_order_config(j), InvalidOrderTypeError);

    j = order_config();
    j["action"]["orders"][0]["orderType"]["limit"]["tif"] = "Fok";
    EXPECT_THROW(parse_place_order_config(j), InvalidOrderTypeError);

    j = order_config();
    j["action"]["type"] = "withdraw";
    EXPECT_THROW(parse_place_order_config(j), InvalidOrderTypeError);

    j = order_config();
    j["action"]["grouping"] = "oco";
    EXPECT_THROW(parse_place_order_config(j), InvalidOrderTypeError);
}

TEST(RequestConfig, RejectsBadCloidAndPrecision) {
    json j = order_config();
    j["action"]["orders"][0]["cloid"] = "0x1234";
    EXPECT_THROW(parse_place_order_config(j), InvalidCloidError);

    j = order_config();
    j["action"]["orders"][0]["sz"] = 0.123456785;
    EXPECT_THROW(parse_place_order_config(j), PrecisionLossError);
}

TEST(RequestConfig, MissingKeyIsJsonError) {
    json j = order_config();
    j["action"]["orders"][0].erase("limitPx");
    EXPECT_THROW(parse_place_order_config(j), json::exception);
}

TEST(RequestConfig, TriggerOrder) {
    const json j = json::parse(R"({
        "asset": 1, "isBuy": false, "sz": 100, "limitPx": 100, "reduceOnly": true,
        "orderType": {"trigger": {"triggerPx": 103, "isMarket": true, "tpsl": "sl"}},
        "cloid": "0x00000000000000000000000000000001"
    })");
    const OrderRequest o = order_request_from_json(j);
    const auto* t = std::get_if<TriggerOrderType>(&o.order_type);
    ASSERT_NE(t, nullptr);
    EXPECT_DOUBLE_EQ(t->trigger_px, 103);
    EXPECT_TRUE(t->is_market);
    EXPECT_EQ(t->tpsl, Tpsl::Sl);
    EXPECT_TRUE(o.reduce_only);
    ASSERT_TRUE(o.cloid.has_value());
    EXPECT_EQ(o.cloid->to_raw(), "0x00000000000000000000000000000001");
}

TEST(RequestConfig, OtherActions) {
    Action a = action_from_json(json::parse(R"({"type": "cancel", "cancels": [{"asset": 3, "oid": 123456789}]})"));
    ASSERT_NE(std::get_if<CancelAction>(&a), nullptr);
    EXPECT_EQ(std::get<CancelAction>(a).cancels[0].o, 123456789u);

    a = action_from_json(json::parse(
        R"({"type": "cancelByCloid", "cancels": [{"asset": 2, "cloid": "0x000000000000000000000000deadbeef"}]})"));
    ASSERT_NE(std::get_if<CancelByCloidAction>(&a), nullptr);
    EXPECT_EQ(std::get<CancelByCloidAction>(a).cancels[0].cloid, "0x000000000000000000000000deadbeef");

    a = action_from_json(json::parse(R"({"type": "batchModify", "modifies": [{"oid": 42, "order": {
        "asset": 0, "isBuy": true, "sz": 1, "limitPx": 2, "orderType": {"limit": {"tif": "Alo"}}}}]})"));
    ASSERT_NE(std::get_if<ModifyAction>(&a), nullptr);
    EXPECT_EQ(std::get<std::uint64_t>(std::get<ModifyAction>(a).modifies[0].oid), 42u);

    a = action_from_json(json::parse(R"({"type": "scheduleCancel"})"));
    ASSERT_NE(std::get_if<ScheduleCancelAction>(&a), nullptr);
    EXPECT_FALSE(std::get<ScheduleCancelAction>(a).time.has_value());
}

TEST(ExchangeRequest, BodyShape) {
    const PlaceOrderConfig c = parse_place_order_config(order_config());
    Signature sig;
    sig.r[31] = 1;
    sig.s[31] = 2;

    const auto body = build_exchange_request(c.action, 1700000000000ULL, sig, std::nullopt);
    EXPECT_EQ(keys_of(body), (std::vector<std::string>{"action", "nonce", "signature"}));
    EXPECT_EQ(body["action"]["type"], "order");
    EXPECT_EQ(body["nonce"], 1700000000000ULL);
    EXPECT_EQ(body["signature"]["v"], 27);

    const auto with_vault = build_exchange_request(c.action, 1700000000000ULL, sig,
                                                   Address::parse("0x1719884eb866cb12b2287399b15f7db5e7d775ea"));
    EXPECT_EQ(keys_of(with_vault), (std::vector<std::string>{"action", "nonce", "signature", "vaultAddress"}));
    EXPECT_EQ(with_vault["vaultAddress"], "0x1719884eb866cb12b2287399b15f7db5e7d775ea");
}
