#include <gtest/gtest.h>
#include "action_encoder.hpp"
#include "hex.hpp"
#include "signing_errors.hpp"

#include <string>
#include <vector>

static std::vector<std::string> keys_of(const nlohmann::ordered_json& j) {
    std::vector<std::string> out;
    for (auto it = j.begin(); it != j.end(); ++it) out.push_back(it.key());
    return out;
}

static std::string msgpack_hex(const nlohmann::ordered_json& j) {
    return hex_encode(nlohmann::ordered_json::to_msgpack(j));
}

static OrderRequest btc_limit_buy() {
    OrderRequest o;
    o.asset = 0;
    o.is_buy = true;
    o.sz = 0.001;
    o.limit_px = 90000;
    o.reduce_only = false;
    o.order_type = LimitOrderType{Tif::Gtc};
    return o;
}

TEST(OrderWire, RendersMagnitudes) {
    const OrderWire w = order_request_to_order_wire(btc_limit_buy());
    EXPECT_EQ(w.a, 0);
    EXPECT_TRUE(w.b);
    EXPECT_EQ(w.p, "90000");
    EXPECT_EQ(w.s, "0.001");
    EXPECT_FALSE(w.r);
    EXPECT_FALSE(w.c.has_value());
}

TEST(OrderWire, FieldOrderWithoutCloid) {
    const auto j = order_wire_to_json(order_request_to_order_wire(btc_limit_buy()));
    EXPECT_EQ(keys_of(j), (std::vector<std::string>{"a", "b", "p", "s", "r", "t"}));
    EXPECT_FALSE(j.contains("c"));
}

TEST(OrderWire, FieldOrderWithCloid) {
    OrderRequest o = btc_limit_buy();
    o.cloid = Cloid::from_int(1);
    const auto j = order_wire_to_json(order_request_to_order_wire(o));
    EXPECT_EQ(keys_of(j), (std::vector<std::string>{"a", "b", "p", "s", "r", "t", "c"}));
    EXPECT_EQ(j["c"], "0x00000000000000000000000000000001");
}

TEST(OrderWire, PrecisionLossPropagates) {
    OrderRequest o = btc_limit_buy();
    o.sz = 0.123456785;
    EXPECT_THROW(order_request_to_order_wire(o), PrecisionLossError);

    o = btc_limit_buy();
    o.order_type = TriggerOrderType{100.000000001, true, Tpsl::Tp};
    EXPECT_THROW(order_request_to_order_wire(o), PrecisionLossError);
}

TEST(OrderTypeWire, TriggerKeyOrder) {
    OrderRequest o = btc_limit_buy();
    o.order_type = TriggerOrderType{103, false, Tpsl::Sl};
    const auto j = order_wire_to_json(order_request_to_order_wire(o));

    const auto& trig = j["t"]["trigger"];
    EXPECT_EQ(keys_of(trig), (std::vector<std::string>{"isMarket", "triggerPx", "tpsl"}));
    EXPECT_EQ(trig["triggerPx"], "103");
    EXPECT_EQ(trig["tpsl"], "sl");
    EXPECT_EQ(trig["isMarket"], false);
}

TEST(OrderAction, CanonicalBytes) {
    const auto action = order_wires_to_order_action({order_request_to_order_wire(btc_limit_buy())});
    const auto j = action_to_json(action);

    EXPECT_EQ(keys_of(j), (std::vector<std::string>{"type", "orders", "grouping"}));
    EXPECT_EQ(msgpack_hex(j),
              "83a474797065a56f72646572a66f72646572739186a16100a162c3a170a53930303030a173a5302e303031"
              "a172c2a17481a56c696d697481a3746966a3477463a867726f7570696e67a26e61");
}

TEST(OrderAction, TriggerWithCloidAndGrouping) {
    OrderRequest o;
    o.asset = 1;
    o.is_buy = false;
    o.sz = 100;
    o.limit_px = 100;
    o.reduce_only = true;
    o.order_type = TriggerOrderType{103, false, Tpsl::Sl};
    o.cloid = Cloid::from_int(1);

    const auto action = order_wires_to_order_action({order_request_to_order_wire(o)}, Grouping::NormalTpsl);
    EXPECT_EQ(msgpack_hex(action_to_json(action)),
              "83a474797065a56f72646572a66f72646572739187a16101a162c2a170a3313030a173a3313030a172c3"
              "a17481a77472696767657283a869734d61726b6574c2a9747269676765725078a3313033a47470736c"
              "a2736ca163d92230783030303030303030303030303030303030303030303030303030303030303031"
              "a867726f7570696e67aa6e6f726d616c5470736c");
}

TEST(CancelAction, CanonicalBytes) {
    CancelAction a;
    a.cancels.push_back(cancel_request_to_wire({3, 123456789}));
    EXPECT_EQ(msgpack_hex(action_to_json(a)),
              "82a474797065a663616e63656ca763616e63656c739182a16103a16fce075bcd15");
}

TEST(CancelByCloidAction, CanonicalBytes) {
    CancelByCloidAction a;
    a.cancels.push_back(cancel_by_cloid_request_to_wire({2, Cloid::from_int(0xff)}));
    EXPECT_EQ(msgpack_hex(action_to_json(a)),
              "82a474797065ad63616e63656c4279436c6f6964a763616e63656c739182a5617373657402a5636c6f6964"
              "d92230783030303030303030303030303030303030303030303030303030303030306666");
}

TEST(CancelByCloidAction, RequestFieldsReachTheWire) {
    CancelByCloidRequest req{7, Cloid::from_str("0x0000000000000000000000000000ABCD")};
    const CancelByCloidWire w = cancel_by_cloid_request_to_wire(req);
    EXPECT_EQ(w.asset, 7);
    EXPECT_EQ(w.cloid, "0x0000000000000000000000000000abcd");

    CancelByCloidRequest first{0, Cloid::from_int(3)};
    EXPECT_EQ(cancel_by_cloid_request_to_wire(first).asset, 0);
}

TEST(ModifyAction, OidOrCloid) {
    OrderRequest o;
    o.asset = 0;
    o.is_buy = true;
    o.sz = 2;
    o.limit_px = 1;
    o.order_type = LimitOrderType{Tif::Alo};

    ModifyAction by_oid;
    by_oid.modifies.push_back(modify_request_to_wire({std::uint64_t{42}, o}));
    EXPECT_EQ(msgpack_hex(action_to_json(by_oid)),
              "82a474797065ab62617463684d6f64696679a86d6f6469666965739182a36f69642aa56f7264657286"
              "a16100a162c3a170a131a173a132a172c2a17481a56c696d697481a3746966a3416c6f");

    ModifyAction by_cloid;
    by_cloid.modifies.push_back(modify_request_to_wire({Cloid::from_int(1), o}));
    EXPECT_EQ(msgpack_hex(action_to_json(by_cloid)),
              "82a474797065ab62617463684d6f64696679a86d6f6469666965739182a36f6964d922"
              "30783030303030303030303030303030303030303030303030303030303030303031"
              "a56f7264657286a16100a162c3a170a131a173a132a172c2a17481a56c696d697481a3746966a3416c6f");
}

TEST(ScheduleCancelAction, TimeIsOmittedWhenAbsent) {
    ScheduleCancelAction with_time;
    with_time.time = 1700000000000ULL;
    EXPECT_EQ(msgpack_hex(action_to_json(with_time)),
              "82a474797065ae7363686564756c6543616e63656ca474696d65cf0000018bcfe56800");

    ScheduleCancelAction clear;
    const auto j = action_to_json(clear);
    EXPECT_FALSE(j.contains("time"));
    EXPECT_EQ(msgpack_hex(j), "81a474797065ae7363686564756c6543616e63656c");
}

TEST(Action, TypeTags) {
    EXPECT_STREQ(action_type(Action{OrderAction{}}), "order");
    EXPECT_STREQ(action_type(Action{CancelAction{}}), "cancel");
    EXPECT_STREQ(action_type(Action{CancelByCloidAction{}}), "cancelByCloid");
    EXPECT_STREQ(action_type(Action{ModifyAction{}}), "batchModify");
    EXPECT_STREQ(action_type(Action{ScheduleCancelAction{}}), "scheduleCancel");
}

TEST(OrderTags, ParseRoundTrip) {
    EXPECT_EQ(parse_tif("Alo"), Tif::Alo);
    EXPECT_STREQ(to_string(Tif::Ioc), "Ioc");
    EXPECT_EQ(parse_grouping("positionTpsl"), Grouping::PositionTpsl);
    EXPECT_THROW(parse_tif("GTC"), InvalidOrderTypeError);
    EXPECT_THROW(parse_tpsl("stop"), InvalidOrderTypeError);
    EXPECT_THROW(parse_grouping("none"), InvalidOrderTypeError);
}
