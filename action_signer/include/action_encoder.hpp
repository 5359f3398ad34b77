#pragma once
#include "order_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/* ================= Wire shapes (magnitudes already rendered) ================= */

struct LimitOrderTypeWire {
    Tif tif = Tif::Gtc;
};

struct TriggerOrderTypeWire {
    std::string trigger_px;
    bool is_market = false;
    Tpsl tpsl = Tpsl::Tp;
};

using OrderTypeWire = std::variant<LimitOrderTypeWire, TriggerOrderTypeWire>;

// Single-letter members mirror the wire keys a/b/p/s/r/t/c
struct OrderWire {
    int a = 0;                       // asset
    bool b = false;                  // is buy
    std::string p;                   // limit price
    std::string s;                   // size
    bool r = false;                  // reduce only
    OrderTypeWire t;                 // order type
    std::optional<std::string> c;    // cloid, key omitted when empty
};

struct CancelWire {
    int a = 0;                       // asset
    std::uint64_t o = 0;             // order id
};

struct CancelByCloidWire {
    int asset = 0;
    std::string cloid;
};

struct ModifyWire {
    OidOrCloid oid;
    OrderWire order;
};

/* ================= Actions ================= */

struct OrderAction {
    std::vector<OrderWire> orders;
    Grouping grouping = Grouping::Na;
};

struct CancelAction {
    std::vector<CancelWire> cancels;
};

struct CancelByCloidAction {
    std::vector<CancelByCloidWire> cancels;
};

struct ModifyAction {
    std::vector<ModifyWire> modifies;
};

// Dead-man switch: cancel everything at `time` (ms). No time clears the schedule.
struct ScheduleCancelAction {
    std::optional<std::uint64_t> time;
};

using Action = std::variant<OrderAction, CancelAction, CancelByCloidAction, ModifyAction, ScheduleCancelAction>;

/* ================= Request -> wire ================= */

// Throws InvalidOrderTypeError when the variant holds neither limit nor trigger,
// PrecisionLossError when trigger_px is not representable at 8 decimals.
OrderTypeWire order_type_to_wire(const OrderType& order_type);

OrderWire order_request_to_order_wire(const OrderRequest& order);
CancelWire cancel_request_to_wire(const CancelRequest& cancel);
CancelByCloidWire cancel_by_cloid_request_to_wire(const CancelByCloidRequest& cancel);
ModifyWire modify_request_to_wire(const ModifyRequest& modify);

OrderAction order_wires_to_order_action(std::vector<OrderWire> orders, Grouping grouping = Grouping::Na);

/* ================= Wire -> canonical object ================= */

// Key order is part of the signed contract; ordered_json keeps insertion order
// and to_msgpack emits it unchanged.
nlohmann::ordered_json order_wire_to_json(const OrderWire& wire);

// {type, orders|cancels|modifies|time, grouping?}
nlohmann::ordered_json action_to_json(const Action& action);

// "order", "cancel", "cancelByCloid", "batchModify", "scheduleCancel"
const char* action_type(const Action& action);
