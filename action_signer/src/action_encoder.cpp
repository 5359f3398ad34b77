#include "action_encoder.hpp"
#include "signing_errors.hpp"
#include "wire_codec.hpp"

using ojson = nlohmann::ordered_json;

OrderTypeWire order_type_to_wire(const OrderType& order_type) {
    if (const auto* limit = std::get_if<LimitOrderType>(&order_type)) {
        return LimitOrderTypeWire{limit->tif};
    }
    if (const auto* trigger = std::get_if<TriggerOrderType>(&order_type)) {
        TriggerOrderTypeWire w;
        w.trigger_px = float_to_wire(trigger->trigger_px);
        w.is_market = trigger->is_market;
        w.tpsl = trigger->tpsl;
        return w;
    }
    throw InvalidOrderTypeError("Invalid order type");
}

OrderWire order_request_to_order_wire(const OrderRequest& order) {
    OrderWire w;
    w.a = order.asset;
    w.b = order.is_buy;
    w.p = float_to_wire(order.limit_px);
    w.s = float_to_wire(order.sz);
    w.r = order.reduce_only;
    w.t = order_type_to_wire(order.order_type);
    if (order.cloid) w.c = order.cloid->to_raw();
    return w;
}

CancelWire cancel_request_to_wire(const CancelRequest& cancel) {
    return CancelWire{cancel.asset, cancel.oid};
}

CancelByCloidWire cancel_by_cloid_request_to_wire(const CancelByCloidRequest& cancel) {
    return CancelByCloidWire{cancel.asset, cancel.cloid.to_raw()};
}

ModifyWire modify_request_to_wire(const ModifyRequest& modify) {
    return ModifyWire{modify.oid, order_request_to_order_wire(modify.order)};
}

OrderAction order_wires_to_order_action(std::vector<OrderWire> orders, Grouping grouping) {
    OrderAction a;
    a.orders = std::move(orders);
    a.grouping = grouping;
    return a;
}

static ojson order_type_wire_to_json(const OrderTypeWire& t) {
    ojson j = ojson::object();
    if (const auto* limit = std::get_if<LimitOrderTypeWire>(&t)) {
        ojson l = ojson::object();
        l["tif"] = to_string(limit->tif);
        j["limit"] = std::move(l);
        return j;
    }
    if (const auto* trigger = std::get_if<TriggerOrderTypeWire>(&t)) {
        ojson tr = ojson::object();
        tr["isMarket"]  = trigger->is_market;
        tr["triggerPx"] = trigger->trigger_px;
        tr["tpsl"]      = to_string(trigger->tpsl);
        j["trigger"] = std::move(tr);
        return j;
    }
    throw InvalidOrderTypeError("Invalid order type");
}

static ojson oid_to_json(const OidOrCloid& oid) {
    if (const auto* id = std::get_if<std::uint64_t>(&oid)) return ojson(*id);
    if (const auto* cloid = std::get_if<Cloid>(&oid)) return ojson(cloid->to_raw());
    throw InvalidCloidError("modify target holds neither oid nor cloid");
}

ojson order_wire_to_json(const OrderWire& w) {
    ojson j = ojson::object();
    j["a"] = w.a;
    j["b"] = w.b;
    j["p"] = w.p;
    j["s"] = w.s;
    j["r"] = w.r;
    j["t"] = order_type_wire_to_json(w.t);
    // absent, not null: the verifier hashes a 6-key map when there is no cloid
    if (w.c) j["c"] = *w.c;
    return j;
}

const char* action_type(const Action& action) {
    if (std::holds_alternative<OrderAction>(action))          return "order";
    if (std::holds_alternative<CancelAction>(action))         return "cancel";
    if (std::holds_alternative<CancelByCloidAction>(action))  return "cancelByCloid";
    if (std::holds_alternative<ModifyAction>(action))         return "batchModify";
    if (std::holds_alternative<ScheduleCancelAction>(action)) return "scheduleCancel";
    throw InvalidOrderTypeError("action holds no alternative");
}

ojson action_to_json(const Action& action) {
    ojson j = ojson::object();
    j["type"] = action_type(action);

    if (const auto* oa = std::get_if<OrderAction>(&action)) {
        ojson orders = ojson::array();
        for (const auto& o : oa->orders) orders.push_back(order_wire_to_json(o));
        j["orders"] = std::move(orders);
        j["grouping"] = to_string(oa->grouping);
    } else if (const auto* ca = std::get_if<CancelAction>(&action)) {
        ojson cancels = ojson::array();
        for (const auto& c : ca->cancels) {
            ojson cj = ojson::object();
            cj["a"] = c.a;
            cj["o"] = c.o;
            cancels.push_back(std::move(cj));
        }
        j["cancels"] = std::move(cancels);
    } else if (const auto* cca = std::get_if<CancelByCloidAction>(&action)) {
        ojson cancels = ojson::array();
        for (const auto& c : cca->cancels) {
            ojson cj = ojson::object();
            cj["asset"] = c.asset;
            cj["cloid"] = c.cloid;
            cancels.push_back(std::move(cj));
        }
        j["cancels"] = std::move(cancels);
    } else if (const auto* ma = std::get_if<ModifyAction>(&action)) {
        ojson modifies = ojson::array();
        for (const auto& m : ma->modifies) {
            ojson mj = ojson::object();
            mj["oid"] = oid_to_json(m.oid);
            mj["order"] = order_wire_to_json(m.order);
            modifies.push_back(std::move(mj));
        }
        j["modifies"] = std::move(modifies);
    } else if (const auto* sa = std::get_if<ScheduleCancelAction>(&action)) {
        if (sa->time) j["time"] = *sa->time;
    }
    return j;
}
