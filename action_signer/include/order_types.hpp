#pragma once
#include "cloid.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

/* ================= Enumerated protocol tags ================= */

enum class Tif { Alo, Ioc, Gtc };              // add-liquidity-only, immediate-or-cancel, good-til-cancel
enum class Tpsl { Tp, Sl };                    // take-profit / stop-loss
enum class Grouping { Na, NormalTpsl, PositionTpsl };

// Wire spellings ("Gtc", "sl", "normalTpsl", ...)
const char* to_string(Tif tif);
const char* to_string(Tpsl tpsl);
const char* to_string(Grouping grouping);

// Inverse of to_string. Throws InvalidOrderTypeError on an unknown tag.
Tif parse_tif(const std::string& s);
Tpsl parse_tpsl(const std::string& s);
Grouping parse_grouping(const std::string& s);

/* ================= Caller-facing requests (doubles) ================= */

struct LimitOrderType {
    Tif tif = Tif::Gtc;
};

struct TriggerOrderType {
    double trigger_px = 0.0;
    bool is_market = false;
    Tpsl tpsl = Tpsl::Tp;
};

using OrderType = std::variant<LimitOrderType, TriggerOrderType>;

struct OrderRequest {
    int asset = 0;                 // exchange asset index (perp index, or 10000 + spot index)
    bool is_buy = false;
    double sz = 0.0;
    double limit_px = 0.0;
    OrderType order_type = LimitOrderType{};
    bool reduce_only = false;
    std::optional<Cloid> cloid;
};

// Existing order referenced either by exchange order id or by client id
using OidOrCloid = std::variant<std::uint64_t, Cloid>;

struct CancelRequest {
    int asset = 0;
    std::uint64_t oid = 0;
};

struct CancelByCloidRequest {
    int asset = 0;
    Cloid cloid;
};

struct ModifyRequest {
    OidOrCloid oid;
    OrderRequest order;
};
