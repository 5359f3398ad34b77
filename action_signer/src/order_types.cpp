#include "order_types.hpp"
#include "signing_errors.hpp"

const char* to_string(Tif tif) {
    switch (tif) {
        case Tif::Alo: return "Alo";
        case Tif::Ioc: return "Ioc";
        case Tif::Gtc: return "Gtc";
    }
    throw InvalidOrderTypeError("invalid tif value");
}

const char* to_string(Tpsl tpsl) {
    switch (tpsl) {
        case Tpsl::Tp: return "tp";
        case Tpsl::Sl: return "sl";
    }
    throw InvalidOrderTypeError("invalid tpsl value");
}

const char* to_string(Grouping grouping) {
    switch (grouping) {
        case Grouping::Na:           return "na";
        case Grouping::NormalTpsl:   return "normalTpsl";
        case Grouping::PositionTpsl: return "positionTpsl";
    }
    throw InvalidOrderTypeError("invalid grouping value");
}

Tif parse_tif(const std::string& s) {
    if (s == "Alo") return Tif::Alo;
    if (s == "Ioc") return Tif::Ioc;
    if (s == "Gtc") return Tif::Gtc;
    throw InvalidOrderTypeError("unknown tif: " + s);
}

Tpsl parse_tpsl(const std::string& s) {
    if (s == "tp") return Tpsl::Tp;
    if (s == "sl") return Tpsl::Sl;
    throw InvalidOrderTypeError("unknown tpsl: " + s);
}

Grouping parse_grouping(const std::string& s) {
    if (s == "na")           return Grouping::Na;
    if (s == "normalTpsl")   return Grouping::NormalTpsl;
    if (s == "positionTpsl") return Grouping::PositionTpsl;
    throw InvalidOrderTypeError("unknown grouping: " + s);
}
