#include "trade/Json.hpp"
#include <cmath>
#include <stdexcept>

namespace trade {

namespace {

json optional_decimal(const std::optional<Decimal>& d) {
    return d ? json(*d) : json(nullptr);
}

}

void to_json(json& j, const Decimal& d) {
    j = d.to_string();
}

void from_json(const json& j, Decimal& d) {
    if (j.is_string()) {
        d = Decimal::parse(j.get<std::string>());
    } else if (j.is_number_integer()) {
        d = Decimal(j.get<long long>());
    } else if (j.is_number_float()) {
        d = Decimal::from_double(j.get<double>());
    } else {
        throw std::invalid_argument("Expected a decimal, got " + j.dump());
    }
}

void to_json(json& j, const AssetPair& p) {
    j = p.to_string();
}

void from_json(const json& j, AssetPair& p) {
    p = AssetPair::parse(j.get<std::string>());
}

void to_json(json& j, const Amount& a) {
    j = json::object();
    j[a.is_quantity() ? "quantity" : "notional"] = a.value;
}

void from_json(const json& j, Amount& a) {
    if (j.contains("quantity")) {
        a = Amount::quantity(j.at("quantity").get<Decimal>());
    } else if (j.contains("notional")) {
        a = Amount::notional(j.at("notional").get<Decimal>());
    } else {
        throw std::invalid_argument("Amount needs a 'quantity' or 'notional' field: " + j.dump());
    }
}

void to_json(json& j, const Order& o) {
    j = json{
        {"id", o.id},
        {"asset_pair", o.asset_pair},
        {"amount", o.amount},
        {"limit_price", optional_decimal(o.limit_price)},
        {"filled_quantity", o.filled_quantity},
        {"average_fill_price", optional_decimal(o.average_fill_price)},
        {"status", order_status_to_string(o.status)},
        {"type", order_type_to_string(o.type)},
        {"side", order_side_to_string(o.side)},
    };
}

void to_json(json& j, const OpenPosition& p) {
    j = json{
        {"asset_symbol", p.asset_symbol},
        {"quantity", p.quantity},
        {"average_entry_price", optional_decimal(p.average_entry_price)},
        {"market_value", optional_decimal(p.market_value)},
    };
}

void to_json(json& j, const Account& a) {
    json positions = json::object();
    for (const auto& [asset, position] : a.open_positions) {
        positions[asset] = position;
    }
    j = json{
        {"currency", a.currency},
        {"cash", a.cash},
        {"buying_power", a.buying_power},
        {"open_positions", positions},
    };
}

void to_json(json& j, const Bar& b) {
    j = json{
        {"time", to_epoch_ms(b.date_time) / 1000},
        {"open", b.open},
        {"high", b.high},
        {"low", b.low},
        {"close", b.close},
    };
}

void from_json(const json& j, Bar& b) {
    const auto& t = j.at("time");
    b.date_time = t.is_number_float()
        ? from_epoch_ms(std::llround(t.get<double>() * 1000.0))
        : from_epoch_ms(t.get<long long>() * 1000);
    b.open = j.at("open").get<Decimal>();
    b.high = j.at("high").get<Decimal>();
    b.low = j.at("low").get<Decimal>();
    b.close = j.at("close").get<Decimal>();
}

} // namespace trade
