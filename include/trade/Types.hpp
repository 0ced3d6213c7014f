// types used throughout the project

#pragma once
#include "trade/Decimal.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace trade {

using TimePoint = std::chrono::time_point<std::chrono::system_clock>;
using Duration  = TimePoint::duration;
using AssetId   = std::string;
using OrderId   = std::string;

// e.g. GBP/USD => quantity_asset=GBP, notional_asset=USD
struct AssetPair {
    AssetId quantity_asset;
    AssetId notional_asset;

    // Throws InvalidAssetPair unless text is exactly "QUANTITY/NOTIONAL".
    static AssetPair parse(const std::string& text);
    std::string to_string() const { return quantity_asset + "/" + notional_asset; }

    bool operator==(const AssetPair&) const = default;
};

// Requested order size, in base units or in quote-currency value.
struct Amount {
    enum class Kind { Quantity, Notional };

    Kind    kind{Kind::Quantity};
    Decimal value{};

    static Amount quantity(Decimal q) { return Amount{Kind::Quantity, q}; }
    static Amount notional(Decimal n) { return Amount{Kind::Notional, n}; }

    bool is_quantity() const { return kind == Kind::Quantity; }
    bool operator==(const Amount&) const = default;
};

enum class OrderSide {
    Buy,
    Sell
};

enum class OrderType {
    Market,
    Limit
};

// The simulator only moves NEW -> FILLED; the remaining states exist for
// backends that report them.
enum class OrderStatus {
    NEW,
    PARTIALLY_FILLED,
    FILLED,
    CANCELED,
    EXPIRED
};

// Convert OrderStatus to string for logging/serialization
inline const char* order_status_to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::NEW: return "NEW";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELED: return "CANCELED";
        case OrderStatus::EXPIRED: return "EXPIRED";
    }
    return "UNKNOWN";
}

inline const char* order_side_to_string(OrderSide side) {
    return side == OrderSide::Buy ? "Buy" : "Sell";
}

inline const char* order_type_to_string(OrderType type) {
    return type == OrderType::Market ? "Market" : "Limit";
}

struct Order {
    OrderId                id;                            // set by broker
    std::string            asset_pair;                    // "QUANTITY/NOTIONAL"
    Amount                 amount;                        // as requested, never modified
    std::optional<Decimal> limit_price;
    Decimal                filled_quantity{};
    std::optional<Decimal> average_fill_price;
    OrderStatus            status{OrderStatus::NEW};
    OrderType              type{OrderType::Market};
    OrderSide              side{OrderSide::Buy};

    bool operator==(const Order&) const = default;
};

struct OrderRequest {
    AssetPair              asset_pair;
    Amount                 amount;
    std::optional<Decimal> limit_price;
    OrderSide              side{OrderSide::Buy};

    static OrderRequest market_buy(AssetPair pair, Amount amount) {
        return OrderRequest{std::move(pair), amount, std::nullopt, OrderSide::Buy};
    }
    static OrderRequest market_sell(AssetPair pair, Amount amount) {
        return OrderRequest{std::move(pair), amount, std::nullopt, OrderSide::Sell};
    }
    static OrderRequest limit_buy(AssetPair pair, Amount amount, Decimal limit_price) {
        return OrderRequest{std::move(pair), amount, limit_price, OrderSide::Buy};
    }
    static OrderRequest limit_sell(AssetPair pair, Amount amount, Decimal limit_price) {
        return OrderRequest{std::move(pair), amount, limit_price, OrderSide::Sell};
    }
};

struct OpenPosition {
    AssetId                asset_symbol;
    Decimal                quantity{};
    std::optional<Decimal> average_entry_price;
    std::optional<Decimal> market_value;        // empty when asset/currency has no price

    bool operator==(const OpenPosition&) const = default;
};

struct Account {
    std::map<AssetId, OpenPosition> open_positions;
    Decimal                         cash{};
    AssetId                         currency;
    Decimal                         buying_power{};
};

} // namespace trade

template <>
struct std::hash<trade::AssetPair> {
    std::size_t operator()(const trade::AssetPair& p) const noexcept {
        std::size_t h = std::hash<std::string>{}(p.quantity_asset);
        return h ^ (std::hash<std::string>{}(p.notional_asset) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
