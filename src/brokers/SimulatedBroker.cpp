#include "brokers/SimulatedBroker.hpp"
#include "trade/Errors.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace broker {

using trade::Decimal;
using trade::OrderSide;
using trade::OrderStatus;
using trade::OrderType;

SimulatedBroker::SimulatedBroker(trade::AssetId currency,
                                 std::unordered_set<trade::AssetId> notional_assets,
                                 const std::unordered_map<trade::AssetId, trade::Decimal>& starting_balances,
                                 trade::EventBus* bus)
    : currency_(std::move(currency)),
      notional_assets_(std::move(notional_assets)),
      ledger_(starting_balances),
      bus_(bus) {
    if (!notional_assets_.count(currency_)) {
        throw trade::MissingCurrencyNotionalAsset(currency_);
    }
}

SimulatedBroker::~SimulatedBroker() = default;

trade::OrderId SimulatedBroker::place_order(const trade::AssetPair& pair,
                                            const trade::Amount& amount,
                                            std::optional<trade::Decimal> limit_price,
                                            trade::OrderSide side) {
    return place_order(trade::OrderRequest{pair, amount, limit_price, side});
}

trade::OrderId SimulatedBroker::place_order(const trade::OrderRequest& req) {
    if (req.amount.value <= Decimal{}) {
        throw std::invalid_argument("Order amount must be positive, got " + req.amount.value.to_string());
    }
    if (req.limit_price && *req.limit_price <= Decimal{}) {
        throw std::invalid_argument("Limit price must be positive, got " + req.limit_price->to_string());
    }

    Events events;
    trade::OrderId order_id;
    {
        std::lock_guard<std::mutex> lk(mutex_);

        const Decimal price = price_for(req.asset_pair);
        const auto [quantity, notional] = quantity_and_notional(req.amount, price);
        if (quantity.is_zero()) {
            throw std::invalid_argument("Order for " + req.asset_pair.to_string() +
                                        " rounds to zero quantity");
        }

        // Buys commit quote currency (worst case for limits), sells commit the base asset.
        const trade::AssetId& reserve_asset = req.side == OrderSide::Buy
            ? req.asset_pair.notional_asset
            : req.asset_pair.quantity_asset;
        Decimal reserve_amount = quantity;
        if (req.side == OrderSide::Buy) {
            reserve_amount = req.limit_price ? *req.limit_price * quantity : notional;
        }

        if (ledger_.get_buying_power(reserve_asset) < reserve_amount) {
            std::cout << "[SimulatedBroker] Rejected " << trade::order_side_to_string(req.side)
                      << " " << req.asset_pair.to_string() << ": needs " << reserve_amount
                      << " " << reserve_asset << ", has " << ledger_.get_buying_power(reserve_asset) << "\n";
            throw trade::InsufficientBuyingPower(reserve_asset);
        }

        trade::Order order;
        order.asset_pair = req.asset_pair.to_string();
        order.amount = req.amount;
        order.limit_price = req.limit_price;
        order.type = req.limit_price ? OrderType::Limit : OrderType::Market;
        order.side = req.side;
        if (order.limit_price) {
            check_settles_at_limit(order, req.asset_pair);
        }

        // Ledger writes go to a copy until every step has succeeded.
        Ledger staged = ledger_;
        staged.update_buying_power(reserve_asset, -reserve_amount);
        std::optional<Settlement> settlement;
        if (order.type == OrderType::Market || limit_reached(order, price)) {
            settlement = settle(staged, order, req.asset_pair, price);
        }
        ledger_ = std::move(staged);

        do {
            order_id = generate_order_id();
        } while (orders_.count(order_id));
        order.id = order_id;

        auto& stored = orders_.emplace(order_id, std::move(order)).first->second;
        events.push_back(trade::Event{trade::kOrderPlacedTopic, stored});
        if (settlement) {
            record_fill(stored, req.asset_pair, *settlement, events);
        }
    }

    publish(events);
    return order_id;
}

void SimulatedBroker::set_notional_per_unit(const trade::AssetPair& pair, const trade::Decimal& price) {
    if (price <= Decimal{}) {
        throw std::invalid_argument("Notional per unit for " + pair.to_string() +
                                    " must be positive, got " + price.to_string());
    }

    Events events;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        check_notional(pair);

#ifdef TRADE_DEBUG
        std::cout << "[SimulatedBroker] " << pair.to_string() << " @ " << price << "\n";
#endif

        const std::string symbol = pair.to_string();
        std::vector<trade::Order*> due;
        for (auto& [id, order] : orders_) {
            if (order.asset_pair == symbol && order.status == OrderStatus::NEW &&
                order.type == OrderType::Limit && limit_reached(order, price)) {
                due.push_back(&order);
            }
        }

        // Settle everything against a copy; a throw leaves the price and ledger as they were.
        std::vector<Settlement> settlements;
        settlements.reserve(due.size());
        if (!due.empty()) {
            Ledger staged = ledger_;
            for (const trade::Order* order : due) {
                settlements.push_back(settle(staged, *order, pair, price));
            }
            ledger_ = std::move(staged);
        }
        notional_per_unit_[pair] = price;

        for (std::size_t i = 0; i < due.size(); ++i) {
            record_fill(*due[i], pair, settlements[i], events);
        }
    }

    publish(events);
}

trade::Decimal SimulatedBroker::get_notional_per_unit(const trade::AssetPair& pair) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return price_for(pair);
}

trade::Order SimulatedBroker::get_order(const trade::OrderId& order_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        throw trade::OrderNotFound(order_id);
    }
    return it->second;
}

std::vector<trade::Order> SimulatedBroker::get_orders() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<trade::Order> out;
    out.reserve(orders_.size());
    for (const auto& [id, order] : orders_) {
        out.push_back(order);
    }
    return out;
}

trade::Decimal SimulatedBroker::get_balance(const trade::AssetId& asset) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return ledger_.get_balance(asset);
}

trade::Decimal SimulatedBroker::get_buying_power(const trade::AssetId& asset) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return ledger_.get_buying_power(asset);
}

std::vector<trade::AssetId> SimulatedBroker::get_purchased_assets() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<trade::AssetId> out;
    for (const auto& asset : ledger_.assets()) {
        if (asset != currency_ && !ledger_.get_balance(asset).is_zero()) {
            out.push_back(asset);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

void SimulatedBroker::check_notional(const trade::AssetPair& pair) const {
    if (!notional_assets_.count(pair.notional_asset)) {
        throw trade::InvalidNotionalAsset(pair.notional_asset);
    }
}

const trade::Decimal& SimulatedBroker::price_for(const trade::AssetPair& pair) const {
    check_notional(pair);
    auto it = notional_per_unit_.find(pair);
    if (it == notional_per_unit_.end()) {
        throw trade::NoNotionalPerUnit(pair.to_string());
    }
    return it->second;
}

std::pair<trade::Decimal, trade::Decimal>
SimulatedBroker::quantity_and_notional(const trade::Amount& amount, const trade::Decimal& price) {
    if (amount.is_quantity()) {
        return {amount.value, amount.value * price};
    }
    // quantity truncates to 8 places; settle only what that quantity costs
    const Decimal quantity = amount.value / price;
    return {quantity, quantity * price};
}

bool SimulatedBroker::limit_reached(const trade::Order& order, const trade::Decimal& current) {
    const Decimal& limit = *order.limit_price;
    // buy limits execute at or below the cap, sell limits at or above the floor
    return current == limit
        || (order.side == OrderSide::Buy && current < limit)
        || (order.side == OrderSide::Sell && current > limit);
}

void SimulatedBroker::check_settles_at_limit(const trade::Order& order, const trade::AssetPair& pair) {
    Ledger scratch;
    try {
        settle(scratch, order, pair, *order.limit_price);
    } catch (const std::overflow_error&) {
        throw std::invalid_argument("Order for " + pair.to_string() + " cannot be settled at limit " +
                                    order.limit_price->to_string());
    }
}

SimulatedBroker::Settlement SimulatedBroker::settle(Ledger& ledger, const trade::Order& order,
                                                    const trade::AssetPair& pair, const trade::Decimal& price) {
    // Limit orders settle at the fill-time price, not the price seen at placement.
    const auto [quantity, notional] = quantity_and_notional(order.amount, price);
    const trade::AssetId& notional_asset = pair.notional_asset;
    const trade::AssetId& quantity_asset = pair.quantity_asset;

    if (order.side == OrderSide::Buy) {
        // release what was reserved beyond the actual cost
        const Decimal refund = order.limit_price ? *order.limit_price * quantity - notional : Decimal{};
        ledger.update_balance(notional_asset, -notional);
        ledger.update_balance(quantity_asset, quantity);
        ledger.update_buying_power(quantity_asset, quantity);
        ledger.update_buying_power(notional_asset, refund);
    } else {
        ledger.update_balance(notional_asset, notional);
        ledger.update_balance(quantity_asset, -quantity);
        ledger.update_buying_power(notional_asset, notional);
    }
    return Settlement{quantity, notional, price};
}

void SimulatedBroker::record_fill(trade::Order& order, const trade::AssetPair& pair,
                                  const Settlement& settlement, Events& events) {
    order.filled_quantity = settlement.quantity;
    order.average_fill_price = settlement.price;
    order.status = OrderStatus::FILLED;

    const trade::AssetId& notional_asset = pair.notional_asset;
    std::ostringstream ss;
    ss << "[SimulatedBroker] " << trade::order_type_to_string(order.type) << " "
       << trade::order_side_to_string(order.side) << " filled " << settlement.quantity << " "
       << order.asset_pair << " @ " << settlement.price
       << " -> " << notional_asset << " balance=" << ledger_.get_balance(notional_asset);
    std::cout << ss.str() << '\n';

    events.push_back(trade::Event{trade::kOrderFilledTopic, order});
}

trade::OrderId SimulatedBroker::generate_order_id() const {
    // random (version 4) UUID
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(gen);
    std::uint64_t lo = dist(gen);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

void SimulatedBroker::publish(const Events& events) const {
    if (!bus_) return;
    for (const auto& ev : events) {
        bus_->publish(ev);
    }
}

// ---- SimulatedBrokerBuilder ----

SimulatedBrokerBuilder::SimulatedBrokerBuilder(trade::AssetId currency)
    : currency_(std::move(currency)) {
    notional_assets_.insert(currency_);
    balances_[currency_] = Decimal{};
}

SimulatedBrokerBuilder& SimulatedBrokerBuilder::set_balance(const trade::Decimal& balance) {
    balances_[currency_] = balance;
    return *this;
}

SimulatedBrokerBuilder& SimulatedBrokerBuilder::add_notional_asset(const trade::AssetId& asset,
                                                                   std::optional<trade::Decimal> balance) {
    notional_assets_.insert(asset);
    if (balance) {
        balances_[asset] = *balance;
    }
    return *this;
}

SimulatedBrokerBuilder& SimulatedBrokerBuilder::set_asset_balance(const trade::AssetId& asset,
                                                                  const trade::Decimal& balance) {
    balances_[asset] = balance;
    return *this;
}

SimulatedBrokerBuilder& SimulatedBrokerBuilder::set_event_bus(trade::EventBus& bus) {
    bus_ = &bus;
    return *this;
}

std::unique_ptr<SimulatedBroker> SimulatedBrokerBuilder::build() const {
    return std::make_unique<SimulatedBroker>(currency_, notional_assets_, balances_, bus_);
}

}
