#pragma once
#include "brokers/Ledger.hpp"
#include "trade/EventBus.hpp"
#include "trade/Types.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

/*
SimulatedBroker:
  In-process matching and bookkeeping engine.

  Prices are pushed in from outside (set_notional_per_unit). Market orders fill
  immediately at the current price; limit orders wait in NEW until a price
  update satisfies the limit. Every order reserves buying power when placed so
  the same funds cannot back two pending orders; settled balances only move
  when an order fills.

  If an EventBus is attached, OrderPlaced and OrderFilled are published after
  the broker lock is released.
*/

namespace broker {

class SimulatedBroker {
public:
    // Throws trade::MissingCurrencyNotionalAsset if currency is not a notional asset.
    SimulatedBroker(trade::AssetId currency,
                    std::unordered_set<trade::AssetId> notional_assets,
                    const std::unordered_map<trade::AssetId, trade::Decimal>& starting_balances,
                    trade::EventBus* bus = nullptr);
    ~SimulatedBroker();

    SimulatedBroker(const SimulatedBroker&) = delete;
    SimulatedBroker& operator=(const SimulatedBroker&) = delete;

    // Reserves buying power and queues the order, filling it right away when
    // the current price allows. Throws NoNotionalPerUnit, InvalidNotionalAsset
    // or InsufficientBuyingPower, and std::invalid_argument for a limit order
    // that could not be settled at its own limit; on failure nothing changes.
    trade::OrderId place_order(const trade::OrderRequest& req);
    trade::OrderId place_order(const trade::AssetPair& pair,
                               const trade::Amount& amount,
                               std::optional<trade::Decimal> limit_price,
                               trade::OrderSide side);

    // Records the latest price for a pair and fills that pair's pending limit
    // orders the price now reaches. If a fill cannot be settled the call
    // throws and neither the price nor the ledger changes.
    void set_notional_per_unit(const trade::AssetPair& pair, const trade::Decimal& price);
    trade::Decimal get_notional_per_unit(const trade::AssetPair& pair) const;

    trade::Order get_order(const trade::OrderId& order_id) const;
    std::vector<trade::Order> get_orders() const;

    trade::Decimal get_balance(const trade::AssetId& asset) const;
    trade::Decimal get_buying_power(const trade::AssetId& asset) const;
    const trade::AssetId& get_currency() const { return currency_; }

    // Non-currency assets currently held (non-zero balance), sorted.
    std::vector<trade::AssetId> get_purchased_assets() const;

private:
    using Events = std::vector<trade::Event>;

    // What one fill moves: quantity_asset units and their cost at price.
    struct Settlement {
        trade::Decimal quantity;
        trade::Decimal notional;
        trade::Decimal price;
    };

    // Notional amounts are converted at price; the notional returned is what
    // the truncated quantity costs, so quantity * price == notional.
    static std::pair<trade::Decimal, trade::Decimal> quantity_and_notional(const trade::Amount& amount,
                                                                           const trade::Decimal& price);
    static bool limit_reached(const trade::Order& order, const trade::Decimal& current);
    // Applies a fill to the given ledger. Throws std::overflow_error part way
    // through, so callers pass a copy and commit it afterwards.
    static Settlement settle(Ledger& ledger, const trade::Order& order,
                             const trade::AssetPair& pair, const trade::Decimal& price);
    // Throws std::invalid_argument if a fill at the limit price is not representable.
    static void check_settles_at_limit(const trade::Order& order, const trade::AssetPair& pair);

    // The helpers below expect mutex_ to be held.
    void check_notional(const trade::AssetPair& pair) const;
    const trade::Decimal& price_for(const trade::AssetPair& pair) const;
    void record_fill(trade::Order& order, const trade::AssetPair& pair,
                     const Settlement& settlement, Events& events);
    trade::OrderId generate_order_id() const;

    void publish(const Events& events) const;

    trade::AssetId currency_;
    std::unordered_set<trade::AssetId> notional_assets_;
    Ledger ledger_;
    std::unordered_map<trade::AssetPair, trade::Decimal> notional_per_unit_;
    std::unordered_map<trade::OrderId, trade::Order> orders_;
    trade::EventBus* bus_{nullptr};
    mutable std::mutex mutex_;
};

class SimulatedBrokerBuilder {
public:
    // The currency is always a notional asset, starting with a zero balance.
    explicit SimulatedBrokerBuilder(trade::AssetId currency);

    SimulatedBrokerBuilder& set_balance(const trade::Decimal& balance);
    SimulatedBrokerBuilder& add_notional_asset(const trade::AssetId& asset,
                                               std::optional<trade::Decimal> balance = std::nullopt);
    // Balance of an asset that is not a notional asset (e.g. a held coin).
    SimulatedBrokerBuilder& set_asset_balance(const trade::AssetId& asset, const trade::Decimal& balance);
    SimulatedBrokerBuilder& set_event_bus(trade::EventBus& bus);

    std::unique_ptr<SimulatedBroker> build() const;

private:
    trade::AssetId currency_;
    std::unordered_set<trade::AssetId> notional_assets_;
    std::unordered_map<trade::AssetId, trade::Decimal> balances_;
    trade::EventBus* bus_{nullptr};
};

}
