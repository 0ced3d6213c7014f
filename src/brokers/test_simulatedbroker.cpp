#include "brokers/SimulatedBroker.hpp"
#include "support/TestSupport.hpp"
#include "trade/Errors.hpp"
#include <string>
#include <vector>

using trade::Amount;
using trade::AssetPair;
using trade::Decimal;
using trade::Order;
using trade::OrderRequest;
using trade::OrderSide;
using trade::OrderStatus;
using trade::OrderType;

static Decimal D(const char* s) { return Decimal::parse(s); }
static const AssetPair GBP_USD{"GBP", "USD"};

static std::unique_ptr<broker::SimulatedBroker> usd_broker(const char* balance = "14.1") {
    return broker::SimulatedBrokerBuilder("USD").set_balance(D(balance)).build();
}

static Order expected_order(const std::string& id, OrderType type, OrderSide side,
                            std::optional<Decimal> limit, Decimal filled,
                            std::optional<Decimal> avg, OrderStatus status) {
    Order o;
    o.id = id;
    o.asset_pair = "GBP/USD";
    o.amount = Amount::quantity(Decimal(10));
    o.limit_price = limit;
    o.filled_quantity = filled;
    o.average_fill_price = avg;
    o.status = status;
    o.type = type;
    o.side = side;
    return o;
}

TEST(place_order_without_price_fails) {
    auto b = usd_broker();
    try {
        b->place_order(OrderRequest::market_buy(AssetPair::parse("AAPL/USD"), Amount::quantity(Decimal(10))));
        support::fail("expected NoNotionalPerUnit", __FILE__, __LINE__);
    } catch (const trade::NoNotionalPerUnit& e) {
        ASSERT_EQ(std::string(e.what()), std::string("AAPL/USD does not have notional per unit"));
    }
    ASSERT_TRUE(b->get_orders().empty());
}

TEST(place_order_no_balance) {
    auto b = broker::SimulatedBrokerBuilder("USD").build();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    try {
        b->place_order(OrderRequest::market_buy(GBP_USD, Amount::quantity(Decimal(10))));
        support::fail("expected InsufficientBuyingPower", __FILE__, __LINE__);
    } catch (const trade::InsufficientBuyingPower& e) {
        ASSERT_EQ(std::string(e.what()), std::string("Not enough USD buying power"));
        ASSERT_EQ(e.asset(), std::string("USD"));
    }
}

TEST(place_order_close_but_not_enough_balance) {
    auto b = usd_broker("13.09");
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    ASSERT_THROWS(b->place_order(OrderRequest::market_buy(GBP_USD, Amount::quantity(Decimal(10)))),
                  trade::InsufficientBuyingPower);

    // nothing moved
    ASSERT_EQ(b->get_balance("USD"), D("13.09"));
    ASSERT_EQ(b->get_buying_power("USD"), D("13.09"));
    ASSERT_TRUE(b->get_orders().empty());
}

TEST(market_buy_updates_balances) {
    auto b = usd_broker();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    b->place_order(OrderRequest::market_buy(GBP_USD, Amount::quantity(Decimal(10))));

    ASSERT_EQ(b->get_balance("USD"), Decimal(1));
    ASSERT_EQ(b->get_buying_power("USD"), Decimal(1));
    ASSERT_EQ(b->get_balance("GBP"), Decimal(10));
    ASSERT_EQ(b->get_buying_power("GBP"), Decimal(10));
}

TEST(place_order_returns_valid_order_id) {
    auto b = usd_broker();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    auto id = b->place_order(OrderRequest::market_buy(GBP_USD, Amount::quantity(Decimal(1))));
    auto id2 = b->place_order(OrderRequest::market_buy(GBP_USD, Amount::quantity(Decimal(1))));

    ASSERT_EQ(b->get_order(id).id, id);
    ASSERT_EQ(id.size(), 36u);
    ASSERT_EQ(id[14], '4');
    ASSERT_NE(id, id2);
    ASSERT_EQ(b->get_orders().size(), 2u);
}

TEST(get_market_buy_order) {
    auto b = usd_broker();
    b->set_notional_per_unit(GBP_USD, D("1.32"));
    auto id = b->place_order(OrderRequest::market_buy(GBP_USD, Amount::quantity(Decimal(10))));

    ASSERT_EQ(b->get_order(id), expected_order(id, OrderType::Market, OrderSide::Buy, std::nullopt,
                                               Decimal(10), D("1.32"), OrderStatus::FILLED));
    ASSERT_EQ(b->get_balance("USD"), D("0.9"));
    ASSERT_EQ(b->get_buying_power("USD"), D("0.9"));
    ASSERT_EQ(b->get_balance("GBP"), Decimal(10));
    ASSERT_EQ(b->get_buying_power("GBP"), Decimal(10));
}

TEST(get_market_sell_order) {
    auto b = broker::SimulatedBrokerBuilder("USD").set_asset_balance("GBP", Decimal(11)).build();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    auto id = b->place_order(OrderRequest::market_sell(GBP_USD, Amount::quantity(Decimal(10))));

    ASSERT_EQ(b->get_order(id), expected_order(id, OrderType::Market, OrderSide::Sell, std::nullopt,
                                               Decimal(10), D("1.31"), OrderStatus::FILLED));
    ASSERT_EQ(b->get_balance("USD"), D("13.1"));
    ASSERT_EQ(b->get_buying_power("USD"), D("13.1"));
    ASSERT_EQ(b->get_balance("GBP"), Decimal(1));
    ASSERT_EQ(b->get_buying_power("GBP"), Decimal(1));
}

TEST(market_buy_by_notional) {
    auto b = usd_broker("100");
    b->set_notional_per_unit(GBP_USD, D("1.25"));
    auto id = b->place_order(OrderRequest::market_buy(GBP_USD, Amount::notional(Decimal(50))));

    auto order = b->get_order(id);
    ASSERT_EQ(order.filled_quantity, Decimal(40));
    ASSERT_EQ(order.average_fill_price, std::optional<Decimal>(D("1.25")));
    ASSERT_EQ(order.amount, Amount::notional(Decimal(50)));
    ASSERT_EQ(b->get_balance("USD"), Decimal(50));
    ASSERT_EQ(b->get_balance("GBP"), Decimal(40));
}

TEST(limit_buy_waits_then_fills_at_market) {
    auto b = usd_broker();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    auto id = b->place_order(OrderRequest::limit_buy(GBP_USD, Amount::quantity(Decimal(10)), D("1.3")));

    ASSERT_EQ(b->get_order(id), expected_order(id, OrderType::Limit, OrderSide::Buy, D("1.3"),
                                               Decimal(), std::nullopt, OrderStatus::NEW));
    ASSERT_EQ(b->get_balance("USD"), D("14.1"));
    ASSERT_EQ(b->get_buying_power("USD"), D("1.1"));
    ASSERT_TRUE(b->get_balance("GBP").is_zero());
    ASSERT_TRUE(b->get_buying_power("GBP").is_zero());

    b->set_notional_per_unit(GBP_USD, D("1.29"));

    ASSERT_EQ(b->get_order(id), expected_order(id, OrderType::Limit, OrderSide::Buy, D("1.3"),
                                               Decimal(10), D("1.29"), OrderStatus::FILLED));
    ASSERT_EQ(b->get_balance("USD"), D("1.2"));
    ASSERT_EQ(b->get_buying_power("USD"), D("1.2"));
    ASSERT_EQ(b->get_balance("GBP"), Decimal(10));
    ASSERT_EQ(b->get_buying_power("GBP"), Decimal(10));
}

TEST(limit_sell_waits_then_fills_at_market) {
    auto b = broker::SimulatedBrokerBuilder("USD").set_asset_balance("GBP", Decimal(12)).build();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    auto id = b->place_order(OrderRequest::limit_sell(GBP_USD, Amount::quantity(Decimal(10)), D("1.32")));

    ASSERT_EQ(b->get_order(id), expected_order(id, OrderType::Limit, OrderSide::Sell, D("1.32"),
                                               Decimal(), std::nullopt, OrderStatus::NEW));
    ASSERT_TRUE(b->get_balance("USD").is_zero());
    ASSERT_TRUE(b->get_buying_power("USD").is_zero());
    ASSERT_EQ(b->get_balance("GBP"), Decimal(12));
    ASSERT_EQ(b->get_buying_power("GBP"), Decimal(2));

    // moving the wrong way leaves it pending
    b->set_notional_per_unit(GBP_USD, D("1.30"));
    ASSERT_EQ(b->get_order(id).status, OrderStatus::NEW);

    b->set_notional_per_unit(GBP_USD, D("1.33"));
    ASSERT_EQ(b->get_order(id), expected_order(id, OrderType::Limit, OrderSide::Sell, D("1.32"),
                                               Decimal(10), D("1.33"), OrderStatus::FILLED));
    ASSERT_EQ(b->get_balance("USD"), D("13.3"));
    ASSERT_EQ(b->get_buying_power("USD"), D("13.3"));
    ASSERT_EQ(b->get_balance("GBP"), Decimal(2));
    ASSERT_EQ(b->get_buying_power("GBP"), Decimal(2));
}

TEST(marketable_limit_buy_fills_immediately) {
    auto b = usd_broker();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    auto id = b->place_order(OrderRequest::limit_buy(GBP_USD, Amount::quantity(Decimal(10)), D("1.4")));

    ASSERT_EQ(b->get_order(id), expected_order(id, OrderType::Limit, OrderSide::Buy, D("1.4"),
                                               Decimal(10), D("1.31"), OrderStatus::FILLED));
    // the 0.9 reserved above the market price comes back
    ASSERT_EQ(b->get_balance("USD"), Decimal(1));
    ASSERT_EQ(b->get_buying_power("USD"), Decimal(1));
    ASSERT_EQ(b->get_balance("GBP"), Decimal(10));
    ASSERT_EQ(b->get_buying_power("GBP"), Decimal(10));
}

TEST(marketable_limit_sell_fills_immediately) {
    auto b = broker::SimulatedBrokerBuilder("USD").set_asset_balance("GBP", D("10.5")).build();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    auto id = b->place_order(OrderRequest::limit_sell(GBP_USD, Amount::quantity(Decimal(10)), D("1.25")));

    ASSERT_EQ(b->get_order(id), expected_order(id, OrderType::Limit, OrderSide::Sell, D("1.25"),
                                               Decimal(10), D("1.31"), OrderStatus::FILLED));
    ASSERT_EQ(b->get_balance("USD"), D("13.1"));
    ASSERT_EQ(b->get_buying_power("USD"), D("13.1"));
    ASSERT_EQ(b->get_balance("GBP"), D("0.5"));
    ASSERT_EQ(b->get_buying_power("GBP"), D("0.5"));
}

TEST(limit_at_exact_price_fills) {
    auto b = usd_broker();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    auto id = b->place_order(OrderRequest::limit_buy(GBP_USD, Amount::quantity(Decimal(10)), D("1.31")));
    ASSERT_EQ(b->get_order(id).status, OrderStatus::FILLED);
}

TEST(reserved_buying_power_blocks_second_order) {
    auto b = usd_broker();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    b->place_order(OrderRequest::limit_buy(GBP_USD, Amount::quantity(Decimal(10)), D("1.3")));

    // only 1.1 USD is still free
    ASSERT_THROWS(b->place_order(OrderRequest::limit_buy(GBP_USD, Amount::quantity(Decimal(1)), D("1.2"))),
                  trade::InsufficientBuyingPower);
    ASSERT_EQ(b->get_orders().size(), 1u);
    ASSERT_EQ(b->get_buying_power("USD"), D("1.1"));
}

TEST(price_updates_only_touch_their_pair) {
    auto b = broker::SimulatedBrokerBuilder("USD").set_balance(Decimal(100)).build();
    const AssetPair EUR_USD{"EUR", "USD"};
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    b->set_notional_per_unit(EUR_USD, D("1.10"));
    auto gbp = b->place_order(OrderRequest::limit_buy(GBP_USD, Amount::quantity(Decimal(1)), D("1.2")));
    auto eur = b->place_order(OrderRequest::limit_buy(EUR_USD, Amount::quantity(Decimal(1)), D("1.0")));

    b->set_notional_per_unit(EUR_USD, D("0.9"));
    ASSERT_EQ(b->get_order(gbp).status, OrderStatus::NEW);
    ASSERT_EQ(b->get_order(eur).status, OrderStatus::FILLED);
    ASSERT_EQ(b->get_order(eur).average_fill_price, std::optional<Decimal>(D("0.9")));
}

TEST(set_notional_per_unit_invalid_notional_asset) {
    auto b = usd_broker();
    try {
        b->set_notional_per_unit(AssetPair::parse("GBP/USDT"), D("1.31"));
        support::fail("expected InvalidNotionalAsset", __FILE__, __LINE__);
    } catch (const trade::InvalidNotionalAsset& e) {
        ASSERT_EQ(std::string(e.what()), std::string("USDT is not a valid notional asset"));
    }
    ASSERT_THROWS(b->get_notional_per_unit(AssetPair::parse("GBP/USDT")), trade::InvalidNotionalAsset);
}

TEST(set_notional_per_unit_inverted_notional_asset) {
    auto b = usd_broker();
    try {
        b->set_notional_per_unit(AssetPair::parse("USD/GBP"), D("1.31"));
        support::fail("expected InvalidNotionalAsset", __FILE__, __LINE__);
    } catch (const trade::InvalidNotionalAsset& e) {
        ASSERT_EQ(std::string(e.what()), std::string("GBP is not a valid notional asset"));
    }
}

TEST(extra_notional_assets_can_be_priced) {
    auto b = broker::SimulatedBrokerBuilder("USD")
        .add_notional_asset("USDT", Decimal(100))
        .build();
    const AssetPair BTC_USDT{"BTC", "USDT"};
    b->set_notional_per_unit(BTC_USDT, Decimal(50));
    ASSERT_EQ(b->get_notional_per_unit(BTC_USDT), Decimal(50));

    b->place_order(OrderRequest::market_buy(BTC_USDT, Amount::quantity(Decimal(1))));
    ASSERT_EQ(b->get_balance("USDT"), Decimal(50));
    ASSERT_EQ(b->get_balance("BTC"), Decimal(1));
}

TEST(new_without_currency) {
    try {
        broker::SimulatedBroker b("USD", {"BTC"}, {});
        support::fail("expected MissingCurrencyNotionalAsset", __FILE__, __LINE__);
    } catch (const trade::MissingCurrencyNotionalAsset& e) {
        ASSERT_EQ(std::string(e.what()), std::string("Missing currency notional asset USD"));
    }
}

TEST(unknown_order_id) {
    auto b = usd_broker();
    try {
        b->get_order("missing");
        support::fail("expected OrderNotFound", __FILE__, __LINE__);
    } catch (const trade::OrderNotFound& e) {
        ASSERT_EQ(std::string(e.what()), std::string("Order with id missing doesn't exist"));
    }
}

TEST(invalid_arguments_are_rejected) {
    auto b = usd_broker();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    ASSERT_THROWS(b->place_order(OrderRequest::market_buy(GBP_USD, Amount::quantity(Decimal()))),
                  std::invalid_argument);
    ASSERT_THROWS(b->place_order(OrderRequest::market_buy(GBP_USD, Amount::quantity(D("-1")))),
                  std::invalid_argument);
    ASSERT_THROWS(b->place_order(OrderRequest::limit_buy(GBP_USD, Amount::quantity(Decimal(1)), Decimal())),
                  std::invalid_argument);
    ASSERT_THROWS(b->set_notional_per_unit(GBP_USD, Decimal()), std::invalid_argument);
    ASSERT_EQ(b->get_notional_per_unit(GBP_USD), D("1.31"));
    ASSERT_EQ(b->get_buying_power("USD"), D("14.1"));
}

TEST(purchased_assets_exclude_currency_and_empty) {
    auto b = broker::SimulatedBrokerBuilder("USD")
        .set_balance(Decimal(100))
        .set_asset_balance("EUR", Decimal())
        .build();
    b->set_notional_per_unit(GBP_USD, Decimal(2));
    b->place_order(OrderRequest::market_buy(GBP_USD, Amount::quantity(Decimal(3))));

    auto assets = b->get_purchased_assets();
    ASSERT_EQ(assets.size(), 1u);
    ASSERT_EQ(assets[0], std::string("GBP"));
}

TEST(events_are_published) {
    trade::EventBus bus;
    std::vector<std::string> seen;
    bus.subscribe(trade::kOrderPlacedTopic, [&seen](const trade::Event& ev) {
        seen.push_back(ev.type + ":" + trade::order_status_to_string(std::any_cast<const Order&>(ev.data).status));
    });
    bus.subscribe(trade::kOrderFilledTopic, [&seen](const trade::Event& ev) {
        seen.push_back(ev.type + ":" + trade::order_status_to_string(std::any_cast<const Order&>(ev.data).status));
    });

    auto b = broker::SimulatedBrokerBuilder("USD").set_balance(D("14.1")).set_event_bus(bus).build();
    b->set_notional_per_unit(GBP_USD, D("1.31"));
    b->place_order(OrderRequest::limit_buy(GBP_USD, Amount::quantity(Decimal(10)), D("1.3")));
    ASSERT_EQ(seen.size(), 1u);
    ASSERT_EQ(seen[0], std::string("OrderPlaced:NEW"));

    b->set_notional_per_unit(GBP_USD, D("1.29"));
    ASSERT_EQ(seen.size(), 2u);
    ASSERT_EQ(seen[1], std::string("OrderFilled:FILLED"));
}

TEST(handlers_may_call_back_into_broker) {
    trade::EventBus bus;
    auto b = broker::SimulatedBrokerBuilder("USD").set_balance(Decimal(10)).set_event_bus(bus).build();
    Decimal seen_balance;
    bus.subscribe(trade::kOrderFilledTopic, [&](const trade::Event&) {
        seen_balance = b->get_balance("USD");
    });
    b->set_notional_per_unit(GBP_USD, Decimal(2));
    b->place_order(OrderRequest::market_buy(GBP_USD, Amount::quantity(Decimal(1))));
    ASSERT_EQ(seen_balance, Decimal(8));
}

TEST(notional_fill_settles_what_the_quantity_costs) {
    auto b = usd_broker("100");
    b->set_notional_per_unit(GBP_USD, Decimal(3));
    auto id = b->place_order(OrderRequest::market_buy(GBP_USD, Amount::notional(Decimal(10))));

    auto order = b->get_order(id);
    ASSERT_EQ(order.filled_quantity, D("3.33333333"));
    ASSERT_EQ(order.average_fill_price, std::optional<Decimal>(Decimal(3)));
    ASSERT_EQ(Decimal(100) - b->get_balance("USD"), order.filled_quantity * *order.average_fill_price);
    ASSERT_EQ(b->get_balance("USD"), D("90.00000001"));
    ASSERT_EQ(b->get_buying_power("USD"), D("90.00000001"));
    ASSERT_EQ(b->get_balance("GBP"), D("3.33333333"));

    id = b->place_order(OrderRequest::market_sell(GBP_USD, Amount::notional(D("0.5"))));
    order = b->get_order(id);
    ASSERT_EQ(order.filled_quantity, D("0.16666666"));
    ASSERT_EQ(b->get_balance("USD") - D("90.00000001"), order.filled_quantity * *order.average_fill_price);
    ASSERT_EQ(b->get_balance("GBP"), D("3.16666667"));
}

TEST(failed_limit_fill_leaves_state_unchanged) {
    const AssetPair XYZ_USD{"XYZ", "USD"};
    auto b = usd_broker("1000000");
    b->set_notional_per_unit(XYZ_USD, Decimal(200));
    auto id = b->place_order(OrderRequest::limit_buy(XYZ_USD, Amount::notional(Decimal(1000000)), Decimal(100)));
    ASSERT_EQ(b->get_buying_power("USD"), Decimal(500000));

    // refund of limit * quantity at this price does not fit
    for (int attempt = 0; attempt < 2; ++attempt) {
        ASSERT_THROWS(b->set_notional_per_unit(XYZ_USD, D("0.001")), std::overflow_error);
        ASSERT_EQ(b->get_notional_per_unit(XYZ_USD), Decimal(200));
        ASSERT_EQ(b->get_balance("USD"), Decimal(1000000));
        ASSERT_EQ(b->get_buying_power("USD"), Decimal(500000));
        ASSERT_EQ(b->get_balance("XYZ"), Decimal(0));
        ASSERT_EQ(b->get_order(id).status, OrderStatus::NEW);
    }

    // a representable price still fills the order
    b->set_notional_per_unit(XYZ_USD, Decimal(80));
    auto order = b->get_order(id);
    ASSERT_EQ(order.status, OrderStatus::FILLED);
    ASSERT_EQ(order.filled_quantity, Decimal(12500));
    ASSERT_EQ(b->get_balance("USD"), Decimal(0));
    ASSERT_EQ(b->get_balance("XYZ"), Decimal(12500));
}

TEST(limit_order_unsettleable_at_its_limit_is_rejected) {
    const AssetPair SHIB_USD{"SHIB", "USD"};
    auto b = usd_broker("1000000");
    b->set_notional_per_unit(SHIB_USD, D("0.00002"));

    ASSERT_THROWS(b->place_order(OrderRequest::limit_buy(SHIB_USD, Amount::notional(Decimal(1000000)),
                                                         D("0.00001"))),
                  std::invalid_argument);
    ASSERT_TRUE(b->get_orders().empty());
    ASSERT_EQ(b->get_buying_power("USD"), Decimal(1000000));

    b->set_notional_per_unit(SHIB_USD, D("0.000009"));
    ASSERT_EQ(b->get_notional_per_unit(SHIB_USD), D("0.000009"));
    ASSERT_EQ(b->get_balance("USD"), Decimal(1000000));
}

int main() {
    std::cout << "SimulatedBroker tests\n";
    RUN_TEST(place_order_without_price_fails);
    RUN_TEST(place_order_no_balance);
    RUN_TEST(place_order_close_but_not_enough_balance);
    RUN_TEST(market_buy_updates_balances);
    RUN_TEST(place_order_returns_valid_order_id);
    RUN_TEST(get_market_buy_order);
    RUN_TEST(get_market_sell_order);
    RUN_TEST(market_buy_by_notional);
    RUN_TEST(limit_buy_waits_then_fills_at_market);
    RUN_TEST(limit_sell_waits_then_fills_at_market);
    RUN_TEST(marketable_limit_buy_fills_immediately);
    RUN_TEST(marketable_limit_sell_fills_immediately);
    RUN_TEST(limit_at_exact_price_fills);
    RUN_TEST(reserved_buying_power_blocks_second_order);
    RUN_TEST(price_updates_only_touch_their_pair);
    RUN_TEST(set_notional_per_unit_invalid_notional_asset);
    RUN_TEST(set_notional_per_unit_inverted_notional_asset);
    RUN_TEST(extra_notional_assets_can_be_priced);
    RUN_TEST(new_without_currency);
    RUN_TEST(unknown_order_id);
    RUN_TEST(invalid_arguments_are_rejected);
    RUN_TEST(purchased_assets_exclude_currency_and_empty);
    RUN_TEST(events_are_published);
    RUN_TEST(handlers_may_call_back_into_broker);
    RUN_TEST(notional_fill_settles_what_the_quantity_costs);
    RUN_TEST(failed_limit_fill_leaves_state_unchanged);
    RUN_TEST(limit_order_unsettleable_at_its_limit_is_rejected);
    return support::test_result();
}
