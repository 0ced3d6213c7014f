#include "brokers/SimulatedClient.hpp"
#include "trade/Errors.hpp"
#include <stdexcept>

namespace broker {

SimulatedClient::SimulatedClient(std::unique_ptr<SimulatedBroker> broker)
    : broker_(std::move(broker)) {
    if (!broker_) {
        throw std::invalid_argument("SimulatedClient requires a broker");
    }
}

SimulatedClient::~SimulatedClient() = default;

trade::OrderId SimulatedClient::place_order(const trade::OrderRequest& req) {
    return broker_->place_order(req);
}

std::vector<trade::Order> SimulatedClient::get_orders() {
    return broker_->get_orders();
}

trade::Order SimulatedClient::get_order(const trade::OrderId& order_id) {
    return broker_->get_order(order_id);
}

trade::Account SimulatedClient::get_account() {
    trade::Account account;
    account.currency = broker_->get_currency();
    account.cash = broker_->get_balance(account.currency);
    account.buying_power = broker_->get_buying_power(account.currency);
    for (const auto& asset : broker_->get_purchased_assets()) {
        account.open_positions.emplace(asset, get_open_position(asset));
    }
    return account;
}

void SimulatedClient::set_notional_per_unit(const trade::AssetPair& pair, const trade::Decimal& price) {
    broker_->set_notional_per_unit(pair, price);
}

trade::OpenPosition SimulatedClient::get_open_position(const trade::AssetId& asset) const {
    trade::OpenPosition position;
    position.asset_symbol = asset;
    position.quantity = broker_->get_balance(asset);
    // the simulator does not track entry prices
    try {
        auto price = broker_->get_notional_per_unit(trade::AssetPair{asset, broker_->get_currency()});
        position.market_value = position.quantity * price;
    } catch (const trade::NoNotionalPerUnit&) {
        // held but never priced against the account currency
    }
    return position;
}

}
