#pragma once
#include "brokers/SimulatedBroker.hpp"
#include "trade/IClient.hpp"
#include <memory>

namespace broker {

// IClient facade over a SimulatedBroker: maps broker state to account/order DTOs.
class SimulatedClient : public trade::IClient {
public:
    explicit SimulatedClient(std::unique_ptr<SimulatedBroker> broker);
    ~SimulatedClient() override;

    trade::OrderId place_order(const trade::OrderRequest& req) override;
    std::vector<trade::Order> get_orders() override;
    trade::Order get_order(const trade::OrderId& order_id) override;
    trade::Account get_account() override;

    void set_notional_per_unit(const trade::AssetPair& pair, const trade::Decimal& price);

    SimulatedBroker& broker() { return *broker_; }
    const SimulatedBroker& broker() const { return *broker_; }

private:
    trade::OpenPosition get_open_position(const trade::AssetId& asset) const;

    std::unique_ptr<SimulatedBroker> broker_;
};

}
