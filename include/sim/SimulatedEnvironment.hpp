#pragma once
#include "brokers/SimulatedClient.hpp"
#include "sim/SimulatedContext.hpp"
#include "trade/IEnvironment.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <unordered_set>

/*
SimulatedEnvironment:
  IEnvironment whose prices come from historical bars instead of a venue.

  Every client call first catches the broker up to the context clock: time is
  stepped from the last processed instant to now in refresh_interval steps and
  on each pass every tracked pair is priced at the (low + high) / 2 of its
  bar. Pending limit orders are re-checked by the broker on each price write.

  get_latest_bar never returns a bar whose window is still open at the clock
  time, since real venues only publish aggregated bars once they close.
*/

namespace sim {

enum class LatestBarPolicy {
    RetryPrevious,  // fall back to the bar one duration earlier
    Strict          // report no bar
};

class SimulatedEnvironment : public trade::IEnvironment {
public:
    SimulatedEnvironment(SimulatedContext context,
                         std::unique_ptr<broker::SimulatedClient> client,
                         std::unordered_set<trade::AssetPair> pairs_to_trade,
                         trade::Duration bar_duration,
                         trade::Duration refresh_interval,
                         LatestBarPolicy latest_bar_policy = LatestBarPolicy::RetryPrevious,
                         bool sample_each_step = false);
    ~SimulatedEnvironment() override;

    // Must be called once, before any other call. Throws AlreadyInitialized.
    void init();

    // Replays prices up to the clock's now. Throws NotInitialized before init().
    void update();

    bool is_initialized() const { return last_processed_time_.has_value(); }
    std::optional<trade::TimePoint> last_processed_time() const { return last_processed_time_; }

    // ---- IClient ----
    trade::OrderId place_order(const trade::OrderRequest& req) override;
    std::vector<trade::Order> get_orders() override;
    trade::Order get_order(const trade::OrderId& order_id) override;
    trade::Account get_account() override;

    // ---- IMarket ----
    std::optional<trade::Bar> get_latest_bar(const trade::AssetPair& pair,
                                             trade::Duration bar_duration) override;

    broker::SimulatedClient& client() { return *client_; }
    broker::SimulatedBroker& broker() { return client_->broker(); }

private:
    void require_initialized() const;

    SimulatedContext context_;
    std::unique_ptr<broker::SimulatedClient> client_;
    std::unordered_set<trade::AssetPair> pairs_to_trade_;
    trade::Duration bar_duration_;
    trade::Duration refresh_interval_;
    LatestBarPolicy latest_bar_policy_;
    bool sample_each_step_;
    std::optional<trade::TimePoint> last_processed_time_;
};

class SimulatedEnvironmentBuilder {
public:
    SimulatedEnvironmentBuilder(SimulatedContext context, std::unique_ptr<broker::SimulatedClient> client);

    SimulatedEnvironmentBuilder& set_pairs_to_trade(std::unordered_set<trade::AssetPair> pairs);
    SimulatedEnvironmentBuilder& add_pair_to_trade(const trade::AssetPair& pair);
    SimulatedEnvironmentBuilder& set_bar_duration(trade::Duration bar_duration);
    SimulatedEnvironmentBuilder& set_refresh_interval(trade::Duration refresh_interval);
    SimulatedEnvironmentBuilder& set_latest_bar_policy(LatestBarPolicy policy);
    SimulatedEnvironmentBuilder& set_sample_each_step(bool sample_each_step);

    // Hands the client over to the environment; a builder builds once.
    std::unique_ptr<SimulatedEnvironment> build();

private:
    SimulatedContext context_;
    std::unique_ptr<broker::SimulatedClient> client_;
    std::unordered_set<trade::AssetPair> pairs_to_trade_;
    trade::Duration bar_duration_{std::chrono::minutes(1)};
    trade::Duration refresh_interval_{std::chrono::seconds(30)};
    LatestBarPolicy latest_bar_policy_{LatestBarPolicy::RetryPrevious};
    bool sample_each_step_{false};
};

}
