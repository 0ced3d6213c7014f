#pragma once
#include "brokers/SimulatedClient.hpp"
#include "sim/SimulatedEnvironment.hpp"
#include "trade/EventBus.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

/*
Settings for a simulation run, read from a JSON file:
{
  "currency": "USD",
  "balances": {"USD": "1000", "GBP": "10"},
  "notional_assets": ["GBP"],
  "pairs": ["GBP/USD"],
  "bar_duration_seconds": 60,
  "refresh_interval_seconds": 30,
  "latest_bar_policy": "retry_previous",
  "sample_each_step": false,
  "bars_file": "bars.jsonl.gz",
  "db_path": ""
}
Every key is optional.
*/

namespace sim {

struct SimulationConfig {
    std::string currency{"USD"};
    std::map<trade::AssetId, trade::Decimal> balances;
    std::vector<trade::AssetId> notional_assets;        // the currency is always one
    std::vector<trade::AssetPair> pairs;
    long long bar_duration_seconds{60};
    long long refresh_interval_seconds{30};
    LatestBarPolicy latest_bar_policy{LatestBarPolicy::RetryPrevious};
    bool sample_each_step{false};
    std::string bars_file;
    std::string db_path;                                  // empty = keep bars in memory

    trade::Duration bar_duration() const { return std::chrono::seconds(bar_duration_seconds); }
    trade::Duration refresh_interval() const { return std::chrono::seconds(refresh_interval_seconds); }
};

// Throws std::runtime_error on a value of the wrong type or out of range.
SimulationConfig simulation_config_from_json(const nlohmann::json& j);

// Throws std::runtime_error if the file cannot be read or parsed.
SimulationConfig load_simulation_config(const std::string& path);

std::unique_ptr<broker::SimulatedBroker> make_broker(const SimulationConfig& config,
                                                     trade::EventBus* bus = nullptr);

std::unique_ptr<SimulatedEnvironment> make_environment(const SimulationConfig& config,
                                                       SimulatedContext context,
                                                       std::unique_ptr<broker::SimulatedClient> client);

}
