#include "sim/SimulationConfig.hpp"
#include "trade/Errors.hpp"
#include "trade/Json.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace sim {

using json = nlohmann::json;

namespace {

LatestBarPolicy parse_policy(const std::string& s) {
    if (s == "retry_previous") return LatestBarPolicy::RetryPrevious;
    if (s == "strict") return LatestBarPolicy::Strict;
    throw std::runtime_error("Unknown latest_bar_policy '" + s + "' (expected retry_previous or strict)");
}

}

SimulationConfig simulation_config_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    SimulationConfig cfg;
    try {
        cfg.currency = j.value("currency", cfg.currency);

        if (j.contains("balances")) {
            for (const auto& [asset, amount] : j.at("balances").items()) {
                cfg.balances[asset] = amount.get<trade::Decimal>();
            }
        }
        if (j.contains("notional_assets")) {
            cfg.notional_assets = j.at("notional_assets").get<std::vector<trade::AssetId>>();
        }
        if (j.contains("pairs")) {
            cfg.pairs = j.at("pairs").get<std::vector<trade::AssetPair>>();
        }

        cfg.bar_duration_seconds = j.value("bar_duration_seconds", cfg.bar_duration_seconds);
        cfg.refresh_interval_seconds = j.value("refresh_interval_seconds", cfg.refresh_interval_seconds);
        if (j.contains("latest_bar_policy")) {
            cfg.latest_bar_policy = parse_policy(j.at("latest_bar_policy").get<std::string>());
        }
        cfg.sample_each_step = j.value("sample_each_step", cfg.sample_each_step);
        cfg.bars_file = j.value("bars_file", cfg.bars_file);
        cfg.db_path = j.value("db_path", cfg.db_path);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    } catch (const std::logic_error& e) {
        // bad decimal text or out-of-range value
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    } catch (const trade::TradeError& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }

    if (cfg.currency.empty()) {
        throw std::runtime_error("Invalid config: currency must not be empty");
    }
    if (cfg.bar_duration_seconds <= 0 || cfg.refresh_interval_seconds <= 0) {
        throw std::runtime_error("Invalid config: durations must be positive");
    }
    return cfg;
}

SimulationConfig load_simulation_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse config file '" + path + "': " + e.what());
    }

    auto cfg = simulation_config_from_json(j);
    std::cout << "[SimulationConfig] Loaded " << path << " (currency=" << cfg.currency
              << ", pairs=" << cfg.pairs.size() << ")\n";
    return cfg;
}

std::unique_ptr<broker::SimulatedBroker> make_broker(const SimulationConfig& config, trade::EventBus* bus) {
    broker::SimulatedBrokerBuilder builder(config.currency);

    for (const auto& asset : config.notional_assets) {
        builder.add_notional_asset(asset);
    }
    for (const auto& [asset, amount] : config.balances) {
        if (asset == config.currency) {
            builder.set_balance(amount);
        } else {
            builder.set_asset_balance(asset, amount);
        }
    }
    if (bus) {
        builder.set_event_bus(*bus);
    }
    return builder.build();
}

std::unique_ptr<SimulatedEnvironment> make_environment(const SimulationConfig& config,
                                                       SimulatedContext context,
                                                       std::unique_ptr<broker::SimulatedClient> client) {
    SimulatedEnvironmentBuilder builder(std::move(context), std::move(client));
    builder.set_bar_duration(config.bar_duration())
        .set_refresh_interval(config.refresh_interval())
        .set_latest_bar_policy(config.latest_bar_policy)
        .set_sample_each_step(config.sample_each_step);
    for (const auto& pair : config.pairs) {
        builder.add_pair_to_trade(pair);
    }
    return builder.build();
}

}
