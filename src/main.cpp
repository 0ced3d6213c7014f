#include "adapters/BarFileReader.hpp"
#include "adapters/InMemoryBarDataSource.hpp"
#include "adapters/SqliteBarDataSource.hpp"
#include "brokers/SimulatedClient.hpp"
#include "sim/Clocks.hpp"
#include "sim/SimulatedEnvironment.hpp"
#include "sim/SimulationConfig.hpp"
#include "trade/Errors.hpp"
#include "trade/EventBus.hpp"
#include "trade/Json.hpp"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_set>

static std::atomic<bool> shutdown_requested(false);

void signal_handler(int sig) {
  shutdown_requested = true;
}

static void usage() {
  std::cerr << "Usage: tradesim_replay [--config <config.json>] [--bars <bars.jsonl.gz>] [--db <bars.db>]\n";
}

int main(int argc, char* argv[]) {

#ifdef TRADE_DEBUG
  std::cout << "debug is on! let's go\n";
#endif

  // Parse command-line arguments; flags override the config file
  std::string config_file;
  std::string bars_file;
  std::string db_path;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_file = argv[++i];
    } else if (arg == "--bars" && i + 1 < argc) {
      bars_file = argv[++i];
    } else if (arg == "--db" && i + 1 < argc) {
      db_path = argv[++i];
    } else {
      usage();
      return 2;
    }
  }

  try {
    sim::SimulationConfig config;
    if (!config_file.empty()) {
      config = sim::load_simulation_config(config_file);
    }
    if (!bars_file.empty()) config.bars_file = bars_file;
    if (!db_path.empty()) config.db_path = db_path;

    if (config.bars_file.empty()) {
      std::cerr << "[Main] No bar file given\n";
      usage();
      return 2;
    }

    // 1. load historical bars into a data source
    adapter::BarFileReader reader(config.bars_file);
    std::vector<trade::BarRecord> records = reader.read_all();
    if (records.empty()) {
      std::cerr << "[Main] " << config.bars_file << " contains no bars\n";
      return 1;
    }

    std::shared_ptr<trade::IBarDataSource> source;
    if (config.db_path.empty()) {
      source = std::make_shared<adapter::InMemoryBarDataSource>(records);
    } else {
      adapter::SqliteBarStoreConfig store_cfg;
      store_cfg.db_path = config.db_path;
      auto store = std::make_shared<adapter::SqliteBarDataSource>(store_cfg);
      store->add_bars(records);
      store->flush();
      source = store;
    }

    // trade every pair in the file unless the config names some
    if (config.pairs.empty()) {
      std::unordered_set<std::string> seen;
      for (const auto& rec : records) {
        if (seen.insert(rec.pair.to_string()).second) {
          config.pairs.push_back(rec.pair);
        }
      }
    }

    auto [first, last] = std::minmax_element(records.begin(), records.end(),
        [](const trade::BarRecord& a, const trade::BarRecord& b) { return a.bar.date_time < b.bar.date_time; });
    const trade::TimePoint start = first->bar.date_time;
    const trade::TimePoint end = last->bar.date_time + config.bar_duration();

    // 2. print order events as the broker emits them
    trade::EventBus bus;
    auto print_order = [](const trade::Event& ev) {
      const auto& order = std::any_cast<const trade::Order&>(ev.data);
      std::cout << "[Main] " << ev.type << " " << trade::json(order).dump() << "\n";
    };
    bus.subscribe(trade::kOrderPlacedTopic, print_order);
    bus.subscribe(trade::kOrderFilledTopic, print_order);

    // 3. broker -> client -> environment, driven by a manual clock
    auto clock = std::make_shared<sim::ManualClock>(start);
    auto client = std::make_unique<broker::SimulatedClient>(sim::make_broker(config, &bus));
    auto env = sim::make_environment(config, sim::SimulatedContext(source, clock), std::move(client));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    env->init();

    // 4. demo orders on the first pair: spend a tenth of the cash, then offer
    // the purchase back 1% above the entry price
    const trade::AssetPair& pair = config.pairs.front();
    try {
      trade::Account account = env->get_account();
      trade::Decimal spend = account.cash / trade::Decimal(10);
      if (pair.notional_asset == config.currency && !spend.is_zero()) {
        auto buy_id = env->place_order(trade::OrderRequest::market_buy(pair, trade::Amount::notional(spend)));
        trade::Order buy = env->get_order(buy_id);
        if (buy.average_fill_price) {
          trade::Decimal target = *buy.average_fill_price * trade::Decimal::parse("1.01");
          env->place_order(trade::OrderRequest::limit_sell(pair, trade::Amount::quantity(buy.filled_quantity), target));
        }
      }
    } catch (const trade::TradeError& e) {
      std::cerr << "[Main] Demo order rejected: " << e.what() << "\n";
    }

    // 5. replay
    std::cout << "[Main] Replaying " << trade::to_iso8601(start) << " .. " << trade::to_iso8601(end) << "\n";
    size_t steps = 0;
    while (clock->now() < end && !shutdown_requested) {
      clock->set(std::min(clock->now() + config.refresh_interval(), end));
      env->update();
      ++steps;
    }
    if (shutdown_requested) {
      std::cout << "\n[Main] Shutdown signal received. Stopping replay.\n";
    }
    std::cout << "[Main] Replay finished after " << steps << " steps at " << trade::to_iso8601(clock->now()) << "\n";

    if (auto bar = env->get_latest_bar(pair, config.bar_duration())) {
      std::cout << "[Main] Latest closed " << pair.to_string() << " bar: " << trade::json(*bar).dump() << "\n";
    }

    trade::json summary{
      {"account", env->get_account()},
      {"orders", env->get_orders()},
    };
    std::cout << summary.dump(2) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[Main] Error: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[Main] Cleanup complete. Exiting.\n";
  return 0;
}
