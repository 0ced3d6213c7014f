#include "sim/SimulatedEnvironment.hpp"
#include "trade/Errors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace sim {

namespace {

void check_durations(trade::Duration bar_duration, trade::Duration refresh_interval) {
    if (bar_duration <= trade::Duration::zero()) {
        throw std::invalid_argument("bar_duration must be positive");
    }
    if (refresh_interval <= trade::Duration::zero()) {
        throw std::invalid_argument("refresh_interval must be positive");
    }
}

}

SimulatedEnvironment::SimulatedEnvironment(SimulatedContext context,
                                           std::unique_ptr<broker::SimulatedClient> client,
                                           std::unordered_set<trade::AssetPair> pairs_to_trade,
                                           trade::Duration bar_duration,
                                           trade::Duration refresh_interval,
                                           LatestBarPolicy latest_bar_policy,
                                           bool sample_each_step)
    : context_(std::move(context)),
      client_(std::move(client)),
      pairs_to_trade_(std::move(pairs_to_trade)),
      bar_duration_(bar_duration),
      refresh_interval_(refresh_interval),
      latest_bar_policy_(latest_bar_policy),
      sample_each_step_(sample_each_step) {
    if (!client_) {
        throw std::invalid_argument("SimulatedEnvironment requires a client");
    }
    check_durations(bar_duration_, refresh_interval_);
}

SimulatedEnvironment::~SimulatedEnvironment() = default;

void SimulatedEnvironment::init() {
    if (last_processed_time_) {
        throw trade::AlreadyInitialized();
    }
    last_processed_time_ = context_.clock().now();
    std::cout << "[SimulatedEnvironment] Initialized at " << trade::to_iso8601(*last_processed_time_)
              << " tracking " << pairs_to_trade_.size() << " pair(s)\n";
    update();
}

void SimulatedEnvironment::update() {
    require_initialized();

    const trade::TimePoint now = context_.clock().now();
    trade::TimePoint t = *last_processed_time_;

    // a clock that went backwards has nothing to replay
    if (t <= now) {
        std::size_t passes = 0;
        for (;;) {
            const trade::TimePoint sample_at = sample_each_step_ ? t : now;
            for (const auto& pair : pairs_to_trade_) {
                auto bar = context_.bar_data_source().get_bar(pair, sample_at, bar_duration_);
                if (bar) {
                    client_->set_notional_per_unit(pair, bar->mid());
                }
            }
            ++passes;
            if (t == now) break;
            t = std::min(t + refresh_interval_, now);
        }
#ifdef TRADE_DEBUG
        std::cout << "[SimulatedEnvironment] Caught up to " << trade::to_iso8601(now)
                  << " in " << passes << " pass(es)\n";
#else
        (void)passes;
#endif
    }

    last_processed_time_ = now;
}

trade::OrderId SimulatedEnvironment::place_order(const trade::OrderRequest& req) {
    update();
    return client_->place_order(req);
}

std::vector<trade::Order> SimulatedEnvironment::get_orders() {
    update();
    return client_->get_orders();
}

trade::Order SimulatedEnvironment::get_order(const trade::OrderId& order_id) {
    update();
    return client_->get_order(order_id);
}

trade::Account SimulatedEnvironment::get_account() {
    update();
    return client_->get_account();
}

std::optional<trade::Bar> SimulatedEnvironment::get_latest_bar(const trade::AssetPair& pair,
                                                               trade::Duration bar_duration) {
    require_initialized();

    const trade::TimePoint now = context_.clock().now();
    const auto& source = context_.bar_data_source();

    auto bar = source.get_bar(pair, now, bar_duration);
    if (!bar) {
        return std::nullopt;
    }

    // still forming at `now`: a venue would not have published it yet
    if (bar->date_time + bar_duration > now) {
        if (latest_bar_policy_ == LatestBarPolicy::Strict) {
            return std::nullopt;
        }
        return source.get_bar(pair, now - bar_duration, bar_duration);
    }
    return bar;
}

void SimulatedEnvironment::require_initialized() const {
    if (!last_processed_time_) {
        throw trade::NotInitialized();
    }
}

// ---- SimulatedEnvironmentBuilder ----

SimulatedEnvironmentBuilder::SimulatedEnvironmentBuilder(SimulatedContext context,
                                                         std::unique_ptr<broker::SimulatedClient> client)
    : context_(std::move(context)), client_(std::move(client)) {}

SimulatedEnvironmentBuilder&
SimulatedEnvironmentBuilder::set_pairs_to_trade(std::unordered_set<trade::AssetPair> pairs) {
    pairs_to_trade_ = std::move(pairs);
    return *this;
}

SimulatedEnvironmentBuilder& SimulatedEnvironmentBuilder::add_pair_to_trade(const trade::AssetPair& pair) {
    pairs_to_trade_.insert(pair);
    return *this;
}

SimulatedEnvironmentBuilder& SimulatedEnvironmentBuilder::set_bar_duration(trade::Duration bar_duration) {
    bar_duration_ = bar_duration;
    return *this;
}

SimulatedEnvironmentBuilder& SimulatedEnvironmentBuilder::set_refresh_interval(trade::Duration refresh_interval) {
    refresh_interval_ = refresh_interval;
    return *this;
}

SimulatedEnvironmentBuilder& SimulatedEnvironmentBuilder::set_latest_bar_policy(LatestBarPolicy policy) {
    latest_bar_policy_ = policy;
    return *this;
}

SimulatedEnvironmentBuilder& SimulatedEnvironmentBuilder::set_sample_each_step(bool sample_each_step) {
    sample_each_step_ = sample_each_step;
    return *this;
}

std::unique_ptr<SimulatedEnvironment> SimulatedEnvironmentBuilder::build() {
    if (!client_) {
        throw std::logic_error("SimulatedEnvironmentBuilder has already built its environment");
    }
    check_durations(bar_duration_, refresh_interval_);
    return std::make_unique<SimulatedEnvironment>(context_, std::move(client_), pairs_to_trade_,
                                                  bar_duration_, refresh_interval_,
                                                  latest_bar_policy_, sample_each_step_);
}

}
