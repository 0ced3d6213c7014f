#include "adapters/InMemoryBarDataSource.hpp"
#include <iterator>

namespace adapter {

namespace {

long long resolution_ms(trade::Duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

}

void InMemoryBarDataSource::add_bar(const trade::AssetPair& pair,
                                    trade::Duration bar_duration,
                                    const trade::Bar& bar) {
    _series[{pair.to_string(), resolution_ms(bar_duration)}][bar.date_time] = bar;
}

void InMemoryBarDataSource::add_bars(const std::vector<trade::BarRecord>& records) {
    for (const auto& rec : records) {
        add_bar(rec.pair, rec.duration, rec.bar);
    }
}

std::optional<trade::Bar> InMemoryBarDataSource::get_bar(const trade::AssetPair& pair,
                                                         trade::TimePoint at,
                                                         trade::Duration bar_duration) const {
    auto series = _series.find({pair.to_string(), resolution_ms(bar_duration)});
    if (series == _series.end()) return std::nullopt;

    // first bar opening after `at`; the one before it is the answer
    auto it = series->second.upper_bound(at);
    if (it == series->second.begin()) return std::nullopt;
    return std::prev(it)->second;
}

size_t InMemoryBarDataSource::size() const {
    size_t n = 0;
    for (const auto& [key, bars] : _series) {
        n += bars.size();
    }
    return n;
}

}
