#pragma once
#include "trade/IBarDataSource.hpp"
#include <map>
#include <utility>
#include <vector>

namespace adapter {

// Bars held in memory, indexed by (pair, resolution) then by open time.
class InMemoryBarDataSource : public trade::IBarDataSource {
public:
    InMemoryBarDataSource() = default;
    explicit InMemoryBarDataSource(const std::vector<trade::BarRecord>& records) { add_bars(records); }

    // A bar with the same pair, resolution and open time replaces the old one.
    void add_bar(const trade::AssetPair& pair, trade::Duration bar_duration, const trade::Bar& bar);
    void add_bars(const std::vector<trade::BarRecord>& records);

    std::optional<trade::Bar> get_bar(const trade::AssetPair& pair,
                                      trade::TimePoint at,
                                      trade::Duration bar_duration) const override;

    size_t size() const;

private:
    using SeriesKey = std::pair<std::string, long long>;   // (pair, resolution_ms)

    std::map<SeriesKey, std::map<trade::TimePoint, trade::Bar>> _series;
};

}
