#pragma once
#include "trade/Decimal.hpp"
#include "trade/Types.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace trade {

// OHLC summary over [date_time, date_time + duration)
struct Bar {
    Decimal   open{};
    Decimal   high{};
    Decimal   low{};
    Decimal   close{};
    TimePoint date_time{};

    // price the simulator trades at while this bar is current
    Decimal mid() const { return (low + high) / Decimal(2); }
    bool has_positive_prices() const {
        return open > Decimal{} && high > Decimal{} && low > Decimal{} && close > Decimal{};
    }

    bool operator==(const Bar&) const = default;
};

// A bar as stored by a data source, keyed by pair and resolution.
struct BarRecord {
    AssetPair pair;
    Duration  duration{};
    Bar       bar;
};

inline long long to_epoch_ms(const TimePoint& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(long long ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

inline std::string to_iso8601(const TimePoint& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&tt, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

}
