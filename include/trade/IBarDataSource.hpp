#pragma once
#include "trade/MarketDataTypes.hpp"
#include <optional>

/*
The interface historical bar providers inherit. The simulated environment
samples it to drive prices forward.
*/

namespace trade {

class IBarDataSource {
public:
    virtual ~IBarDataSource() = default;

    // Latest bar of the given resolution whose date_time is <= at, if any.
    // Source failures (I/O, database) are thrown.
    virtual std::optional<Bar> get_bar(const AssetPair& pair,
                                       TimePoint at,
                                       Duration bar_duration) const = 0;
};

}
