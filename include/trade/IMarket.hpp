#pragma once
#include "trade/MarketDataTypes.hpp"
#include <optional>

/*
Market-data side of a venue. Only closed bars are ever returned: a bar whose
window is still forming is not published by real venues, so it is not here either.
*/

namespace trade {

class IMarket {
public:
    virtual ~IMarket() = default;

    virtual std::optional<Bar> get_latest_bar(const AssetPair& pair, Duration bar_duration) = 0;
};

}
