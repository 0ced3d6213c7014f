#pragma once
#include "trade/IClient.hpp"
#include "trade/IMarket.hpp"

namespace trade {

// A full trading venue: order entry plus market data.
class IEnvironment : public IClient, public IMarket {
public:
    ~IEnvironment() override = default;
};

}
