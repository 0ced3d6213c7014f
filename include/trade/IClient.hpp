#pragma once
#include "trade/Types.hpp"
#include <string>
#include <vector>

/*
the interface in which clients -- the classes that place orders, check account balances, etc -- inherit.
A live venue client and the simulated client both satisfy it, so strategies can be handed either.
*/

namespace trade {
class IClient {
public:
    // Returns the id of the created order.
    virtual OrderId place_order(const OrderRequest& req) = 0;

    virtual std::vector<Order> get_orders() = 0;

    // Throws OrderNotFound for an unknown id.
    virtual Order get_order(const OrderId& order_id) = 0;

    virtual Account get_account() = 0;

    virtual ~IClient() = default;
};

} // namespace trade
