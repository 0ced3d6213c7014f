#pragma once
#include "trade/MarketDataTypes.hpp"
#include "trade/Types.hpp"
#include <nlohmann/json.hpp>

/*
nlohmann::json encodings of the public types.

Decimals are written as strings ("1.31") so no precision is lost on the way
through a double; on input a string, integer or float is accepted.
Asset pairs are written as "QUANTITY/NOTIONAL", bar times as unix seconds.
*/

namespace trade {

using json = nlohmann::json;

void to_json(json& j, const Decimal& d);
void from_json(const json& j, Decimal& d);

void to_json(json& j, const AssetPair& p);
void from_json(const json& j, AssetPair& p);

// {"quantity": "1.5"} or {"notional": "10"}
void to_json(json& j, const Amount& a);
void from_json(const json& j, Amount& a);

void to_json(json& j, const Order& o);
void to_json(json& j, const OpenPosition& p);
void to_json(json& j, const Account& a);

void to_json(json& j, const Bar& b);
void from_json(const json& j, Bar& b);

} // namespace trade
