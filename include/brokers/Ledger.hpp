#pragma once
#include "trade/Decimal.hpp"
#include "trade/Types.hpp"
#include <unordered_map>
#include <vector>

namespace broker {

/*
Per-asset signed balances plus the buying power still free for new orders.
Balances move only on settlement; buying power moves when capacity is
reserved or released. Unseen assets read as zero. Not thread-safe on its own,
the owning broker serialises access.
*/
class Ledger {
public:
    Ledger() = default;
    // buying power starts equal to the settled balances
    explicit Ledger(const std::unordered_map<trade::AssetId, trade::Decimal>& starting_balances);

    trade::Decimal get_balance(const trade::AssetId& asset) const;
    trade::Decimal get_buying_power(const trade::AssetId& asset) const;

    void update_balance(const trade::AssetId& asset, const trade::Decimal& delta);
    void update_buying_power(const trade::AssetId& asset, const trade::Decimal& delta);

    // Every asset that has ever had a balance entry.
    std::vector<trade::AssetId> assets() const;

private:
    using ValueMap = std::unordered_map<trade::AssetId, trade::Decimal>;

    static trade::Decimal get_value(const ValueMap& values, const trade::AssetId& asset);

    ValueMap balances_;
    ValueMap buying_power_;
};

}
