#include "brokers/Ledger.hpp"

namespace broker {

Ledger::Ledger(const std::unordered_map<trade::AssetId, trade::Decimal>& starting_balances)
    : balances_(starting_balances), buying_power_(starting_balances) {}

trade::Decimal Ledger::get_balance(const trade::AssetId& asset) const {
    return get_value(balances_, asset);
}

trade::Decimal Ledger::get_buying_power(const trade::AssetId& asset) const {
    return get_value(buying_power_, asset);
}

void Ledger::update_balance(const trade::AssetId& asset, const trade::Decimal& delta) {
    balances_[asset] += delta;
}

void Ledger::update_buying_power(const trade::AssetId& asset, const trade::Decimal& delta) {
    buying_power_[asset] += delta;
}

std::vector<trade::AssetId> Ledger::assets() const {
    std::vector<trade::AssetId> out;
    out.reserve(balances_.size());
    for (const auto& [asset, _] : balances_) {
        out.push_back(asset);
    }
    return out;
}

trade::Decimal Ledger::get_value(const ValueMap& values, const trade::AssetId& asset) {
    auto it = values.find(asset);
    return it != values.end() ? it->second : trade::Decimal{};
}

}
