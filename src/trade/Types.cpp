#include "trade/Types.hpp"
#include "trade/Errors.hpp"

namespace trade {

AssetPair AssetPair::parse(const std::string& text) {
    auto slash = text.find('/');
    if (slash == std::string::npos || text.find('/', slash + 1) != std::string::npos) {
        throw InvalidAssetPair(text);
    }
    AssetPair pair{text.substr(0, slash), text.substr(slash + 1)};
    if (pair.quantity_asset.empty() || pair.notional_asset.empty()) {
        throw InvalidAssetPair(text);
    }
    return pair;
}

} // namespace trade
