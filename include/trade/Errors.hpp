#pragma once
#include <stdexcept>
#include <string>

/*
Typed failures reported by the simulated broker and environment.
All derive from TradeError so callers can catch the whole family, and from
std::runtime_error so they print like every other engine error.
*/

namespace trade {

class TradeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidAssetPair : public TradeError {
public:
    explicit InvalidAssetPair(const std::string& text)
        : TradeError("Invalid asset pair '" + text + "', expected QUANTITY/NOTIONAL"), text_(text) {}
    const std::string& text() const { return text_; }
private:
    std::string text_;
};

class MissingCurrencyNotionalAsset : public TradeError {
public:
    explicit MissingCurrencyNotionalAsset(const std::string& currency)
        : TradeError("Missing currency notional asset " + currency), currency_(currency) {}
    const std::string& currency() const { return currency_; }
private:
    std::string currency_;
};

class InvalidNotionalAsset : public TradeError {
public:
    explicit InvalidNotionalAsset(const std::string& asset)
        : TradeError(asset + " is not a valid notional asset"), asset_(asset) {}
    const std::string& asset() const { return asset_; }
private:
    std::string asset_;
};

class NoNotionalPerUnit : public TradeError {
public:
    explicit NoNotionalPerUnit(const std::string& pair)
        : TradeError(pair + " does not have notional per unit"), pair_(pair) {}
    const std::string& pair() const { return pair_; }
private:
    std::string pair_;
};

class InsufficientBuyingPower : public TradeError {
public:
    explicit InsufficientBuyingPower(const std::string& asset)
        : TradeError("Not enough " + asset + " buying power"), asset_(asset) {}
    const std::string& asset() const { return asset_; }
private:
    std::string asset_;
};

class OrderNotFound : public TradeError {
public:
    explicit OrderNotFound(const std::string& order_id)
        : TradeError("Order with id " + order_id + " doesn't exist"), order_id_(order_id) {}
    const std::string& order_id() const { return order_id_; }
private:
    std::string order_id_;
};

class NotInitialized : public TradeError {
public:
    NotInitialized() : TradeError("Environment has not been initialized") {}
};

class AlreadyInitialized : public TradeError {
public:
    AlreadyInitialized() : TradeError("Environment has already been initialized") {}
};

} // namespace trade
