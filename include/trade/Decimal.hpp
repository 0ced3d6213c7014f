#pragma once
#include <compare>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

namespace trade {

/*
Fixed-point decimal used for every price, quantity and balance.
8 fractional digits (e.g. raw 131000000 = 1.31), enough for satoshi-sized
crypto quantities. Addition and comparison are exact; multiplication and
division go through a 128-bit intermediate and truncate toward zero.
*/
class Decimal {
public:
    static constexpr int          kPlaces = 8;
    static constexpr std::int64_t kScale  = 100'000'000;

    constexpr Decimal() = default;

    template <typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
    constexpr explicit Decimal(T units) : raw_(static_cast<std::int64_t>(units) * kScale) {}

    static constexpr Decimal from_raw(std::int64_t raw) {
        Decimal d;
        d.raw_ = raw;
        return d;
    }

    // Accepts "[-+]digits[.digits]". Throws std::invalid_argument on malformed
    // text, std::out_of_range if the value does not fit.
    static Decimal parse(std::string_view text);

    // Rounds to the nearest representable value.
    static Decimal from_double(double value);

    constexpr std::int64_t raw() const { return raw_; }
    double to_double() const { return static_cast<double>(raw_) / static_cast<double>(kScale); }
    std::string to_string() const;

    constexpr bool is_zero() const { return raw_ == 0; }
    constexpr bool is_negative() const { return raw_ < 0; }

    constexpr auto operator<=>(const Decimal&) const = default;

    Decimal operator+(const Decimal& o) const;
    Decimal operator-(const Decimal& o) const;
    Decimal operator*(const Decimal& o) const;
    Decimal operator/(const Decimal& o) const;   // throws std::domain_error on zero
    Decimal operator-() const;

    Decimal& operator+=(const Decimal& o) { return *this = *this + o; }
    Decimal& operator-=(const Decimal& o) { return *this = *this - o; }

private:
    std::int64_t raw_{0};
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& d) {
    return os << d.to_string();
}

} // namespace trade
