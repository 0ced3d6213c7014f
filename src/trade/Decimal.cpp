#include "trade/Decimal.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace trade {

namespace {

using wide = __int128;

std::int64_t narrow(wide v, const char* op) {
    if (v > std::numeric_limits<std::int64_t>::max() ||
        v < std::numeric_limits<std::int64_t>::min()) {
        throw std::overflow_error(std::string("Decimal overflow in ") + op);
    }
    return static_cast<std::int64_t>(v);
}

} // namespace

Decimal Decimal::parse(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("Cannot parse empty string as decimal");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        pos = 1;
    }

    wide int_part = 0;
    wide frac_part = 0;
    int frac_digits = 0;
    bool seen_digit = false;
    bool seen_point = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_point) {
                throw std::invalid_argument("Invalid decimal '" + std::string(text) + "'");
            }
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid decimal '" + std::string(text) + "'");
        }
        seen_digit = true;
        int digit = c - '0';
        if (!seen_point) {
            int_part = int_part * 10 + digit;
            if (int_part > std::numeric_limits<std::int64_t>::max() / kScale) {
                throw std::out_of_range("Decimal '" + std::string(text) + "' is out of range");
            }
        } else if (frac_digits < kPlaces) {
            // digits past the 8th place are truncated
            frac_part = frac_part * 10 + digit;
            ++frac_digits;
        }
    }

    if (!seen_digit) {
        throw std::invalid_argument("Invalid decimal '" + std::string(text) + "'");
    }

    for (int i = frac_digits; i < kPlaces; ++i) frac_part *= 10;

    wide raw = int_part * kScale + frac_part;
    return from_raw(narrow(negative ? -raw : raw, "parse"));
}

Decimal Decimal::from_double(double value) {
    double scaled = std::round(value * static_cast<double>(kScale));
    if (!std::isfinite(scaled) ||
        scaled >= static_cast<double>(std::numeric_limits<std::int64_t>::max()) ||
        scaled <= static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
        throw std::out_of_range("Decimal out of range: " + std::to_string(value));
    }
    return from_raw(static_cast<std::int64_t>(scaled));
}

std::string Decimal::to_string() const {
    wide v = raw_;
    bool negative = v < 0;
    if (negative) v = -v;

    auto int_part = static_cast<unsigned long long>(v / kScale);
    auto frac_part = static_cast<unsigned long long>(v % kScale);

    std::string out = negative ? "-" : "";
    out += std::to_string(int_part);
    if (frac_part != 0) {
        std::string frac = std::to_string(frac_part);
        frac.insert(0, kPlaces - frac.size(), '0');
        while (!frac.empty() && frac.back() == '0') frac.pop_back();
        out += '.';
        out += frac;
    }
    return out;
}

Decimal Decimal::operator+(const Decimal& o) const {
    return from_raw(narrow(static_cast<wide>(raw_) + o.raw_, "addition"));
}

Decimal Decimal::operator-(const Decimal& o) const {
    return from_raw(narrow(static_cast<wide>(raw_) - o.raw_, "subtraction"));
}

Decimal Decimal::operator*(const Decimal& o) const {
    wide product = static_cast<wide>(raw_) * o.raw_;
    return from_raw(narrow(product / kScale, "multiplication"));
}

Decimal Decimal::operator/(const Decimal& o) const {
    if (o.raw_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    wide numerator = static_cast<wide>(raw_) * kScale;
    return from_raw(narrow(numerator / o.raw_, "division"));
}

Decimal Decimal::operator-() const {
    return from_raw(narrow(-static_cast<wide>(raw_), "negation"));
}

} // namespace trade
