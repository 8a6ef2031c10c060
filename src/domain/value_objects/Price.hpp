#pragma once

#include <compare>
#include <stdexcept>
#include <string>

namespace vbe::domain {

// Decimal odds as quoted by the exchange or a bookmaker.
class Price {
public:
    explicit Price(double value);

    static Price from_string(const std::string& str);

    double value() const noexcept { return value_; }
    double implied_probability() const noexcept { return 1.0 / value_; }

    bool operator==(const Price&) const = default;
    auto operator<=>(const Price&) const = default;

private:
    double value_;
};

} // namespace vbe::domain
