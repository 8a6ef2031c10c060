#include "domain/value_objects/Price.hpp"

#include <cmath>

namespace vbe::domain {

Price::Price(double value) : value_(value) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw std::out_of_range(
            "Price must be a positive decimal, got: " + std::to_string(value));
    }
}

Price Price::from_string(const std::string& str) {
    std::size_t consumed = 0;
    double value = std::stod(str, &consumed);
    if (consumed != str.size()) {
        throw std::invalid_argument("Trailing characters in price: " + str);
    }
    return Price(value);
}

} // namespace vbe::domain
