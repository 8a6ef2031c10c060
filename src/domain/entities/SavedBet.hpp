#pragma once

#include "domain/value_objects/Timestamp.hpp"
#include "domain/value_objects/ValueDecision.hpp"

#include <string>

namespace vbe::domain {

struct SavedBet {
    std::string bookmaker;
    std::string sport;
    std::string bet_text;
    double odds;
    double price;
    ValueDecision decision;
    Timestamp recorded_at;

    // "<bookmaker> - <Sport> - <bet> - <odds> / <price>[ 2pc]"
    std::string to_line() const;
};

// Shortest decimal rendering that keeps at least one fractional digit:
// 2 -> "2.0", 1.85 -> "1.85".
std::string format_decimal(double value);

} // namespace vbe::domain
