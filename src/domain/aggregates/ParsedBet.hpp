#pragma once

#include "domain/value_objects/ScoreLine.hpp"

#include <string>
#include <vector>

namespace vbe::domain {

// Entities recognized in one bet description. Teams and markets are
// canonical names in recognition order.
struct ParsedBet {
    std::vector<std::string> teams;
    std::vector<std::string> markets;
    std::vector<ScoreLine> scores;
    std::vector<std::string> unrecognized;

    bool empty() const { return teams.empty() && markets.empty(); }
    bool has_market(const std::string& market) const;

    // {'teams': [...], 'markets': [...], 'scores': [...], 'unrecognized': [...]}
    std::string to_string() const;

    bool operator==(const ParsedBet&) const = default;
};

} // namespace vbe::domain
