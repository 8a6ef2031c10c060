#pragma once

#include <string>

namespace vbe::domain {

// Sport a market name belongs to, judged by the league tag it carries
// ("moneyline_nba" -> "nba"). Anything untagged is football.
std::string infer_sport_from_market(const std::string& market_name);

// "nba" -> "NBA", "football" -> "Football".
std::string sport_display_name(const std::string& sport);

} // namespace vbe::domain
