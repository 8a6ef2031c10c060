#include "domain/value_objects/Sport.hpp"

#include "domain/text/Normalization.hpp"

#include <array>
#include <cctype>

namespace vbe::domain {

namespace {

constexpr std::array<const char*, 3> kLeagueSports = {"nba", "nfl", "nhl"};

} // namespace

std::string infer_sport_from_market(const std::string& market_name) {
    std::string market = text::to_lower(market_name);
    for (const char* league : kLeagueSports) {
        if (market.find(league) != std::string::npos) {
            return league;
        }
    }
    return "football";
}

std::string sport_display_name(const std::string& sport) {
    std::string lower = text::to_lower(sport);
    for (const char* league : kLeagueSports) {
        if (lower == league) {
            std::string upper = lower;
            for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return upper;
        }
    }
    if (!lower.empty()) {
        lower[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(lower[0])));
    }
    return lower;
}

} // namespace vbe::domain
