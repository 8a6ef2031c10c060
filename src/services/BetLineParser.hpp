#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vbe::services {

// "bookmaker - sport - bet - odds", or just the bet when the line does not
// have exactly three " - " separators.
struct BetLine {
    std::optional<std::string> bookmaker;
    std::optional<std::string> sport;
    std::string bet_text;
    std::optional<double> odds;       // missing or not a positive decimal
    bool explicit_format = false;     // all four parts present and odds valid
};

enum class MatchSide { HOME, AWAY };

MatchSide match_side_from_string(const std::string& pick);

class BetLineParser {
public:
    static BetLine parse_bet_line(const std::string& input);

    // Lower-cased, commas and ampersands turned into spaces, whitespace collapsed.
    static std::string preprocess_input(const std::string& input);

    // One side of every "Home v Away" fixture in a comma or '&' separated
    // list. Kickoff annotations such as "(20:00)" are dropped.
    static std::vector<std::string> parse_multiple_matches(const std::string& input,
                                                           MatchSide pick = MatchSide::HOME);

    // Home teams of a multi-fixture line followed by whatever text is left
    // once both sides of every fixture are taken out.
    static std::string simplify_multiple_matches(const std::string& input);

    static bool has_multiple_matches(const std::string& input);

    static std::optional<double> parse_odds(const std::string& text);
};

} // namespace vbe::services
