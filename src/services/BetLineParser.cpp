#include "services/BetLineParser.hpp"

#include "domain/text/Normalization.hpp"

#include <cmath>
#include <iostream>
#include <iterator>
#include <regex>
#include <stdexcept>

using namespace vbe::domain;

namespace vbe::services {

namespace {

const std::regex kFieldSeparator(R"(\s-\s)");
const std::regex kKickoffTime(R"(\(\d{1,2}:\d{2}\))");

std::string replace_all(std::string s, char from, char to) {
    for (auto& c : s) {
        if (c == from) c = to;
    }
    return s;
}

// Case-insensitive removal of every occurrence of needle.
std::string erase_all(const std::string& s, const std::string& needle) {
    if (needle.empty()) return s;
    std::string lowered = text::to_lower(s);
    std::string lowered_needle = text::to_lower(needle);

    std::string out;
    std::size_t pos = 0;
    while (true) {
        std::size_t found = lowered.find(lowered_needle, pos);
        if (found == std::string::npos) {
            out.append(s, pos, std::string::npos);
            return out;
        }
        out.append(s, pos, found - pos);
        pos = found + lowered_needle.size();
    }
}

std::string strip_chars(const std::string& s, const std::string& chars) {
    std::size_t begin = s.find_first_not_of(chars);
    if (begin == std::string::npos) return {};
    std::size_t end = s.find_last_not_of(chars);
    return s.substr(begin, end - begin + 1);
}

std::size_t count_occurrences(const std::string& s, const std::string& needle) {
    std::size_t count = 0;
    for (std::size_t pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

} // namespace

MatchSide match_side_from_string(const std::string& pick) {
    std::string lowered = text::to_lower(text::trim(pick));
    if (lowered == "away") return MatchSide::AWAY;
    if (lowered != "home") {
        std::cerr << "[parser] Invalid pick value '" << pick << "', defaulting to 'home'" << std::endl;
    }
    return MatchSide::HOME;
}

std::optional<double> BetLineParser::parse_odds(const std::string& text) {
    std::string trimmed = text::trim(text);
    if (trimmed.empty()) return std::nullopt;
    try {
        std::size_t consumed = 0;
        double value = std::stod(trimmed, &consumed);
        if (consumed != trimmed.size() || !(value > 0.0) || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

BetLine BetLineParser::parse_bet_line(const std::string& input) {
    BetLine line;
    line.bet_text = input;

    auto separators = std::distance(std::sregex_iterator(input.begin(), input.end(), kFieldSeparator),
                                    std::sregex_iterator());
    if (separators != 3) return line;

    std::vector<std::string> parts;
    auto begin = input.cbegin();
    std::smatch m;
    while (parts.size() < 3 && std::regex_search(begin, input.cend(), m, kFieldSeparator)) {
        parts.push_back(text::trim(std::string(begin, m[0].first)));
        begin = m[0].second;
    }
    parts.push_back(text::trim(std::string(begin, input.cend())));

    line.bookmaker = parts[0];
    line.sport = parts[1];
    line.bet_text = parts[2];
    line.odds = parse_odds(parts[3]);
    line.explicit_format = line.odds.has_value();
    if (!line.odds) {
        std::cerr << "[parser] Odds '" << parts[3] << "' not recognized as a positive decimal number"
                  << std::endl;
    }
    return line;
}

std::string BetLineParser::preprocess_input(const std::string& input) {
    std::string s = text::to_lower(input);
    s = replace_all(s, ',', ' ');
    s = replace_all(s, '&', ' ');
    return text::collapse_whitespace(s);
}

std::vector<std::string> BetLineParser::parse_multiple_matches(const std::string& input, MatchSide pick) {
    std::vector<std::string> teams;

    std::string unified = replace_all(input, '&', ',');
    std::size_t start = 0;
    while (start <= unified.size()) {
        std::size_t comma = unified.find(',', start);
        std::string segment = unified.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        start = comma == std::string::npos ? unified.size() + 1 : comma + 1;

        segment = text::trim(std::regex_replace(segment, kKickoffTime, ""));
        std::size_t versus = segment.find(" v ");
        if (segment.empty() || versus == std::string::npos) continue;

        std::string home = text::trim(segment.substr(0, versus));
        std::string away = text::trim(segment.substr(versus + 3));
        teams.push_back(pick == MatchSide::HOME ? home : away);
    }
    return teams;
}

std::string BetLineParser::simplify_multiple_matches(const std::string& input) {
    auto home_teams = parse_multiple_matches(input, MatchSide::HOME);
    auto away_teams = parse_multiple_matches(input, MatchSide::AWAY);

    std::string leftover = std::regex_replace(input, kKickoffTime, "");
    for (const auto& team : home_teams) leftover = erase_all(leftover, team);
    for (const auto& team : away_teams) leftover = erase_all(leftover, team);
    leftover = text::remove_whole_word(leftover, "v");
    leftover = text::trim(strip_chars(leftover, ", "));

    std::string simplified = text::join_tokens(home_teams);
    if (!leftover.empty()) {
        simplified += " " + leftover;
    }
    return preprocess_input(simplified);
}

bool BetLineParser::has_multiple_matches(const std::string& input) {
    return count_occurrences(text::to_lower(input), " v ") > 1;
}

} // namespace vbe::services
