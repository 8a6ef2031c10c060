#include "services/BetParser.hpp"

#include "domain/text/Normalization.hpp"
#include "domain/text/Similarity.hpp"

#include <algorithm>
#include <iostream>
#include <set>

using namespace vbe::domain;

namespace vbe::services {

namespace {

const std::string kMatchOdds = "match odds";
const std::string kCorrectScore = "correct score";

std::vector<std::string> strip_words(const std::vector<std::string>& tokens,
                                     const std::set<std::string>& words) {
    std::vector<std::string> kept;
    kept.reserve(tokens.size());
    for (const auto& token : tokens) {
        if (words.count(token) == 0) kept.push_back(token);
    }
    return kept;
}

void append_unique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

std::vector<std::string> remove_alias_tokens(const std::vector<std::string>& tokens,
                                             const std::string& normalized_alias) {
    std::vector<std::string> alias_tokens = text::split_tokens(normalized_alias);

    std::vector<std::string> normalized;
    normalized.reserve(tokens.size());
    for (const auto& token : tokens) {
        normalized.push_back(text::normalize(token));
    }

    int start = text::find_sequence(normalized, alias_tokens);
    if (start >= 0) {
        std::vector<std::string> out(tokens.begin(), tokens.begin() + start);
        out.insert(out.end(), tokens.begin() + start + static_cast<long>(alias_tokens.size()), tokens.end());
        return out;
    }

    // Not contiguous: drop each alias token once, wherever it is
    std::vector<std::string> remaining = alias_tokens;
    std::vector<std::string> out;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        auto it = std::find(remaining.begin(), remaining.end(), normalized[i]);
        if (it != remaining.end()) {
            remaining.erase(it);
        } else {
            out.push_back(tokens[i]);
        }
    }
    return out;
}

} // namespace

BetParser::BetParser(vbe::repositories::IEntityDirectory& directory,
                     const vbe::config::ParserSettings& settings,
                     EntityClassifier* classifier)
    : directory_(directory)
    , settings_(settings)
    , classifier_(classifier) {}

ParsedBet BetParser::parse(const std::string& input) {
    std::string text = text::fully_normalize(input);

    ParsedBet bet;
    for (int pass = 1; pass <= kMaxPasses; ++pass) {
        uint64_t version = directory_.version();
        bet = parse_once(text);
        if (directory_.version() == version) break;
        if (pass < kMaxPasses) {
            std::cerr << "[parser] Directory changed while classifying, re-parsing '"
                      << text << "'" << std::endl;
        }
    }

    if (bet.empty()) {
        std::cerr << "[parser] No teams or markets identified. Check input or configuration."
                  << std::endl;
    }
    return bet;
}

ParsedBet BetParser::parse_once(const std::string& text) {
    refresh();

    auto matches = find_teams(text, team_aliases_);

    std::string leftover = text;
    for (const auto& match : matches) {
        leftover = text::remove_whole_word(leftover, match.matched_text);
    }
    auto tokens = strip_words(text::split_tokens(leftover), settings_.sport_keywords);

    auto extraction = extract_markets(text::join_tokens(tokens), market_candidates_, settings_);

    ParsedBet bet;
    bet.markets = std::move(extraction.markets);
    std::vector<std::string> remaining = std::move(extraction.leftover);

    for (const auto& match : matches) {
        if (directory_.teams().count(match.canonical) > 0 || classifier_ == nullptr) {
            bet.teams.push_back(match.canonical);
        } else {
            bet.teams.push_back(classifier_->resolve_team(match.canonical));
        }
    }

    // "<team> to win" without a named market means the match result
    if (bet.markets.empty() && !bet.teams.empty() &&
        std::find(remaining.begin(), remaining.end(), "win") != remaining.end()) {
        bet.markets.push_back(kMatchOdds);
        remaining = strip_words(remaining, {"win", "to"});
    }

    bet.scores = ScoreLine::find_all(text::join_tokens(remaining));
    if (!bet.scores.empty()) {
        for (const auto& score : bet.scores) {
            auto it = std::find(remaining.begin(), remaining.end(), score.to_token());
            if (it != remaining.end()) remaining.erase(it);
        }
        append_unique(bet.markets, kCorrectScore);
    }

    if (!remaining.empty()) {
        bet.unrecognized.push_back(text::join_tokens(remaining));
    }
    return bet;
}

std::vector<TeamMatch> BetParser::find_teams(const std::string& text, const AliasDirectory& teams) {
    std::vector<std::string> tokens;
    for (const auto& raw : text::split_tokens(text)) {
        tokens.push_back(text::clean_token(raw));
    }

    struct Found {
        std::size_t start;
        TeamMatch match;
    };
    std::vector<Found> found;
    std::vector<bool> used(tokens.size(), false);

    for (std::size_t length = tokens.size(); length > 0; --length) {
        std::size_t i = 0;
        while (i + length <= tokens.size()) {
            bool overlaps = std::any_of(used.begin() + static_cast<long>(i),
                                        used.begin() + static_cast<long>(i + length),
                                        [](bool u) { return u; });
            if (overlaps) {
                ++i;
                continue;
            }

            std::vector<std::string> span(tokens.begin() + static_cast<long>(i),
                                          tokens.begin() + static_cast<long>(i + length));
            std::string candidate = text::join_tokens(span);
            if (auto canonical = teams.canonical_of(text::normalize(candidate))) {
                found.push_back({i, {*canonical, candidate}});
                std::fill(used.begin() + static_cast<long>(i),
                          used.begin() + static_cast<long>(i + length), true);
                i += length;
            } else {
                ++i;
            }
        }
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const Found& a, const Found& b) { return a.start < b.start; });

    std::vector<TeamMatch> matches;
    matches.reserve(found.size());
    for (auto& f : found) {
        matches.push_back(std::move(f.match));
    }
    return matches;
}

MarketExtraction BetParser::extract_markets(const std::string& leftover,
                                            const std::vector<MarketCandidate>& candidates,
                                            const vbe::config::ParserSettings& settings) {
    MarketExtraction result;
    std::vector<std::string> tokens = text::split_tokens(leftover);
    const std::size_t max_iterations = tokens.size();

    while (result.iterations < max_iterations) {
        tokens = strip_words(tokens, settings.filler_words);
        if (tokens.empty()) break;

        std::string current = text::join_tokens(tokens);
        if (current.size() < 2) break;

        const MarketCandidate* best = nullptr;
        double best_score = 0.0;
        for (const auto& candidate : candidates) {
            double score = text::ratio(current, candidate.normalized_alias);
            if (score > best_score) {
                best_score = score;
                best = &candidate;
            }
        }
        ++result.iterations;

        if (best == nullptr || best_score < settings.fuzzy_threshold) break;

        append_unique(result.markets, best->canonical);
        tokens = remove_alias_tokens(tokens, best->normalized_alias);

        if (text::join_tokens(tokens) == current) break;
    }

    result.leftover = strip_words(tokens, settings.filler_words);
    return result;
}

std::vector<MarketCandidate> BetParser::market_candidates(
    const std::map<std::string, Market>& markets) {
    std::vector<MarketCandidate> candidates;
    for (const auto& [name, market] : markets) {
        std::vector<std::string> aliases = market.aliases;
        if (std::find(aliases.begin(), aliases.end(), name) == aliases.end()) {
            aliases.push_back(name);
        }
        for (const auto& alias : aliases) {
            std::string normalized = text::normalize(alias);
            if (normalized.empty()) continue;
            candidates.push_back({name, alias, normalized});
        }
    }
    return candidates;
}

const AliasDirectory& BetParser::team_aliases() {
    refresh();
    return team_aliases_;
}

const std::vector<MarketCandidate>& BetParser::market_candidates() {
    refresh();
    return market_candidates_;
}

void BetParser::refresh() {
    if (cached_version_ && *cached_version_ == directory_.version()) return;

    team_aliases_ = AliasDirectory::from_teams(directory_.teams(), settings_.alias_conflict_policy);
    if (directory_.markets().empty()) {
        std::cerr << "[parser] No market data provided, markets cannot be identified" << std::endl;
    }
    market_candidates_ = market_candidates(directory_.markets());
    cached_version_ = directory_.version();
}

} // namespace vbe::services
