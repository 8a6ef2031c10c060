#pragma once

#include "config/Settings.hpp"
#include "domain/aggregates/ParsedBet.hpp"
#include "repositories/IEntityDirectory.hpp"
#include "services/AliasDirectory.hpp"
#include "services/EntityClassifier.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vbe::services {

struct TeamMatch {
    std::string canonical;
    std::string matched_text;

    bool operator==(const TeamMatch&) const = default;
};

// One spelling a market can be recognized by.
struct MarketCandidate {
    std::string canonical;
    std::string alias;
    std::string normalized_alias;
};

struct MarketExtraction {
    std::vector<std::string> markets;
    std::vector<std::string> leftover;   // filler words removed
    std::size_t iterations = 0;
};

// Turns free bet text into teams, markets and correct scores.
//
// Teams are matched greedily against the alias directory (longest span
// first), removed from the text, and whatever remains is reduced against
// market aliases by fuzzy matching, one market per iteration. Alias data is
// rebuilt only when the entity directory's version moves.
class BetParser {
public:
    BetParser(vbe::repositories::IEntityDirectory& directory,
              const vbe::config::ParserSettings& settings,
              EntityClassifier* classifier = nullptr);

    vbe::domain::ParsedBet parse(const std::string& input);

    static std::vector<TeamMatch> find_teams(const std::string& text, const AliasDirectory& teams);

    // Bounded by the token count of leftover: every accepted match has to
    // consume at least one token or the loop stops.
    static MarketExtraction extract_markets(const std::string& leftover,
                                            const std::vector<MarketCandidate>& candidates,
                                            const vbe::config::ParserSettings& settings);

    static std::vector<MarketCandidate> market_candidates(
        const std::map<std::string, vbe::domain::Market>& markets);

    const AliasDirectory& team_aliases();
    const std::vector<MarketCandidate>& market_candidates();

private:
    static constexpr int kMaxPasses = 4;

    void refresh();
    vbe::domain::ParsedBet parse_once(const std::string& text);

    vbe::repositories::IEntityDirectory& directory_;
    const vbe::config::ParserSettings& settings_;
    EntityClassifier* classifier_;

    std::optional<uint64_t> cached_version_;
    AliasDirectory team_aliases_;
    std::vector<MarketCandidate> market_candidates_;
};

} // namespace vbe::services
