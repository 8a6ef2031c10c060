#pragma once

#include "domain/exchange/EventSummary.hpp"
#include "domain/exchange/MarketCatalogue.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vbe::services {

// Scoring heuristics that pick the event, market and runner a team's bet
// refers to.
class MarketSelector {
public:
    // 300 for an exact (case-insensitive) match, up to 250 when the side
    // starts with the team name, similarity ratio otherwise.
    static double score_team_in_name(const std::string& side, const std::string& team);

    // Best side score when the name splits on " v ", " vs " or " @ " into
    // exactly two sides, whole-name score otherwise.
    static double score_event(const std::string& event_name, const std::string& team);

    // Highest score wins, earlier kickoff breaks ties. None when nothing
    // scores at least 1.
    static std::optional<vbe::domain::EventSummary> pick_best_event(
        const std::vector<vbe::domain::EventSummary>& events, const std::string& team);

    static std::optional<vbe::domain::MarketCatalogue> pick_best_market(
        const std::vector<vbe::domain::MarketCatalogue>& catalogues);

    static std::optional<vbe::domain::RunnerDescription> pick_best_runner(
        const std::vector<vbe::domain::RunnerDescription>& runners,
        const std::string& team,
        const std::vector<std::string>& market_types,
        const std::string& market_name,
        const std::string& event_name);

    // Home unless the "Home v Away" split says the team is the away side.
    static bool team_is_home(const std::string& event_name, const std::string& team);

    static std::vector<std::string> resolve_win_to_nil_types(const std::string& event_name,
                                                             const std::string& team);
};

} // namespace vbe::services
