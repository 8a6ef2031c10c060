#include "services/MarketSelector.hpp"

#include "domain/text/Normalization.hpp"
#include "domain/text/Similarity.hpp"

#include <algorithm>
#include <functional>
#include <regex>

using namespace vbe::domain;

namespace vbe::services {

namespace {

const std::regex kVersusSeparator(R"(\s+v\s+|\s+vs\s+|\s+@\s+)", std::regex::icase);
const std::regex kHomeAwaySeparator(R"(\sv\s)", std::regex::icase);
const std::regex kOverLine(R"(over\s*([0-9]+\.[0-9]))");

std::vector<std::string> split(const std::string& s, const std::regex& separator) {
    std::vector<std::string> parts;
    auto begin = s.cbegin();
    std::smatch m;
    while (std::regex_search(begin, s.cend(), m, separator)) {
        parts.emplace_back(begin, m[0].first);
        begin = m[0].second;
    }
    parts.emplace_back(begin, s.cend());
    return parts;
}

std::string lower_trim(const std::string& s) {
    return text::to_lower(text::trim(s));
}

bool has_type(const std::vector<std::string>& types, const std::string& code) {
    return std::find(types.begin(), types.end(), code) != types.end();
}

bool any_type(const std::vector<std::string>& types, bool (*pred)(const std::string&)) {
    return std::any_of(types.begin(), types.end(), pred);
}

const RunnerDescription* find_runner(const std::vector<RunnerDescription>& runners,
                                     const std::function<bool(const std::string&)>& pred) {
    for (const auto& runner : runners) {
        if (pred(text::to_lower(runner.name))) return &runner;
    }
    return nullptr;
}

const RunnerDescription* closest_runner(const std::vector<RunnerDescription>& runners,
                                        const std::string& team) {
    const RunnerDescription* best = nullptr;
    double best_score = -1.0;
    for (const auto& runner : runners) {
        double score = text::ratio(team, lower_trim(runner.name));
        if (score > best_score) {
            best_score = score;
            best = &runner;
        }
    }
    return best;
}

std::optional<RunnerDescription> to_optional(const RunnerDescription* runner) {
    if (runner == nullptr) return std::nullopt;
    return *runner;
}

} // namespace

double MarketSelector::score_team_in_name(const std::string& side, const std::string& team) {
    std::string s = lower_trim(side);
    std::string t = lower_trim(team);
    if (s == t) return 300.0;
    if (text::starts_with(s, t)) {
        double diff = static_cast<double>(s.size() - t.size());
        return std::max(1.0, 250.0 - diff * 10.0);
    }
    return text::ratio(t, s);
}

double MarketSelector::score_event(const std::string& event_name, const std::string& team) {
    auto sides = split(event_name, kVersusSeparator);
    if (sides.size() == 2) {
        return std::max(score_team_in_name(sides[0], team), score_team_in_name(sides[1], team));
    }
    return score_team_in_name(event_name, team);
}

std::optional<EventSummary> MarketSelector::pick_best_event(const std::vector<EventSummary>& events,
                                                            const std::string& team) {
    if (events.empty()) return std::nullopt;

    struct Scored {
        double score;
        const EventSummary* event;
    };
    std::vector<Scored> scored;
    scored.reserve(events.size());
    for (const auto& event : events) {
        scored.push_back({score_event(event.name, team), &event});
    }
    std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.event->open_date < b.event->open_date;
    });

    if (scored.front().score < 1.0) return std::nullopt;
    return *scored.front().event;
}

std::optional<MarketCatalogue> MarketSelector::pick_best_market(
    const std::vector<MarketCatalogue>& catalogues) {
    if (catalogues.empty()) return std::nullopt;
    return catalogues.front();
}

std::optional<RunnerDescription> MarketSelector::pick_best_runner(
    const std::vector<RunnerDescription>& runners,
    const std::string& team_name,
    const std::vector<std::string>& market_types,
    const std::string& market_name,
    const std::string& event_name) {
    if (runners.empty()) return std::nullopt;

    const std::string team = lower_trim(team_name);

    std::string home;
    std::string away;
    auto sides = split(event_name, kHomeAwaySeparator);
    if (sides.size() == 2) {
        home = lower_trim(sides[0]);
        away = lower_trim(sides[1]);
    }
    bool is_home = home.empty() || away.empty() ||
                   score_team_in_name(home, team_name) >= score_team_in_name(away, team_name);

    if (has_type(market_types, "HALF_TIME_FULL_TIME")) {
        std::string own = (is_home && !home.empty()) ? home : (!away.empty() ? away : team);
        std::string other = (is_home && !away.empty()) ? away : home;

        std::vector<std::string> candidates = {
            own + "/" + own,
            own + "/draw",
            own + "/" + other,
            "draw/" + own,
            other + "/" + own,
        };
        for (const auto& candidate : candidates) {
            if (candidate.front() == '/' || candidate.back() == '/') continue;
            auto runner = find_runner(runners, [&](const std::string& name) {
                return text::trim(name) == candidate;
            });
            if (runner) return *runner;
        }
    }

    if (has_type(market_types, "MATCH_ODDS")) {
        auto exact = find_runner(runners, [&](const std::string& name) {
            return text::trim(name) == team;
        });
        if (exact) return *exact;
        return to_optional(closest_runner(runners, team));
    }

    if (has_type(market_types, "MATCH_ODDS_AND_BTTS")) {
        const std::string wanted = team + "/yes";
        auto exact = find_runner(runners, [&](const std::string& name) {
            return text::trim(name) == wanted;
        });
        if (exact) return *exact;
        auto partial = find_runner(runners, [&](const std::string& name) {
            return text::contains(name, team) &&
                   (text::contains(name, "yes") || text::contains(name, "over"));
        });
        if (partial) return *partial;
    }

    if (any_type(market_types, [](const std::string& t) {
            return text::starts_with(t, "MATCH_ODDS_AND_OU_");
        })) {
        std::string lowered_market = text::to_lower(market_name);
        std::smatch m;
        if (std::regex_search(lowered_market, m, kOverLine)) {
            const std::string wanted = team + "/over " + m[1].str();
            auto exact = find_runner(runners, [&](const std::string& name) {
                return text::trim(name) == wanted;
            });
            if (exact) return *exact;
        }
        auto partial = find_runner(runners, [&](const std::string& name) {
            return text::contains(name, team) && text::contains(name, "over");
        });
        if (partial) return *partial;
    }

    bool over_market = any_type(market_types, [](const std::string& t) {
        std::string lowered = text::to_lower(t);
        return text::starts_with(t, "OVER_UNDER_") || text::contains(lowered, "cornr") ||
               text::contains(lowered, "first_half_goals");
    });
    if (over_market) {
        auto over = find_runner(runners, [](const std::string& name) {
            return text::contains(name, "over");
        });
        if (over) return *over;
    }

    if (has_type(market_types, "TEAM_A_WIN_TO_NIL") || has_type(market_types, "TEAM_B_WIN_TO_NIL")) {
        auto yes = find_runner(runners, [](const std::string& name) {
            return text::trim(name) == "yes";
        });
        if (yes) return *yes;
    }

    auto fallback = find_runner(runners, [](const std::string& name) {
        return text::contains(name, "yes") || text::contains(name, "over");
    });
    if (fallback) return *fallback;

    return to_optional(closest_runner(runners, team));
}

bool MarketSelector::team_is_home(const std::string& event_name, const std::string& team) {
    auto sides = split(event_name, kHomeAwaySeparator);
    if (sides.size() != 2) return true;
    return score_team_in_name(sides[0], team) >= score_team_in_name(sides[1], team);
}

std::vector<std::string> MarketSelector::resolve_win_to_nil_types(const std::string& event_name,
                                                                  const std::string& team) {
    if (team_is_home(event_name, team)) return {"TEAM_A_WIN_TO_NIL"};
    return {"TEAM_B_WIN_TO_NIL"};
}

} // namespace vbe::services
