#include "repositories/InMemoryEntityDirectory.hpp"

#include "domain/text/Normalization.hpp"

#include <algorithm>
#include <iostream>

using namespace vbe::domain;

namespace vbe::repositories {

namespace {

std::string canonical_form(const std::string& name) {
    return text::to_lower(text::trim(name));
}

bool has_alias(const std::vector<std::string>& aliases, const std::string& lowered) {
    return std::any_of(aliases.begin(), aliases.end(), [&](const std::string& a) {
        return text::to_lower(a) == lowered;
    });
}

template <typename Entity>
std::optional<std::string> find_by_alias(const std::map<std::string, Entity>& entities,
                                         const std::string& alias) {
    std::string needle = canonical_form(alias);
    for (const auto& [name, entity] : entities) {
        if (text::to_lower(name) == needle || has_alias(entity.aliases, needle)) {
            return name;
        }
    }
    return std::nullopt;
}

template <typename Entity>
bool append_alias(std::map<std::string, Entity>& entities, const std::string& canonical,
                  const std::string& alias) {
    auto it = entities.find(canonical);
    if (it == entities.end()) it = entities.find(canonical_form(canonical));
    if (it == entities.end()) return false;
    std::string lowered = canonical_form(alias);
    if (lowered.empty() || has_alias(it->second.aliases, lowered)) return false;
    it->second.aliases.push_back(lowered);
    return true;
}

} // namespace

InMemoryEntityDirectory::InMemoryEntityDirectory(std::map<std::string, Team> teams,
                                                 std::map<std::string, Market> markets,
                                                 std::map<std::string, Player> players)
    : teams_(std::move(teams))
    , markets_(std::move(markets))
    , players_(std::move(players)) {}

std::optional<std::string> InMemoryEntityDirectory::find_team_by_alias(const std::string& alias) const {
    return find_by_alias(teams_, alias);
}

std::optional<std::string> InMemoryEntityDirectory::find_market_by_alias(const std::string& alias) const {
    return find_by_alias(markets_, alias);
}

bool InMemoryEntityDirectory::add_team(const std::string& name, const std::string& sport,
                                       std::vector<std::string> aliases) {
    std::string key = canonical_form(name);
    if (key.empty() || teams_.count(key) > 0) return false;
    if (sport.empty()) {
        std::cerr << "[directory] No sport specified for team '" << key << "'" << std::endl;
    }
    teams_.emplace(key, Team{key, canonical_form(sport), std::move(aliases), {}});
    mutated();
    return true;
}

bool InMemoryEntityDirectory::add_market(const std::string& name, const std::string& sport,
                                         std::vector<std::string> type_codes,
                                         std::vector<std::string> aliases) {
    std::string key = canonical_form(name);
    if (key.empty() || markets_.count(key) > 0) return false;
    if (sport.empty()) {
        std::cerr << "[directory] No sport specified for market '" << key << "'" << std::endl;
    }
    if (type_codes.empty()) {
        std::cerr << "[directory] No market type specified for '" << key << "'" << std::endl;
    }
    if (!has_alias(aliases, key)) {
        aliases.push_back(key);
    }
    markets_.emplace(key, Market{key, canonical_form(sport), std::move(aliases),
                                 std::move(type_codes), "User-added market"});
    mutated();
    return true;
}

bool InMemoryEntityDirectory::add_player(const std::string& name, const std::string& sport,
                                         const std::optional<std::string>& team,
                                         std::vector<std::string> aliases) {
    std::string key = canonical_form(name);
    if (key.empty() || players_.count(key) > 0) return false;

    std::optional<std::string> team_key;
    if (team && !text::trim(*team).empty()) {
        team_key = canonical_form(*team);
    }
    players_.emplace(key, Player{key, canonical_form(sport), team_key, std::move(aliases)});

    if (team_key) {
        auto it = teams_.find(*team_key);
        if (it != teams_.end() &&
            std::find(it->second.players.begin(), it->second.players.end(), key) == it->second.players.end()) {
            it->second.players.push_back(key);
        }
    }
    mutated();
    return true;
}

bool InMemoryEntityDirectory::add_alias(EntityKind kind, const std::string& canonical,
                                        const std::string& alias) {
    bool added = false;
    switch (kind) {
        case EntityKind::TEAM: added = append_alias(teams_, canonical, alias); break;
        case EntityKind::MARKET: added = append_alias(markets_, canonical, alias); break;
        case EntityKind::PLAYER: added = append_alias(players_, canonical, alias); break;
    }
    if (added) mutated();
    return added;
}

void InMemoryEntityDirectory::reset(std::map<std::string, Team> teams,
                                    std::map<std::string, Market> markets,
                                    std::map<std::string, Player> players) {
    teams_ = std::move(teams);
    markets_ = std::move(markets);
    players_ = std::move(players);
}

void InMemoryEntityDirectory::mutated() {
    ++version_;
    on_mutation();
}

} // namespace vbe::repositories
