#include "services/AliasDirectory.hpp"

#include "domain/text/Normalization.hpp"

#include <iostream>

using vbe::config::AliasConflictPolicy;
using namespace vbe::domain;

namespace vbe::services {

AliasDirectory AliasDirectory::build(const std::vector<AliasSource>& sources,
                                     AliasConflictPolicy policy) {
    AliasDirectory directory;

    // Canonical keys first, so aliases can never shadow a canonical name
    for (const auto& source : sources) {
        directory.insert(text::normalize(source.canonical), source.canonical, true, policy);
    }
    for (const auto& source : sources) {
        for (const auto& alias : source.aliases) {
            if (text::trim(alias).empty()) continue;
            directory.insert(text::normalize(alias), source.canonical, false, policy);
        }
    }

    for (const auto& conflict : directory.conflicts_) {
        std::cerr << "[directory] Alias '" << conflict.alias << "' claimed by '"
                  << conflict.kept << "' and '" << conflict.discarded << "', using '"
                  << conflict.kept << "'" << std::endl;
    }
    return directory;
}

AliasDirectory AliasDirectory::from_teams(const std::map<std::string, Team>& teams,
                                          AliasConflictPolicy policy) {
    if (teams.empty()) {
        std::cerr << "[directory] No team data provided, team alias map is empty" << std::endl;
    }
    std::vector<AliasSource> sources;
    sources.reserve(teams.size());
    for (const auto& [name, team] : teams) {
        sources.push_back({name, team.aliases});
    }
    return build(sources, policy);
}

AliasDirectory AliasDirectory::from_markets(const std::map<std::string, Market>& markets,
                                            AliasConflictPolicy policy) {
    if (markets.empty()) {
        std::cerr << "[directory] No market data provided, market alias map is empty" << std::endl;
    }
    std::vector<AliasSource> sources;
    sources.reserve(markets.size());
    for (const auto& [name, market] : markets) {
        sources.push_back({name, market.aliases});
    }
    return build(sources, policy);
}

std::optional<std::string> AliasDirectory::canonical_of(const std::string& normalized_alias) const {
    auto it = entries_.find(normalized_alias);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void AliasDirectory::insert(const std::string& key, const std::string& canonical,
                            bool is_canonical_key, AliasConflictPolicy policy) {
    if (key.empty()) return;

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        entries_.emplace(key, canonical);
        canonical_keys_[key] = is_canonical_key;
        return;
    }
    if (it->second == canonical) return;

    // An alias never displaces a canonical key; like-for-like clashes follow the policy
    bool replace = canonical_keys_[key] == is_canonical_key &&
                   policy == AliasConflictPolicy::LAST_WINS;

    if (replace) {
        conflicts_.push_back({key, canonical, it->second});
        it->second = canonical;
        canonical_keys_[key] = is_canonical_key;
    } else {
        conflicts_.push_back({key, it->second, canonical});
    }
}

} // namespace vbe::services
