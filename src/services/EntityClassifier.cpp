#include "services/EntityClassifier.hpp"

#include "domain/text/Normalization.hpp"
#include "domain/text/Similarity.hpp"

#include <algorithm>
#include <iostream>
#include <type_traits>

using namespace vbe::domain;

namespace vbe::services {

namespace {

template <typename Entity>
void collect_names(const std::map<std::string, Entity>& entities, std::vector<std::string>& out) {
    for (const auto& [name, entity] : entities) {
        out.push_back(name);
    }
    for (const auto& [name, entity] : entities) {
        for (const auto& alias : entity.aliases) {
            std::string lowered = text::to_lower(text::trim(alias));
            if (!lowered.empty() && std::find(out.begin(), out.end(), lowered) == out.end()) {
                out.push_back(lowered);
            }
        }
    }
}

} // namespace

std::vector<std::string> closest_aliases(const vbe::repositories::IEntityDirectory& directory,
                                         const std::string& token, EntityKind kind) {
    std::vector<std::string> choices;
    switch (kind) {
        case EntityKind::TEAM: collect_names(directory.teams(), choices); break;
        case EntityKind::MARKET: collect_names(directory.markets(), choices); break;
        case EntityKind::PLAYER: collect_names(directory.players(), choices); break;
    }
    return text::closest_matches(text::to_lower(text::trim(token)), choices, 5, 0.6);
}

EntityClassifier::EntityClassifier(vbe::repositories::IEntityDirectory& directory,
                                   IClassificationStrategy& strategy,
                                   int max_attempts)
    : directory_(directory)
    , strategy_(strategy)
    , max_attempts_(std::max(1, max_attempts)) {}

ClassificationOutcome EntityClassifier::classify(const std::string& token) {
    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        auto result = strategy_.classify(token, directory_);
        if (auto outcome = apply(token, result)) {
            return *outcome;
        }
    }
    std::cerr << "[parser] No usable classification for '" << token << "' after "
              << max_attempts_ << " attempts, leaving it unresolved" << std::endl;
    return {};
}

std::string EntityClassifier::resolve_team(const std::string& alias) {
    auto outcome = classify(alias);
    if (outcome.kind == EntityKind::TEAM && outcome.canonical) {
        return *outcome.canonical;
    }
    if (auto known = directory_.find_team_by_alias(alias)) {
        return *known;
    }
    return text::to_lower(text::trim(alias));
}

bool EntityClassifier::review_unrecognized(const std::vector<std::string>& segments) {
    if (segments.empty()) return false;
    bool changed = false;
    for (const auto& substring : strategy_.review_unrecognized(segments)) {
        if (text::trim(substring).empty()) continue;
        if (classify(substring).directory_changed) changed = true;
    }
    return changed;
}

std::vector<std::string> EntityClassifier::closest_aliases(const std::string& token,
                                                           EntityKind kind) const {
    return vbe::services::closest_aliases(directory_, token, kind);
}

std::optional<ClassificationOutcome> EntityClassifier::apply(const std::string& token,
                                                             const ClassificationResult& result) {
    return std::visit([&](const auto& decision) -> std::optional<ClassificationOutcome> {
        using T = std::decay_t<decltype(decision)>;

        if constexpr (std::is_same_v<T, IgnoreEntity>) {
            return ClassificationOutcome{};
        } else if constexpr (std::is_same_v<T, InvalidChoice>) {
            std::cerr << "[parser] Invalid classification for '" << token << "': "
                      << decision.reason << std::endl;
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, ExistingEntity>) {
            auto canonical = find_canonical(decision.kind, decision.canonical);
            if (!canonical) {
                std::cerr << "[parser] No " << to_string(decision.kind) << " named '"
                          << decision.canonical << "'" << std::endl;
                return std::nullopt;
            }
            bool changed = directory_.add_alias(decision.kind, *canonical, token);
            if (changed) {
                std::cout << "Added '" << token << "' as an alias to existing "
                          << to_string(decision.kind) << " '" << *canonical << "'." << std::endl;
            }
            return ClassificationOutcome{decision.kind, *canonical, changed};
        } else {
            std::string name = text::to_lower(text::trim(decision.canonical));
            if (name.empty()) {
                return std::nullopt;
            }

            std::vector<std::string> aliases;
            for (const auto& alias : decision.aliases) {
                std::string lowered = text::to_lower(text::trim(alias));
                if (!lowered.empty()) aliases.push_back(lowered);
            }
            std::string lowered_token = text::to_lower(text::trim(token));
            if (lowered_token != name &&
                std::find(aliases.begin(), aliases.end(), lowered_token) == aliases.end()) {
                aliases.push_back(lowered_token);
            }

            bool added = false;
            switch (decision.kind) {
                case EntityKind::TEAM:
                    added = directory_.add_team(name, decision.sport, aliases);
                    break;
                case EntityKind::MARKET:
                    added = directory_.add_market(name, decision.sport, decision.type_codes, aliases);
                    break;
                case EntityKind::PLAYER:
                    added = directory_.add_player(name, decision.sport, decision.team, aliases);
                    break;
            }
            if (added) {
                std::cout << "New " << to_string(decision.kind) << " '" << name << "' added." << std::endl;
                return ClassificationOutcome{decision.kind, name, true};
            }

            // Already present: treat the token as one more alias of it
            bool changed = directory_.add_alias(decision.kind, name, token);
            return ClassificationOutcome{decision.kind, name, changed};
        }
    }, result);
}

std::optional<std::string> EntityClassifier::find_canonical(EntityKind kind,
                                                            const std::string& name) const {
    switch (kind) {
        case EntityKind::TEAM: return directory_.find_team_by_alias(name);
        case EntityKind::MARKET: return directory_.find_market_by_alias(name);
        case EntityKind::PLAYER: {
            std::string needle = text::to_lower(text::trim(name));
            for (const auto& [player, info] : directory_.players()) {
                if (player == needle) return player;
                for (const auto& alias : info.aliases) {
                    if (text::to_lower(alias) == needle) return player;
                }
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace vbe::services
