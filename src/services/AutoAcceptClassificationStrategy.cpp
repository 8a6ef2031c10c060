#include "services/AutoAcceptClassificationStrategy.hpp"

#include "domain/text/Normalization.hpp"
#include "domain/text/Similarity.hpp"

#include <algorithm>
#include <map>

using namespace vbe::domain;

namespace vbe::services {

namespace {

struct Candidate {
    EntityKind kind = EntityKind::TEAM;
    std::string canonical;
    double score = 0.0;
};

template <typename Entity>
void consider(const std::map<std::string, Entity>& entities, EntityKind kind,
              const std::string& query, Candidate& best) {
    for (const auto& [name, entity] : entities) {
        double score = text::ratio(query, text::normalize(name));
        for (const auto& alias : entity.aliases) {
            score = std::max(score, text::ratio(query, text::normalize(alias)));
        }
        if (score > best.score) {
            best = Candidate{kind, name, score};
        }
    }
}

} // namespace

AutoAcceptClassificationStrategy::AutoAcceptClassificationStrategy(double min_similarity)
    : min_similarity_(min_similarity) {}

ClassificationResult AutoAcceptClassificationStrategy::classify(
    const std::string& token, const vbe::repositories::IEntityDirectory& directory) {
    std::string query = text::normalize(token);
    if (query.empty()) return IgnoreEntity{};

    Candidate best;
    consider(directory.teams(), EntityKind::TEAM, query, best);
    consider(directory.markets(), EntityKind::MARKET, query, best);

    if (best.canonical.empty() || best.score < min_similarity_) {
        return IgnoreEntity{};
    }
    return ExistingEntity{best.kind, best.canonical};
}

} // namespace vbe::services
