#pragma once

#include "domain/entities/EntityKind.hpp"
#include "repositories/IEntityDirectory.hpp"
#include "services/IClassificationStrategy.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vbe::services {

struct ClassificationOutcome {
    std::optional<vbe::domain::EntityKind> kind;
    std::optional<std::string> canonical;  // empty when the token was ignored
    bool directory_changed = false;
};

// Canonical names and aliases of the given kind closest to token: at most
// five, similarity >= 0.6, best first.
std::vector<std::string> closest_aliases(const vbe::repositories::IEntityDirectory& directory,
                                         const std::string& token,
                                         vbe::domain::EntityKind kind);

// Applies a strategy's decisions to the directory. The strategy only decides;
// every mutation happens here.
class EntityClassifier {
public:
    EntityClassifier(vbe::repositories::IEntityDirectory& directory,
                     IClassificationStrategy& strategy,
                     int max_attempts = 3);

    // Ask the strategy until it gives a usable answer or attempts run out.
    ClassificationOutcome classify(const std::string& token);

    // Canonical team for an alias the recognizer could not resolve. Falls
    // back to the lower-cased alias when the token stays unclassified.
    std::string resolve_team(const std::string& alias);

    // Lets the strategy pick substrings of unrecognized fragments and
    // classifies each. Returns true when the directory changed.
    bool review_unrecognized(const std::vector<std::string>& segments);

    std::vector<std::string> closest_aliases(const std::string& token,
                                             vbe::domain::EntityKind kind) const;

private:
    std::optional<ClassificationOutcome> apply(const std::string& token,
                                               const ClassificationResult& result);
    std::optional<std::string> find_canonical(vbe::domain::EntityKind kind,
                                              const std::string& name) const;

    vbe::repositories::IEntityDirectory& directory_;
    IClassificationStrategy& strategy_;
    int max_attempts_;
};

} // namespace vbe::services
