#pragma once

#include "domain/entities/EntityKind.hpp"
#include "repositories/IEntityDirectory.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vbe::services {

// Token is another spelling of an entity already in the directory.
struct ExistingEntity {
    vbe::domain::EntityKind kind;
    std::string canonical;
};

// Token names an entity the directory does not know yet. When canonical
// differs from the token, the token becomes one of its aliases.
struct NewEntity {
    vbe::domain::EntityKind kind;
    std::string canonical;
    std::string sport;
    std::vector<std::string> aliases;
    std::vector<std::string> type_codes;   // markets only
    std::optional<std::string> team;       // players only
};

struct IgnoreEntity {};

// The decision could not be read; the caller asks again.
struct InvalidChoice {
    std::string reason;
};

using ClassificationResult = std::variant<ExistingEntity, NewEntity, IgnoreEntity, InvalidChoice>;

class IClassificationStrategy {
public:
    virtual ClassificationResult classify(const std::string& token,
                                          const vbe::repositories::IEntityDirectory& directory) = 0;

    // Substrings of the unrecognized fragments worth classifying.
    virtual std::vector<std::string> review_unrecognized(const std::vector<std::string>&) {
        return {};
    }

    virtual ~IClassificationStrategy() = default;
};

} // namespace vbe::services
