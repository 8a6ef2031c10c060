#pragma once

#include "services/IClassificationStrategy.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace vbe::infrastructure {

// Asks the person at the console what an unknown token is:
// (T)eam, (P)layer, (M)arket or (I)gnore, then offers close matches,
// a manual canonical name, or a brand new entity.
class ConsoleClassificationStrategy : public vbe::services::IClassificationStrategy {
public:
    ConsoleClassificationStrategy(std::istream& in, std::ostream& out);

    vbe::services::ClassificationResult classify(
        const std::string& token, const vbe::repositories::IEntityDirectory& directory) override;

    // (S)elect substring / (I)gnore remainder / (D)one / (Q)uit
    std::vector<std::string> review_unrecognized(const std::vector<std::string>& segments) override;

private:
    vbe::services::ClassificationResult classify_entity(
        const std::string& token, vbe::domain::EntityKind kind,
        const vbe::repositories::IEntityDirectory& directory);
    vbe::services::ClassificationResult new_entity(const std::string& name, const std::string& token,
                                                   vbe::domain::EntityKind kind);

    std::string ask(const std::string& prompt);
    std::vector<std::string> ask_list(const std::string& prompt);

    std::istream& in_;
    std::ostream& out_;
};

} // namespace vbe::infrastructure
