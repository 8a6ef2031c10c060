#pragma once

#include "services/IClassificationStrategy.hpp"

namespace vbe::services {

// Non-interactive strategy: accepts the closest known team or market when it
// is similar enough, ignores the token otherwise.
class AutoAcceptClassificationStrategy : public IClassificationStrategy {
public:
    explicit AutoAcceptClassificationStrategy(double min_similarity = 90.0);

    ClassificationResult classify(const std::string& token,
                                  const vbe::repositories::IEntityDirectory& directory) override;

private:
    double min_similarity_;
};

} // namespace vbe::services
