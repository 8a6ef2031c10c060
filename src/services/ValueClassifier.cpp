#include "services/ValueClassifier.hpp"

using vbe::domain::ValueDecision;

namespace vbe::services {

ValueDecision ValueClassifier::classify(double price, double odds) {
    if (price < kValueFactor * odds) return ValueDecision::VALUE;
    if (price <= kTwoPercentFactor * odds) return ValueDecision::TWO_PERCENT;
    return ValueDecision::NOT_VALUE;
}

} // namespace vbe::services
