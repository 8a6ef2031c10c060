#pragma once

#include "domain/value_objects/ValueDecision.hpp"

namespace vbe::services {

class ValueClassifier {
public:
    static constexpr double kValueFactor = 0.9999;
    static constexpr double kTwoPercentFactor = 1.0199;

    // price is the exchange's (possibly combined) lay price, odds the
    // bookmaker's price for the same bet.
    static vbe::domain::ValueDecision classify(double price, double odds);
};

} // namespace vbe::services
