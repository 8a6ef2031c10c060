#pragma once

#include "domain/exchange/MarketCatalogue.hpp"
#include "domain/value_objects/Price.hpp"
#include "domain/value_objects/ScoreLine.hpp"
#include "services/IMarketDataProvider.hpp"

#include <optional>
#include <vector>

namespace vbe::services {

class PriceAggregator {
public:
    // 1 / sum(1 / p), rounded up to the next 0.1. None for no prices.
    static std::optional<vbe::domain::Price> combine_prices(
        const std::vector<vbe::domain::Price>& prices);

    // Lays every requested score in a correct-score market and combines the
    // prices found. Scores are given from the team's point of view and are
    // flipped when the team plays away. Scores without a runner or a price
    // are skipped.
    static std::optional<vbe::domain::Price> price_correct_scores(
        IMarketDataProvider& provider,
        const vbe::domain::MarketCatalogue& market,
        const std::vector<vbe::domain::ScoreLine>& scores,
        bool team_is_home);
};

} // namespace vbe::services
