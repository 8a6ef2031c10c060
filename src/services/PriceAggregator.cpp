#include "services/PriceAggregator.hpp"

#include "domain/text/Normalization.hpp"

#include <cmath>
#include <iostream>

using namespace vbe::domain;

namespace vbe::services {

namespace {

// Keeps 1 / (1/2 + 1/3) == 1.2000000000000002 at 1.2 instead of 1.3
constexpr double kCeilingTolerance = 1e-9;

} // namespace

std::optional<Price> PriceAggregator::combine_prices(const std::vector<Price>& prices) {
    if (prices.empty()) return std::nullopt;

    double total_probability = 0.0;
    for (const auto& price : prices) {
        total_probability += price.implied_probability();
    }
    double combined = 1.0 / total_probability;
    return Price(std::ceil(combined * 10.0 - kCeilingTolerance) / 10.0);
}

std::optional<Price> PriceAggregator::price_correct_scores(IMarketDataProvider& provider,
                                                           const MarketCatalogue& market,
                                                           const std::vector<ScoreLine>& scores,
                                                           bool team_is_home) {
    std::vector<Price> prices;
    for (const auto& score : scores) {
        ScoreLine oriented = team_is_home ? score : score.reversed();
        std::string runner_name = oriented.to_runner_name();

        const RunnerDescription* runner = nullptr;
        for (const auto& candidate : market.runners) {
            if (text::to_lower(text::trim(candidate.name)) == runner_name) {
                runner = &candidate;
                break;
            }
        }
        if (runner == nullptr) {
            std::cerr << "[evaluate] No runner for score '" << runner_name
                      << "' in market " << market.market_id << std::endl;
            continue;
        }

        auto price = provider.best_lay_price(market.market_id, runner->selection_id);
        if (!price) {
            std::cerr << "[evaluate] No lay price for " << runner_name << std::endl;
            continue;
        }
        std::cout << "Best Lay Price for " << runner_name << ": " << price->value() << std::endl;
        prices.push_back(*price);
    }
    return combine_prices(prices);
}

} // namespace vbe::services
