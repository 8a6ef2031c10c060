#pragma once

#include "config/Settings.hpp"
#include "domain/aggregates/ParsedBet.hpp"
#include "domain/value_objects/Price.hpp"
#include "domain/value_objects/ValueDecision.hpp"
#include "repositories/IEntityDirectory.hpp"
#include "services/IMarketDataProvider.hpp"
#include "services/LayPriceService.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vbe::services {

struct BetEvaluation {
    std::vector<vbe::domain::Price> lay_prices;
    double combined_price = 0.0;   // product of lay_prices
    double display_price = 0.0;    // combined_price rounded to 3, then 2 decimals
    vbe::domain::ValueDecision decision = vbe::domain::ValueDecision::NOT_VALUE;
};

class BetEvaluationService {
public:
    BetEvaluationService(const vbe::repositories::IEntityDirectory& directory,
                         IMarketDataProvider& provider,
                         const LayPriceService& lay_prices,
                         const vbe::config::SportSettings& sports);

    // Prices every recognized team in order and classifies the product
    // against odds. Any team without an event or a price abandons the whole
    // bet; a team whose event was already priced is skipped.
    std::optional<BetEvaluation> evaluate(const vbe::domain::ParsedBet& bet, double odds) const;

    std::string sport_of_team(const std::string& team) const;

    // Recognized markets of the team's sport, else the sport's default market.
    std::vector<std::string> compatible_markets(const std::vector<std::string>& markets,
                                                const std::string& sport) const;

    // Single sport shared by every team, primary sport otherwise.
    std::string bet_sport(const vbe::domain::ParsedBet& bet) const;

    static double display_price(double combined);

private:
    const vbe::repositories::IEntityDirectory& directory_;
    IMarketDataProvider& provider_;
    const LayPriceService& lay_prices_;
    const vbe::config::SportSettings& sports_;
};

} // namespace vbe::services
