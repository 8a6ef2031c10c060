#include "services/BetEvaluationService.hpp"

#include "services/MarketSelector.hpp"
#include "services/ValueClassifier.hpp"

#include <cmath>
#include <iostream>
#include <set>

using namespace vbe::domain;

namespace vbe::services {

BetEvaluationService::BetEvaluationService(const vbe::repositories::IEntityDirectory& directory,
                                           IMarketDataProvider& provider,
                                           const LayPriceService& lay_prices,
                                           const vbe::config::SportSettings& sports)
    : directory_(directory)
    , provider_(provider)
    , lay_prices_(lay_prices)
    , sports_(sports) {}

std::string BetEvaluationService::sport_of_team(const std::string& team) const {
    auto it = directory_.teams().find(team);
    if (it == directory_.teams().end() || it->second.sport.empty()) {
        return sports_.primary_sport;
    }
    return it->second.sport;
}

std::vector<std::string> BetEvaluationService::compatible_markets(const std::vector<std::string>& markets,
                                                                  const std::string& sport) const {
    std::vector<std::string> compatible;
    for (const auto& market : markets) {
        auto it = directory_.markets().find(market);
        if (it != directory_.markets().end() && it->second.sport == sport) {
            compatible.push_back(market);
        }
    }
    if (compatible.empty()) {
        compatible.push_back(sports_.default_market_for(sport));
    }
    return compatible;
}

std::string BetEvaluationService::bet_sport(const ParsedBet& bet) const {
    std::set<std::string> sports;
    for (const auto& team : bet.teams) {
        sports.insert(sport_of_team(team));
    }
    if (sports.size() == 1) return *sports.begin();
    return sports_.primary_sport;
}

double BetEvaluationService::display_price(double combined) {
    double three = std::round(combined * 1000.0) / 1000.0;
    return std::round(three * 100.0) / 100.0;
}

std::optional<BetEvaluation> BetEvaluationService::evaluate(const ParsedBet& bet, double odds) const {
    std::set<std::string> priced_events;
    BetEvaluation evaluation;

    for (const auto& team : bet.teams) {
        const std::string sport = sport_of_team(team);
        auto markets = compatible_markets(bet.markets, sport);

        auto events = provider_.find_events(team, sports_.event_type_id_for(sport));
        auto event = MarketSelector::pick_best_event(events, team);
        if (!event) {
            std::cerr << "[evaluate] No suitable event found for team '" << team
                      << "'. Stopping further processing." << std::endl;
            return std::nullopt;
        }

        if (!priced_events.insert(event->id).second) {
            std::cerr << "[evaluate] Skipping duplicate match for event " << event->id << std::endl;
            continue;
        }
        std::cout << "Selected Event: '" << event->name << "' (ID=" << event->id
                  << ", Start=" << event->open_date.to_iso8601() << ")" << std::endl;

        std::optional<Price> price;
        for (const auto& market : markets) {
            price = lay_prices_.price_for_event(*event, team, market, sport, bet.scores);
            if (price) break;
        }
        if (!price) {
            std::cerr << "[evaluate] Could not find a suitable lay price for " << team << "/"
                      << markets.front() << ". Stopping further processing." << std::endl;
            return std::nullopt;
        }
        evaluation.lay_prices.push_back(*price);
    }

    if (evaluation.lay_prices.empty()) {
        std::cerr << "[evaluate] No lay prices found or no valid bets parsed" << std::endl;
        return std::nullopt;
    }

    double product = 1.0;
    for (const auto& price : evaluation.lay_prices) {
        product *= price.value();
    }
    evaluation.combined_price = product;
    evaluation.display_price = display_price(product);
    evaluation.decision = ValueClassifier::classify(product, odds);
    return evaluation;
}

} // namespace vbe::services
