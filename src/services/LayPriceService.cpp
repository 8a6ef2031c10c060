#include "services/LayPriceService.hpp"

#include "domain/text/Normalization.hpp"
#include "services/MarketSelector.hpp"
#include "services/PriceAggregator.hpp"

#include <algorithm>
#include <iostream>

using namespace vbe::domain;

namespace vbe::services {

LayPriceService::LayPriceService(IMarketDataProvider& provider, const MarketTypeMapper& mapper)
    : provider_(provider)
    , mapper_(mapper) {}

std::vector<std::string> LayPriceService::market_types_for(const EventSummary& event,
                                                           const std::string& team,
                                                           const std::string& market_name,
                                                           const std::string& sport) const {
    if (text::to_lower(text::trim(market_name)) == "to win to nil") {
        return MarketSelector::resolve_win_to_nil_types(event.name, team);
    }
    return mapper_.map(market_name, sport);
}

std::optional<Price> LayPriceService::price_for_event(const EventSummary& event,
                                                      const std::string& team,
                                                      const std::string& market_name,
                                                      const std::string& sport,
                                                      const std::vector<ScoreLine>& scores) const {
    auto types = market_types_for(event, team, market_name, sport);

    auto catalogues = provider_.list_market_catalogue(event.id, types);
    auto market = MarketSelector::pick_best_market(catalogues);
    if (!market) {
        std::cerr << "[evaluate] No suitable market found for '" << market_name
                  << "' in event " << event.name << std::endl;
        return std::nullopt;
    }
    std::cout << "Selected Market: '" << market->name << "' (ID=" << market->market_id << ")" << std::endl;

    if (market->runners.empty()) {
        std::cerr << "[evaluate] Market " << market->market_id << " has no runners" << std::endl;
        return std::nullopt;
    }

    bool correct_score = std::find(types.begin(), types.end(), "CORRECT_SCORE") != types.end();
    if (correct_score && !scores.empty()) {
        return PriceAggregator::price_correct_scores(provider_, *market, scores,
                                                     MarketSelector::team_is_home(event.name, team));
    }

    auto runner = MarketSelector::pick_best_runner(market->runners, team, types, market_name, event.name);
    if (!runner) {
        std::cerr << "[evaluate] No runner matches team '" << team << "' in market '"
                  << market_name << "'" << std::endl;
        return std::nullopt;
    }
    std::cout << "Selected Runner: '" << runner->name << "' (SelectionId=" << runner->selection_id
              << ")" << std::endl;

    auto price = provider_.best_lay_price(market->market_id, runner->selection_id);
    if (price) {
        std::cout << "Best Lay Price: " << price->value() << std::endl;
    } else {
        std::cerr << "[evaluate] No lay price for runner " << runner->selection_id << std::endl;
    }
    return price;
}

} // namespace vbe::services
