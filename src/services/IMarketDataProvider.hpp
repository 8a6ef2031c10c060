#pragma once

#include "domain/exchange/EventSummary.hpp"
#include "domain/exchange/MarketCatalogue.hpp"
#include "domain/value_objects/Price.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vbe::services {

class IMarketDataProvider {
public:
    virtual std::vector<vbe::domain::EventSummary> find_events(const std::string& team_query,
                                                               const std::string& sport_id) = 0;
    virtual std::vector<vbe::domain::MarketCatalogue> list_market_catalogue(
        const std::string& event_id, const std::vector<std::string>& type_codes) = 0;
    virtual std::optional<vbe::domain::Price> best_lay_price(const std::string& market_id,
                                                             int64_t selection_id) = 0;

    virtual ~IMarketDataProvider() = default;
};

} // namespace vbe::services
