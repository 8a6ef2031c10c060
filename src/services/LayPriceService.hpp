#pragma once

#include "domain/exchange/EventSummary.hpp"
#include "domain/value_objects/Price.hpp"
#include "domain/value_objects/ScoreLine.hpp"
#include "services/IMarketDataProvider.hpp"
#include "services/MarketTypeMapper.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vbe::services {

class LayPriceService {
public:
    LayPriceService(IMarketDataProvider& provider, const MarketTypeMapper& mapper);

    // Best lay price for the team's outcome of market_name in an already
    // chosen event. Correct-score markets with scores combine every score.
    std::optional<vbe::domain::Price> price_for_event(
        const vbe::domain::EventSummary& event,
        const std::string& team,
        const std::string& market_name,
        const std::string& sport,
        const std::vector<vbe::domain::ScoreLine>& scores = {}) const;

    std::vector<std::string> market_types_for(const vbe::domain::EventSummary& event,
                                              const std::string& team,
                                              const std::string& market_name,
                                              const std::string& sport) const;

private:
    IMarketDataProvider& provider_;
    const MarketTypeMapper& mapper_;
};

} // namespace vbe::services
