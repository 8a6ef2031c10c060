#pragma once

#include "config/Settings.hpp"
#include "infrastructure/BetfairMessageParser.hpp"
#include "services/IMarketDataProvider.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vbe::infrastructure {

// Market data from the Betfair Exchange betting API (JSON-RPC over HTTPS).
// Requests are authenticated with the configured application key and an
// existing session token.
class BetfairClient : public vbe::services::IMarketDataProvider {
public:
    explicit BetfairClient(const config::ExchangeSettings& settings);

    std::vector<vbe::domain::EventSummary> find_events(const std::string& team_query,
                                                       const std::string& sport_id) override;
    std::vector<vbe::domain::MarketCatalogue> list_market_catalogue(
        const std::string& event_id, const std::vector<std::string>& type_codes) override;
    std::optional<vbe::domain::Price> best_lay_price(const std::string& market_id,
                                                     int64_t selection_id) override;

protected:
    // Response body of a JSON-RPC call, nullopt on transport failure or non-200.
    virtual std::optional<std::string> post(const std::string& request_body) const;

private:
    config::ExchangeSettings settings_;
    BetfairMessageParser parser_;
};

} // namespace vbe::infrastructure
