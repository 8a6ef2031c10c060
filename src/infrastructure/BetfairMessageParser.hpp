#pragma once

#include "domain/exchange/EventSummary.hpp"
#include "domain/exchange/MarketCatalogue.hpp"
#include "domain/value_objects/Price.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vbe::infrastructure {

// Builds Betfair JSON-RPC request bodies and reads their responses. A
// response carrying "error", a non-array "result" or malformed JSON reads
// as an empty result.
class BetfairMessageParser {
public:
    std::string list_events_request(const std::string& text_query,
                                    const std::string& event_type_id) const;
    std::string list_market_catalogue_request(const std::string& event_id,
                                              const std::vector<std::string>& type_codes,
                                              int max_results) const;
    std::string list_market_book_request(const std::string& market_id) const;

    std::vector<vbe::domain::EventSummary> parse_events(const std::string& body) const;
    std::vector<vbe::domain::MarketCatalogue> parse_market_catalogue(const std::string& body) const;

    // First availableToLay price of the runner, if any.
    std::optional<vbe::domain::Price> parse_best_lay_price(const std::string& body,
                                                           int64_t selection_id) const;
};

} // namespace vbe::infrastructure
