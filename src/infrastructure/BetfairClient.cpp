#include "infrastructure/BetfairClient.hpp"

#include <ixwebsocket/IXHttpClient.h>

#include <iostream>

using namespace vbe::domain;

namespace vbe::infrastructure {

BetfairClient::BetfairClient(const config::ExchangeSettings& settings)
    : settings_(settings) {
    if (settings_.app_key.empty() || settings_.session_token.empty()) {
        std::cerr << "[exchange] Application key or session token missing, "
                  << "exchange requests will be rejected" << std::endl;
    }
}

std::vector<EventSummary> BetfairClient::find_events(const std::string& team_query,
                                                     const std::string& sport_id) {
    auto body = post(parser_.list_events_request(team_query, sport_id));
    if (!body) return {};

    auto events = parser_.parse_events(*body);
    if (events.empty()) {
        std::cerr << "[exchange] No events found for team '" << team_query
                  << "' and sport id '" << sport_id << "'" << std::endl;
    }
    return events;
}

std::vector<MarketCatalogue> BetfairClient::list_market_catalogue(
    const std::string& event_id, const std::vector<std::string>& type_codes) {
    auto body = post(parser_.list_market_catalogue_request(event_id, type_codes, settings_.max_results));
    if (!body) return {};
    return parser_.parse_market_catalogue(*body);
}

std::optional<Price> BetfairClient::best_lay_price(const std::string& market_id, int64_t selection_id) {
    auto body = post(parser_.list_market_book_request(market_id));
    if (!body) return std::nullopt;
    return parser_.parse_best_lay_price(*body, selection_id);
}

std::optional<std::string> BetfairClient::post(const std::string& request_body) const {
    ix::HttpClient client;
    auto args = client.createRequest();
    args->connectTimeout = settings_.connect_timeout_seconds;
    args->transferTimeout = settings_.transfer_timeout_seconds;
    args->extraHeaders["X-Application"] = settings_.app_key;
    args->extraHeaders["X-Authentication"] = settings_.session_token;
    args->extraHeaders["Content-Type"] = "application/json";
    args->extraHeaders["Accept"] = "application/json";

    auto response = client.post(settings_.betting_url, request_body, args);
    if (response->statusCode != 200) {
        std::cerr << "[exchange] Request to " << settings_.betting_url << " failed: HTTP "
                  << response->statusCode;
        if (!response->errorMsg.empty()) std::cerr << " (" << response->errorMsg << ")";
        std::cerr << std::endl;
        return std::nullopt;
    }
    return response->body;
}

} // namespace vbe::infrastructure
