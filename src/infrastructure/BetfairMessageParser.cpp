#include "infrastructure/BetfairMessageParser.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>

using json = nlohmann::json;
using namespace vbe::domain;

namespace vbe::infrastructure {

namespace {

constexpr const char* kMethodPrefix = "SportsAPING/v1.0/";

json rpc_request(const std::string& method, json params) {
    json request;
    request["jsonrpc"] = "2.0";
    request["method"] = std::string(kMethodPrefix) + method;
    request["params"] = std::move(params);
    request["id"] = 1;
    return request;
}

// The "result" array of a JSON-RPC response, or an empty array.
json result_array(const std::string& body) {
    auto response = json::parse(body, nullptr, false);
    if (response.is_discarded()) {
        std::cerr << "[exchange] Malformed JSON-RPC response" << std::endl;
        return json::array();
    }
    // Batched calls come back as an array of responses
    if (response.is_array()) {
        if (response.empty()) return json::array();
        response = response[0];
    }
    if (!response.is_object()) return json::array();
    if (response.contains("error")) {
        std::cerr << "[exchange] API error: " << response["error"].dump() << std::endl;
        return json::array();
    }
    if (!response.contains("result") || !response["result"].is_array()) {
        return json::array();
    }
    return response["result"];
}

std::string string_field(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return {};
}

std::string id_string(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    return {};
}

} // anonymous namespace

std::string BetfairMessageParser::list_events_request(const std::string& text_query,
                                                      const std::string& event_type_id) const {
    json params;
    params["filter"]["eventTypeIds"] = json::array({event_type_id});
    params["filter"]["textQuery"] = text_query;
    return rpc_request("listEvents", std::move(params)).dump();
}

std::string BetfairMessageParser::list_market_catalogue_request(
    const std::string& event_id, const std::vector<std::string>& type_codes, int max_results) const {
    json params;
    params["filter"]["eventIds"] = json::array({event_id});
    params["filter"]["marketTypeCodes"] = type_codes;
    params["maxResults"] = max_results;
    params["marketProjection"] = json::array({"RUNNER_DESCRIPTION", "MARKET_START_TIME"});
    return rpc_request("listMarketCatalogue", std::move(params)).dump();
}

std::string BetfairMessageParser::list_market_book_request(const std::string& market_id) const {
    json params;
    params["marketIds"] = json::array({market_id});
    params["priceProjection"]["priceData"] = json::array({"EX_BEST_OFFERS"});
    return rpc_request("listMarketBook", std::move(params)).dump();
}

std::vector<EventSummary> BetfairMessageParser::parse_events(const std::string& body) const {
    std::vector<EventSummary> events;
    for (const auto& item : result_array(body)) {
        if (!item.is_object() || !item.contains("event") || !item["event"].is_object()) continue;
        const auto& event = item["event"];

        std::string id = id_string(event.value("id", json()));
        std::string name = string_field(event, "name");
        std::string open_date = string_field(event, "openDate");
        if (id.empty() || open_date.empty()) continue;

        try {
            events.push_back(EventSummary{id, name, Timestamp::from_iso8601(open_date)});
        } catch (const std::logic_error& e) {
            std::cerr << "[exchange] Skipping event " << id << ": " << e.what() << std::endl;
        }
    }
    return events;
}

std::vector<MarketCatalogue> BetfairMessageParser::parse_market_catalogue(const std::string& body) const {
    std::vector<MarketCatalogue> catalogues;
    for (const auto& item : result_array(body)) {
        if (!item.is_object()) continue;

        MarketCatalogue catalogue;
        catalogue.market_id = id_string(item.value("marketId", json()));
        catalogue.name = string_field(item, "marketName");
        if (catalogue.market_id.empty()) continue;

        if (item.contains("marketStartTime") && item["marketStartTime"].is_string()) {
            try {
                catalogue.start_time = Timestamp::from_iso8601(item["marketStartTime"].get<std::string>());
            } catch (const std::logic_error&) {
                catalogue.start_time = std::nullopt;
            }
        }

        if (item.contains("runners") && item["runners"].is_array()) {
            for (const auto& runner : item["runners"]) {
                if (!runner.is_object() || !runner.contains("selectionId") ||
                    !runner["selectionId"].is_number_integer()) {
                    continue;
                }
                catalogue.runners.push_back(RunnerDescription{
                    runner["selectionId"].get<int64_t>(),
                    string_field(runner, "runnerName"),
                });
            }
        }
        catalogues.push_back(std::move(catalogue));
    }
    return catalogues;
}

std::optional<Price> BetfairMessageParser::parse_best_lay_price(const std::string& body,
                                                                int64_t selection_id) const {
    auto books = result_array(body);
    if (books.empty() || !books[0].is_object()) return std::nullopt;

    const auto& book = books[0];
    if (!book.contains("runners") || !book["runners"].is_array()) return std::nullopt;

    for (const auto& runner : book["runners"]) {
        if (!runner.is_object() || !runner.contains("selectionId") ||
            !runner["selectionId"].is_number_integer() ||
            runner["selectionId"].get<int64_t>() != selection_id) {
            continue;
        }
        if (!runner.contains("ex") || !runner["ex"].is_object()) return std::nullopt;

        const auto& ex = runner["ex"];
        if (!ex.contains("availableToLay") || !ex["availableToLay"].is_array() ||
            ex["availableToLay"].empty()) {
            return std::nullopt;
        }
        const auto& best = ex["availableToLay"][0];
        if (!best.is_object() || !best.contains("price") || !best["price"].is_number()) {
            return std::nullopt;
        }
        double price = best["price"].get<double>();
        if (!(price > 0.0)) return std::nullopt;
        return Price(price);
    }
    return std::nullopt;
}

} // namespace vbe::infrastructure
