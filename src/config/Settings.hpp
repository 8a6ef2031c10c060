#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace vbe::config {

enum class AliasConflictPolicy { LAST_WINS, FIRST_WINS };

struct ParserSettings {
    int fuzzy_threshold = 80;
    std::set<std::string> filler_words = {"and", "or", "the", "a", "an", "v"};
    std::set<std::string> sport_keywords = {"nfl", "nba", "nhl", "football", "soccer"};
    int max_classification_attempts = 3;
    AliasConflictPolicy alias_conflict_policy = AliasConflictPolicy::LAST_WINS;
};

struct SportSettings {
    std::string primary_sport = "football";
    std::map<std::string, std::string> event_type_ids = {
        {"football", "1"},
        {"nba", "7522"},
        {"nfl", "6423"},
        {"nhl", "7524"},
    };
    std::map<std::string, std::vector<std::string>> market_name_to_types = {
        {"match odds", {"MATCH_ODDS"}},
    };
    std::map<std::string, std::string> default_markets = {
        {"football", "match odds"},
        {"nba", "moneyline_nba"},
        {"nfl", "moneyline_nfl"},
        {"nhl", "moneyline_nhl"},
    };
    std::string primary_fallback_type = "MATCH_ODDS";
    std::string generic_fallback_type = "MONEY_LINE";

    const std::string& event_type_id_for(const std::string& sport) const;
    const std::string& default_market_for(const std::string& sport) const;
};

struct ExchangeSettings {
    std::string betting_url = "https://api.betfair.com/exchange/betting/json-rpc/v1";
    std::string app_key;
    std::string session_token;
    int connect_timeout_seconds = 10;
    int transfer_timeout_seconds = 30;
    int max_results = 100;
};

struct StorageSettings {
    std::string backend = "memory";         // "memory" or "json"
    std::string data_directory = "data";
    std::string ledger_backend = "memory";  // "memory" or "parquet"
    std::string ledger_file = "saved_bets.parquet";
};

struct Settings {
    ParserSettings parser;
    SportSettings sports;
    ExchangeSettings exchange;
    StorageSettings storage;

    static Settings from_environment();
    static Settings from_file(const std::string& path, Settings base = Settings{});
    static Settings development();
    static Settings production();
};

} // namespace vbe::config
