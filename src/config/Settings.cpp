#include "config/Settings.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace vbe::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        return fallback;
    }
}

} // namespace

const std::string& SportSettings::event_type_id_for(const std::string& sport) const {
    auto it = event_type_ids.find(sport);
    if (it != event_type_ids.end()) return it->second;
    return event_type_ids.at(primary_sport);
}

const std::string& SportSettings::default_market_for(const std::string& sport) const {
    auto it = default_markets.find(sport);
    if (it != default_markets.end()) return it->second;
    return default_markets.at(primary_sport);
}

Settings Settings::from_environment() {
    std::string env = env_or("VBE_ENV", "development");
    Settings s = (env == "production") ? production() : development();

    std::string config_path = env_or("VBE_CONFIG_PATH", "");
    if (!config_path.empty()) {
        s = from_file(config_path, s);
    }

    s.parser.fuzzy_threshold = env_int_or("VBE_FUZZY_THRESHOLD", s.parser.fuzzy_threshold);
    s.parser.max_classification_attempts =
        env_int_or("VBE_MAX_CLASSIFICATION_ATTEMPTS", s.parser.max_classification_attempts);
    s.exchange.betting_url = env_or("VBE_BETFAIR_URL", s.exchange.betting_url);
    s.exchange.app_key = env_or("VBE_APP_KEY", s.exchange.app_key);
    s.exchange.session_token = env_or("VBE_SESSION_TOKEN", s.exchange.session_token);
    s.exchange.connect_timeout_seconds =
        env_int_or("VBE_CONNECT_TIMEOUT", s.exchange.connect_timeout_seconds);
    s.exchange.transfer_timeout_seconds =
        env_int_or("VBE_TRANSFER_TIMEOUT", s.exchange.transfer_timeout_seconds);
    s.storage.backend = env_or("VBE_STORAGE_BACKEND", s.storage.backend);
    s.storage.data_directory = env_or("VBE_DATA_DIRECTORY", s.storage.data_directory);
    s.storage.ledger_backend = env_or("VBE_LEDGER_BACKEND", s.storage.ledger_backend);
    s.storage.ledger_file = env_or("VBE_LEDGER_FILE", s.storage.ledger_file);
    return s;
}

Settings Settings::from_file(const std::string& path, Settings base) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Configuration file not found at: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto json = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw std::runtime_error("Configuration file is not a JSON object: " + path);
    }

    Settings s = std::move(base);
    if (json.contains("fuzzy_threshold") && json["fuzzy_threshold"].is_number()) {
        s.parser.fuzzy_threshold = json["fuzzy_threshold"].get<int>();
    }
    if (json.contains("common_filler_words") && json["common_filler_words"].is_array()) {
        s.parser.filler_words.clear();
        for (const auto& word : json["common_filler_words"]) {
            if (word.is_string()) s.parser.filler_words.insert(word.get<std::string>());
        }
    }
    if (json.contains("sport_keywords") && json["sport_keywords"].is_array()) {
        s.parser.sport_keywords.clear();
        for (const auto& word : json["sport_keywords"]) {
            if (word.is_string()) s.parser.sport_keywords.insert(word.get<std::string>());
        }
    }
    if (json.contains("alias_conflict_policy") && json["alias_conflict_policy"].is_string()) {
        s.parser.alias_conflict_policy = json["alias_conflict_policy"] == "first_wins"
            ? AliasConflictPolicy::FIRST_WINS
            : AliasConflictPolicy::LAST_WINS;
    }
    if (json.contains("sport_event_type_ids") && json["sport_event_type_ids"].is_object()) {
        for (const auto& [sport, id] : json["sport_event_type_ids"].items()) {
            if (id.is_string()) s.sports.event_type_ids[sport] = id.get<std::string>();
        }
    }
    if (json.contains("market_name_to_types") && json["market_name_to_types"].is_object()) {
        for (const auto& [name, types] : json["market_name_to_types"].items()) {
            if (!types.is_array()) continue;
            std::vector<std::string> codes;
            for (const auto& code : types) {
                if (code.is_string()) codes.push_back(code.get<std::string>());
            }
            s.sports.market_name_to_types[name] = std::move(codes);
        }
    }
    if (json.contains("default_markets") && json["default_markets"].is_object()) {
        for (const auto& [sport, market] : json["default_markets"].items()) {
            if (market.is_string()) s.sports.default_markets[sport] = market.get<std::string>();
        }
    }
    if (json.contains("data_path") && json["data_path"].is_string()) {
        s.storage.data_directory = json["data_path"].get<std::string>();
    }
    return s;
}

Settings Settings::development() {
    Settings s;
    s.storage.backend = "memory";
    s.storage.data_directory = "data/dev";
    return s;
}

Settings Settings::production() {
    Settings s;
    s.storage.backend = "json";
    s.storage.data_directory = "data";
    s.storage.ledger_backend = "parquet";
    return s;
}

} // namespace vbe::config
