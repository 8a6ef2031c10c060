#include "config/Settings.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace vbe::config;

namespace {

void clear_vbe_env() {
    unsetenv("VBE_ENV");
    unsetenv("VBE_CONFIG_PATH");
    unsetenv("VBE_FUZZY_THRESHOLD");
    unsetenv("VBE_MAX_CLASSIFICATION_ATTEMPTS");
    unsetenv("VBE_BETFAIR_URL");
    unsetenv("VBE_APP_KEY");
    unsetenv("VBE_SESSION_TOKEN");
    unsetenv("VBE_CONNECT_TIMEOUT");
    unsetenv("VBE_TRANSFER_TIMEOUT");
    unsetenv("VBE_STORAGE_BACKEND");
    unsetenv("VBE_DATA_DIRECTORY");
    unsetenv("VBE_LEDGER_BACKEND");
    unsetenv("VBE_LEDGER_FILE");
}

std::string write_temp_config(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(Settings, DefaultsAreReasonable) {
    Settings s;
    EXPECT_EQ(s.parser.fuzzy_threshold, 80);
    EXPECT_EQ(s.parser.max_classification_attempts, 3);
    EXPECT_EQ(s.parser.alias_conflict_policy, AliasConflictPolicy::LAST_WINS);
    EXPECT_TRUE(s.parser.filler_words.count("v"));
    EXPECT_TRUE(s.parser.sport_keywords.count("soccer"));
    EXPECT_EQ(s.sports.primary_sport, "football");
    EXPECT_EQ(s.sports.event_type_ids.at("nba"), "7522");
    EXPECT_EQ(s.sports.default_markets.at("nhl"), "moneyline_nhl");
    EXPECT_EQ(s.exchange.connect_timeout_seconds, 10);
    EXPECT_EQ(s.exchange.transfer_timeout_seconds, 30);
    EXPECT_EQ(s.storage.backend, "memory");
    EXPECT_EQ(s.storage.ledger_backend, "memory");
    EXPECT_EQ(s.storage.ledger_file, "saved_bets.parquet");
}

TEST(Settings, EventTypeIdFallsBackToPrimarySport) {
    SportSettings sports;
    EXPECT_EQ(sports.event_type_id_for("nfl"), "6423");
    EXPECT_EQ(sports.event_type_id_for("curling"), "1");
}

TEST(Settings, DefaultMarketFallsBackToPrimarySport) {
    SportSettings sports;
    EXPECT_EQ(sports.default_market_for("nba"), "moneyline_nba");
    EXPECT_EQ(sports.default_market_for("cricket"), "match odds");
}

TEST(Settings, FromEnvironmentDefaultsToDevelopment) {
    clear_vbe_env();

    auto s = Settings::from_environment();
    auto dev = Settings::development();
    EXPECT_EQ(s.storage.backend, dev.storage.backend);
    EXPECT_EQ(s.storage.data_directory, dev.storage.data_directory);
    EXPECT_EQ(s.parser.fuzzy_threshold, dev.parser.fuzzy_threshold);
}

TEST(Settings, FromEnvironmentSelectsProductionPreset) {
    clear_vbe_env();
    setenv("VBE_ENV", "production", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.storage.backend, "json");
    EXPECT_EQ(s.storage.data_directory, "data");
    EXPECT_EQ(s.storage.ledger_backend, "parquet");

    unsetenv("VBE_ENV");
}

TEST(Settings, FromEnvironmentReadsEnvVars) {
    clear_vbe_env();
    setenv("VBE_FUZZY_THRESHOLD", "70", 1);
    setenv("VBE_MAX_CLASSIFICATION_ATTEMPTS", "5", 1);
    setenv("VBE_APP_KEY", "app-key", 1);
    setenv("VBE_SESSION_TOKEN", "session", 1);
    setenv("VBE_STORAGE_BACKEND", "json", 1);
    setenv("VBE_DATA_DIRECTORY", "/tmp/vbe", 1);
    setenv("VBE_LEDGER_FILE", "bets.parquet", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.parser.fuzzy_threshold, 70);
    EXPECT_EQ(s.parser.max_classification_attempts, 5);
    EXPECT_EQ(s.exchange.app_key, "app-key");
    EXPECT_EQ(s.exchange.session_token, "session");
    EXPECT_EQ(s.storage.backend, "json");
    EXPECT_EQ(s.storage.data_directory, "/tmp/vbe");
    EXPECT_EQ(s.storage.ledger_file, "bets.parquet");

    clear_vbe_env();
}

TEST(Settings, FromEnvironmentHandlesInvalidInt) {
    clear_vbe_env();
    setenv("VBE_FUZZY_THRESHOLD", "not_a_number", 1);
    auto s = Settings::from_environment();
    EXPECT_EQ(s.parser.fuzzy_threshold, 80);
    unsetenv("VBE_FUZZY_THRESHOLD");
}

TEST(Settings, FromFileOverridesPreset) {
    std::string path = write_temp_config("vbe_settings_test.json", R"({
        "fuzzy_threshold": 75,
        "common_filler_words": ["and", "the"],
        "alias_conflict_policy": "first_wins",
        "sport_event_type_ids": {"tennis": "2"},
        "market_name_to_types": {"both teams to score": ["BOTH_TEAMS_TO_SCORE"]},
        "data_path": "fixtures"
    })");

    auto s = Settings::from_file(path);
    EXPECT_EQ(s.parser.fuzzy_threshold, 75);
    EXPECT_EQ(s.parser.filler_words.size(), 2u);
    EXPECT_EQ(s.parser.alias_conflict_policy, AliasConflictPolicy::FIRST_WINS);
    EXPECT_EQ(s.sports.event_type_ids.at("tennis"), "2");
    EXPECT_EQ(s.sports.event_type_ids.at("football"), "1");
    EXPECT_EQ(s.sports.market_name_to_types.at("both teams to score").front(), "BOTH_TEAMS_TO_SCORE");
    EXPECT_EQ(s.storage.data_directory, "fixtures");

    std::remove(path.c_str());
}

TEST(Settings, FromFileThrowsOnMissingFile) {
    EXPECT_THROW(Settings::from_file("/nonexistent/vbe/config.json"), std::runtime_error);
}

TEST(Settings, FromFileThrowsOnMalformedJson) {
    std::string path = write_temp_config("vbe_settings_bad.json", "{not json");
    EXPECT_THROW(Settings::from_file(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(Settings, ConfigPathIsAppliedBeforeEnvVars) {
    clear_vbe_env();
    std::string path = write_temp_config("vbe_settings_env.json", R"({"fuzzy_threshold": 60})");
    setenv("VBE_CONFIG_PATH", path.c_str(), 1);

    EXPECT_EQ(Settings::from_environment().parser.fuzzy_threshold, 60);

    setenv("VBE_FUZZY_THRESHOLD", "90", 1);
    EXPECT_EQ(Settings::from_environment().parser.fuzzy_threshold, 90);

    clear_vbe_env();
    std::remove(path.c_str());
}

TEST(Settings, DevelopmentPreset) {
    auto s = Settings::development();
    EXPECT_EQ(s.storage.backend, "memory");
    EXPECT_EQ(s.storage.data_directory, "data/dev");
    EXPECT_EQ(s.storage.ledger_backend, "memory");
}

TEST(Settings, ProductionPreset) {
    auto s = Settings::production();
    EXPECT_EQ(s.storage.backend, "json");
    EXPECT_EQ(s.storage.ledger_backend, "parquet");
}
