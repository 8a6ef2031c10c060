#include "domain/value_objects/Sport.hpp"
#include "domain/value_objects/ValueDecision.hpp"

#include <gtest/gtest.h>

using namespace vbe::domain;

TEST(Sport, InfersLeagueFromMarketName) {
    EXPECT_EQ(infer_sport_from_market("moneyline_nba"), "nba");
    EXPECT_EQ(infer_sport_from_market("Moneyline_NFL"), "nfl");
    EXPECT_EQ(infer_sport_from_market("puck line nhl"), "nhl");
    EXPECT_EQ(infer_sport_from_market("match odds"), "football");
}

TEST(Sport, DisplayNameUppercasesLeagues) {
    EXPECT_EQ(sport_display_name("nba"), "NBA");
    EXPECT_EQ(sport_display_name("NfL"), "NFL");
    EXPECT_EQ(sport_display_name("nhl"), "NHL");
}

TEST(Sport, DisplayNameCapitalizesOthers) {
    EXPECT_EQ(sport_display_name("football"), "Football");
    EXPECT_EQ(sport_display_name("TENNIS"), "Tennis");
    EXPECT_EQ(sport_display_name(""), "");
}

TEST(ValueDecision, RoundTripsThroughString) {
    EXPECT_EQ(to_string(ValueDecision::VALUE), "VALUE");
    EXPECT_EQ(to_string(ValueDecision::TWO_PERCENT), "2PC");
    EXPECT_EQ(to_string(ValueDecision::NOT_VALUE), "NOT VALUE");
    EXPECT_EQ(value_decision_from_string("2PC"), ValueDecision::TWO_PERCENT);
}

TEST(ValueDecision, ThrowsOnUnknownString) {
    EXPECT_THROW(value_decision_from_string("MAYBE"), std::invalid_argument);
}
