#include "services/BetLineParser.hpp"

#include <gtest/gtest.h>

using namespace vbe::services;

TEST(BetLineParser, SplitsExplicitLine) {
    auto line = BetLineParser::parse_bet_line("Bet365 - football - Chelsea to win - 2.5");

    EXPECT_EQ(line.bookmaker, "Bet365");
    EXPECT_EQ(line.sport, "football");
    EXPECT_EQ(line.bet_text, "Chelsea to win");
    ASSERT_TRUE(line.odds.has_value());
    EXPECT_DOUBLE_EQ(*line.odds, 2.5);
    EXPECT_TRUE(line.explicit_format);
}

TEST(BetLineParser, InvalidOddsKeepOtherFields) {
    auto line = BetLineParser::parse_bet_line("Bet365 - football - Chelsea - evens");

    EXPECT_EQ(line.bookmaker, "Bet365");
    EXPECT_EQ(line.sport, "football");
    EXPECT_EQ(line.bet_text, "Chelsea");
    EXPECT_FALSE(line.odds.has_value());
    EXPECT_FALSE(line.explicit_format);
}

TEST(BetLineParser, OtherSeparatorCountsAreTheWholeBet) {
    auto line = BetLineParser::parse_bet_line("Chelsea - Arsenal btts");
    EXPECT_FALSE(line.bookmaker.has_value());
    EXPECT_FALSE(line.sport.has_value());
    EXPECT_EQ(line.bet_text, "Chelsea - Arsenal btts");
    EXPECT_FALSE(line.odds.has_value());

    auto tight = BetLineParser::parse_bet_line("a-b-c-2.0");
    EXPECT_EQ(tight.bet_text, "a-b-c-2.0");
    EXPECT_FALSE(tight.explicit_format);
}

TEST(BetLineParser, ParseOddsAcceptsPositiveDecimalsOnly) {
    EXPECT_DOUBLE_EQ(*BetLineParser::parse_odds("2.5"), 2.5);
    EXPECT_DOUBLE_EQ(*BetLineParser::parse_odds(" 3 "), 3.0);
    EXPECT_FALSE(BetLineParser::parse_odds("").has_value());
    EXPECT_FALSE(BetLineParser::parse_odds("0").has_value());
    EXPECT_FALSE(BetLineParser::parse_odds("-1.5").has_value());
    EXPECT_FALSE(BetLineParser::parse_odds("2.5x").has_value());
    EXPECT_FALSE(BetLineParser::parse_odds("inf").has_value());
    EXPECT_FALSE(BetLineParser::parse_odds("nan").has_value());
}

TEST(BetLineParser, PreprocessLowersAndDropsSeparators) {
    EXPECT_EQ(BetLineParser::preprocess_input("Chelsea,  Arsenal & Spurs "), "chelsea arsenal spurs");
    EXPECT_EQ(BetLineParser::preprocess_input(""), "");
}

TEST(BetLineParser, ParseMultipleMatchesPicksSide) {
    const std::string input = "Ajax v Lazio (20:00), Rangers v Tottenham (19:45) & Roma v Porto";

    EXPECT_EQ(BetLineParser::parse_multiple_matches(input),
              (std::vector<std::string>{"Ajax", "Rangers", "Roma"}));
    EXPECT_EQ(BetLineParser::parse_multiple_matches(input, MatchSide::AWAY),
              (std::vector<std::string>{"Lazio", "Tottenham", "Porto"}));
    EXPECT_TRUE(BetLineParser::parse_multiple_matches("btts, over 2.5").empty());
}

TEST(BetLineParser, SimplifyKeepsHomeTeamsAndLeftover) {
    EXPECT_EQ(BetLineParser::simplify_multiple_matches("Ajax v Lazio, Rangers v Tottenham, btts"),
              "ajax rangers btts");
    EXPECT_EQ(BetLineParser::simplify_multiple_matches("Ajax v Lazio & Rangers v Tottenham"),
              "ajax rangers");
    EXPECT_EQ(BetLineParser::simplify_multiple_matches("Ajax v Lazio (20:00), Rangers v Tottenham (19:45)"),
              "ajax rangers");
}

TEST(BetLineParser, DetectsMultipleMatches) {
    EXPECT_TRUE(BetLineParser::has_multiple_matches("Ajax v Lazio, Rangers V Tottenham"));
    EXPECT_FALSE(BetLineParser::has_multiple_matches("Ajax v Lazio btts"));
    EXPECT_FALSE(BetLineParser::has_multiple_matches("Valencia vs Villarreal, Lyon vs Nice"));
}

TEST(BetLineParser, MatchSideDefaultsToHome) {
    EXPECT_EQ(match_side_from_string("away"), MatchSide::AWAY);
    EXPECT_EQ(match_side_from_string(" HOME "), MatchSide::HOME);
    EXPECT_EQ(match_side_from_string("both"), MatchSide::HOME);
}
