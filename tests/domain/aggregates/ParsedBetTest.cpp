#include "domain/aggregates/ParsedBet.hpp"

#include <gtest/gtest.h>

using namespace vbe::domain;

TEST(ParsedBet, EmptyWithoutTeamsOrMarkets) {
    ParsedBet bet;
    EXPECT_TRUE(bet.empty());
    bet.unrecognized = {"blah"};
    EXPECT_TRUE(bet.empty());
    bet.markets = {"match odds"};
    EXPECT_FALSE(bet.empty());
}

TEST(ParsedBet, HasMarket) {
    ParsedBet bet{{"arsenal"}, {"match odds", "correct score"}, {}, {}};
    EXPECT_TRUE(bet.has_market("correct score"));
    EXPECT_FALSE(bet.has_market("btts"));
}

TEST(ParsedBet, ToStringListsEveryField) {
    ParsedBet bet{{"arsenal", "chelsea"}, {"match odds"}, {}, {"boost"}};
    EXPECT_EQ(bet.to_string(),
              "{'teams': ['arsenal', 'chelsea'], 'markets': ['match odds'], 'unrecognized': ['boost']}");
}

TEST(ParsedBet, ToStringIncludesScoresWhenPresent) {
    ParsedBet bet{{"arsenal"}, {"correct score"}, {ScoreLine(2, 1)}, {}};
    EXPECT_EQ(bet.to_string(),
              "{'teams': ['arsenal'], 'markets': ['correct score'], 'scores': [(2, 1)], 'unrecognized': []}");
}
