#include "domain/entities/SavedBet.hpp"

#include <gtest/gtest.h>

using namespace vbe::domain;

TEST(SavedBet, FormatsValueLine) {
    SavedBet bet{"bet365", "football", "arsenal win", 2.0, 1.85, ValueDecision::VALUE, Timestamp(0)};
    EXPECT_EQ(bet.to_line(), "bet365 - Football - arsenal win - 2.0 / 1.85");
}

TEST(SavedBet, AppendsSuffixForTwoPercent) {
    SavedBet bet{"paddy", "nba", "lakers", 1.9, 1.92, ValueDecision::TWO_PERCENT, Timestamp(0)};
    EXPECT_EQ(bet.to_line(), "paddy - NBA - lakers - 1.9 / 1.92 2pc");
}

TEST(SavedBet, FormatDecimalKeepsOneFractionalDigit) {
    EXPECT_EQ(format_decimal(2.0), "2.0");
    EXPECT_EQ(format_decimal(1.85), "1.85");
    EXPECT_EQ(format_decimal(10.5), "10.5");
}
