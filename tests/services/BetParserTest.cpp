#include "domain/text/Normalization.hpp"
#include "repositories/InMemoryEntityDirectory.hpp"
#include "services/BetParser.hpp"
#include "services/EntityClassifier.hpp"
#include "support/ScriptedClassificationStrategy.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace vbe::domain;
using namespace vbe::services;
using vbe::config::ParserSettings;
using vbe::repositories::InMemoryEntityDirectory;

class BetParserTest : public ::testing::Test {
protected:
    InMemoryEntityDirectory directory;
    ParserSettings settings;

    void SetUp() override {
        directory.add_team("manchester united", "football", {"man utd"});
        directory.add_team("chelsea", "football");
        directory.add_team("real madrid", "football");
        directory.add_team("madrid", "football");
        directory.add_market("match odds", "football", {"MATCH_ODDS"}, {"full time result"});
        directory.add_market("both teams to score", "football", {"BOTH_TEAMS_TO_SCORE"}, {"btts"});
        directory.add_market("over 2.5 goals", "football", {"OVER_UNDER_25"}, {"over 2.5"});
        directory.add_market("correct score", "football", {"CORRECT_SCORE"});
    }
};

TEST_F(BetParserTest, RecognizesTeamsAndMarket) {
    BetParser parser(directory, settings);
    auto bet = parser.parse("manchester united v chelsea match odds");

    EXPECT_EQ(bet.teams, (std::vector<std::string>{"manchester united", "chelsea"}));
    EXPECT_EQ(bet.markets, std::vector<std::string>{"match odds"});
    EXPECT_TRUE(bet.unrecognized.empty());
}

TEST_F(BetParserTest, PrefersLongestTeamSpan) {
    BetParser parser(directory, settings);
    auto bet = parser.parse("real madrid win");

    EXPECT_EQ(bet.teams, std::vector<std::string>{"real madrid"});
    EXPECT_EQ(bet.markets, std::vector<std::string>{"match odds"});
    EXPECT_TRUE(bet.unrecognized.empty());
}

TEST_F(BetParserTest, FindTeamsOrdersByPosition) {
    BetParser parser(directory, settings);
    auto matches = BetParser::find_teams("chelsea v man utd", parser.team_aliases());

    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0], (TeamMatch{"chelsea", "chelsea"}));
    EXPECT_EQ(matches[1], (TeamMatch{"manchester united", "man utd"}));
}

TEST_F(BetParserTest, TeamRecognitionIsIdempotent) {
    BetParser parser(directory, settings);
    const std::string text = "real madrid v man utd btts";
    EXPECT_EQ(BetParser::find_teams(text, parser.team_aliases()),
              BetParser::find_teams(text, parser.team_aliases()));
    EXPECT_EQ(parser.parse(text), parser.parse(text));
}

TEST_F(BetParserTest, ExtractsSeveralMarkets) {
    BetParser parser(directory, settings);
    auto bet = parser.parse("chelsea btts & over 2.5 goals");

    EXPECT_EQ(bet.teams, std::vector<std::string>{"chelsea"});
    EXPECT_EQ(bet.markets, (std::vector<std::string>{"over 2.5 goals", "both teams to score"}));
    EXPECT_TRUE(bet.unrecognized.empty());
}

TEST_F(BetParserTest, DetectsCorrectScores) {
    BetParser parser(directory, settings);
    auto bet = parser.parse("chelsea 2-1 or 3-1");

    EXPECT_EQ(bet.markets, std::vector<std::string>{"correct score"});
    EXPECT_EQ(bet.scores, (std::vector<ScoreLine>{ScoreLine(2, 1), ScoreLine(3, 1)}));
    EXPECT_TRUE(bet.unrecognized.empty());
}

TEST_F(BetParserTest, QuotedMarketIsRecognized) {
    BetParser parser(directory, settings);
    auto bet = parser.parse("Chelsea \xE2\x80\x9Cmatch odds\xE2\x80\x9D");

    EXPECT_EQ(bet.teams, std::vector<std::string>{"chelsea"});
    EXPECT_EQ(bet.markets, std::vector<std::string>{"match odds"});
    EXPECT_TRUE(bet.unrecognized.empty());
}

TEST_F(BetParserTest, EnDashDoesNotHideMarket) {
    BetParser parser(directory, settings);
    auto bet = parser.parse("Chelsea \xE2\x80\x93 match odds");

    EXPECT_EQ(bet.teams, std::vector<std::string>{"chelsea"});
    EXPECT_EQ(bet.markets, std::vector<std::string>{"match odds"});
}

TEST_F(BetParserTest, NoBreakSpaceSeparatesTeamWords) {
    BetParser parser(directory, settings);
    auto bet = parser.parse("man\xC2\xA0utd v chelsea");

    EXPECT_EQ(bet.teams, (std::vector<std::string>{"manchester united", "chelsea"}));
    EXPECT_TRUE(bet.unrecognized.empty());
}

TEST_F(BetParserTest, RemovesSportKeywords) {
    BetParser parser(directory, settings);
    auto bet = parser.parse("chelsea football win");

    EXPECT_EQ(bet.markets, std::vector<std::string>{"match odds"});
    EXPECT_TRUE(bet.unrecognized.empty());
}

TEST_F(BetParserTest, KeepsUnrecognizedRemainder) {
    BetParser parser(directory, settings);
    auto bet = parser.parse("chelsea price boost");

    EXPECT_EQ(bet.teams, std::vector<std::string>{"chelsea"});
    EXPECT_TRUE(bet.markets.empty());
    EXPECT_EQ(bet.unrecognized, std::vector<std::string>{"price boost"});
}

TEST_F(BetParserTest, NothingRecognizedInEmptyDirectory) {
    InMemoryEntityDirectory empty;
    BetParser parser(empty, settings);
    auto bet = parser.parse("arsenal win");

    EXPECT_TRUE(bet.empty());
    EXPECT_EQ(bet.unrecognized, std::vector<std::string>{"arsenal win"});
}

TEST_F(BetParserTest, RebuildsAliasesAfterMutation) {
    BetParser parser(directory, settings);
    EXPECT_TRUE(parser.parse("arsenal win").teams.empty());

    directory.add_team("arsenal", "football");
    EXPECT_EQ(parser.parse("arsenal win").teams, std::vector<std::string>{"arsenal"});
    EXPECT_TRUE(parser.team_aliases().canonical_of("arsenal").has_value());
}

TEST_F(BetParserTest, MarketCandidatesIncludeCanonicalNames) {
    auto candidates = BetParser::market_candidates(directory.markets());
    auto has = [&](const std::string& alias) {
        return std::any_of(candidates.begin(), candidates.end(),
                           [&](const MarketCandidate& c) { return c.normalized_alias == alias; });
    };
    EXPECT_TRUE(has("btts"));
    EXPECT_TRUE(has("both teams to score"));
    EXPECT_TRUE(has("full time result"));
    EXPECT_TRUE(has("correct score"));
}

TEST_F(BetParserTest, MarketLoopStopsAtFixedPoint) {
    BetParser parser(directory, settings);
    const auto& candidates = parser.market_candidates();

    ParserSettings greedy = settings;
    greedy.fuzzy_threshold = 0;
    ParserSettings strict = settings;
    strict.fuzzy_threshold = 100;

    const std::vector<std::string> inputs = {
        "",
        "x",
        "btts btts btts btts",
        "over over over 2.5 2.5 goals goals",
        "score score score correct correct",
        "match match odds odds result time full",
        "a an the or and v",
        "zzz qqq www eee rrr ttt yyy",
        "both teams to score over 2.5 goals full time result correct score",
    };
    for (const auto& input : inputs) {
        for (const auto* s : {&settings, &greedy, &strict}) {
            auto first = BetParser::extract_markets(input, candidates, *s);
            // A loop that stopped on its own has nothing left to consume.
            auto again = BetParser::extract_markets(vbe::domain::text::join_tokens(first.leftover),
                                                    candidates, *s);
            EXPECT_EQ(again.leftover, first.leftover) << input;
            for (const auto& market : again.markets) {
                EXPECT_NE(std::find(first.markets.begin(), first.markets.end(), market),
                          first.markets.end())
                    << input << ": " << market;
            }
        }
    }
}

TEST_F(BetParserTest, MarketLoopStopsWhenMatchConsumesNothing) {
    std::vector<MarketCandidate> candidates = {{"match odds", "match odds", "match odds"}};
    ParserSettings loose = settings;
    loose.fuzzy_threshold = 10;

    auto extraction = BetParser::extract_markets("match oddz", candidates, loose);
    EXPECT_EQ(extraction.markets, std::vector<std::string>{"match odds"});
    EXPECT_EQ(extraction.iterations, 2u);
    EXPECT_EQ(extraction.leftover, std::vector<std::string>{"oddz"});
}

TEST_F(BetParserTest, KnownTeamsDoNotReachClassifier) {
    vbe::testing::ScriptedClassificationStrategy strategy;
    EntityClassifier classifier(directory, strategy);
    BetParser parser(directory, settings, &classifier);

    auto bet = parser.parse("chelsea win");
    EXPECT_EQ(bet.teams, std::vector<std::string>{"chelsea"});
    EXPECT_TRUE(strategy.asked.empty());
}
