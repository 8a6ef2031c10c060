#include "domain/text/Normalization.hpp"

#include <gtest/gtest.h>

using namespace vbe::domain::text;

TEST(Normalization, NormalizeStripsApostrophesAndCase) {
    EXPECT_EQ(normalize("  O'Neill's "), "oneills");
}

TEST(Normalization, NormalizeStripsRightSingleQuote) {
    EXPECT_EQ(normalize("Newell\xE2\x80\x99s Old Boys"), "newells old boys");
}

TEST(Normalization, NormalizeKeepsHyphens) {
    EXPECT_EQ(normalize("Saint-Etienne"), "saint-etienne");
}

TEST(Normalization, FullyNormalizeSpellsOutAmpersand) {
    EXPECT_EQ(fully_normalize("Arsenal & Chelsea"), "arsenal and chelsea");
}

TEST(Normalization, FullyNormalizeDropsPunctuation) {
    EXPECT_EQ(fully_normalize("Man Utd, BTTS!  over 2.5   goals"), "man utd btts over 2.5 goals");
}

TEST(Normalization, FullyNormalizeKeepsScoresAndAccents) {
    EXPECT_EQ(fully_normalize("Vitória 2-1"), "vitória 2-1");
}

TEST(Normalization, FullyNormalizeIsIdempotent) {
    std::string once = fully_normalize("Real Madrid & Barça (20:00) win!!");
    EXPECT_EQ(fully_normalize(once), once);
}

TEST(Normalization, CleanTokenStripsEdges) {
    EXPECT_EQ(clean_token("(chelsea),"), "chelsea");
    EXPECT_EQ(clean_token("..."), "");
    EXPECT_EQ(clean_token("2-1"), "2-1");
}

TEST(Normalization, SplitAndJoinTokens) {
    auto tokens = split_tokens("  a  b\tc ");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(join_tokens(tokens), "a b c");
}

TEST(Normalization, FindSequence) {
    std::vector<std::string> hay = {"both", "teams", "to", "score"};
    EXPECT_EQ(find_sequence(hay, {"to", "score"}), 2);
    EXPECT_EQ(find_sequence(hay, {"score", "to"}), -1);
    EXPECT_EQ(find_sequence(hay, {}), 0);
}

TEST(Normalization, RemoveWholeWordRespectsBoundaries) {
    EXPECT_EQ(remove_whole_word("chelsea v chelseas", "chelsea"), " v chelseas");
    EXPECT_EQ(remove_whole_word("Real Madrid win", "real madrid"), " win");
    EXPECT_EQ(remove_whole_word("everton", "ever"), "everton");
}

TEST(Normalization, FullyNormalizeDropsTypographicQuotes) {
    // “match odds”…
    EXPECT_EQ(fully_normalize("Chelsea \xE2\x80\x9Cmatch odds\xE2\x80\x9D\xE2\x80\xA6"),
              "chelsea match odds");
}

TEST(Normalization, FullyNormalizeTurnsDashesIntoHyphens) {
    // en dash, em dash
    EXPECT_EQ(fully_normalize("Chelsea \xE2\x80\x93 Arsenal \xE2\x80\x94 btts"),
              "chelsea - arsenal - btts");
    EXPECT_EQ(fully_normalize("2\xE2\x80\x93" "1"), "2-1");
}

TEST(Normalization, FullyNormalizeSplitsOnUnicodeSpaces) {
    // no-break space, thin space
    EXPECT_EQ(fully_normalize("man\xC2\xA0utd\xE2\x80\x89v chelsea"), "man utd v chelsea");
}

TEST(Normalization, FullyNormalizeDropsLatin1PunctuationKeepsLetters) {
    // ¿Quién? ¡Barça! €5
    EXPECT_EQ(fully_normalize("\xC2\xBFQui\xC3\xA9n? \xC2\xA1" "Bar\xC3\xA7" "a! \xE2\x82\xAC" "5"),
              "qui\xC3\xA9n bar\xC3\xA7" "a 5");
}

TEST(Normalization, SplitAndTrimUnicodeSpaces) {
    EXPECT_EQ(split_tokens("a\xC2\xA0" "b\xE2\x80\x83" "c").size(), 3u);
    EXPECT_EQ(trim("\xC2\xA0 chelsea\xE2\x80\xAF"), "chelsea");
    EXPECT_EQ(trim("\xC2\xA0"), "");
}

TEST(Normalization, CleanTokenStripsTypographicPunctuation) {
    EXPECT_EQ(clean_token("\xE2\x80\x9C" "chelsea\xE2\x80\x9D"), "chelsea");
    EXPECT_EQ(clean_token("\xE2\x80\x93"), "");
    EXPECT_EQ(clean_token("(vit\xC3\xB3ria)"), "vit\xC3\xB3ria");
}

TEST(Normalization, WordCodePoints) {
    EXPECT_TRUE(is_word_code_point(U'\u00E9'));
    EXPECT_TRUE(is_word_code_point(U'\u00AA'));
    EXPECT_FALSE(is_word_code_point(U'\u00AB'));
    EXPECT_FALSE(is_word_code_point(U'\u2013'));
    EXPECT_FALSE(is_word_code_point(U'\u00A0'));
    EXPECT_TRUE(is_space_code_point(U'\u00A0'));
    EXPECT_TRUE(is_space_code_point(U'\u2009'));
    EXPECT_FALSE(is_space_code_point(U'\u2013'));
}

TEST(Normalization, RemoveWholeWordUsesCodePointBoundaries) {
    EXPECT_EQ(remove_whole_word("chelsea\xE2\x80\x94" "chelseas", "chelsea"), "\xE2\x80\x94" "chelseas");
    EXPECT_EQ(remove_whole_word("atl\xC3\xA9tico", "atl"), "atl\xC3\xA9tico");
}
