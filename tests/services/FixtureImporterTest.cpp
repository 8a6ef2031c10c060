#include "repositories/InMemoryEntityDirectory.hpp"
#include "services/FixtureImporter.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace vbe::services;
using vbe::repositories::InMemoryEntityDirectory;

TEST(FixtureImporter, ParsesVersusAndAtLines) {
    auto fixture = FixtureImporter::parse_fixture_line("  Chelsea v Arsenal ");
    ASSERT_TRUE(fixture.has_value());
    EXPECT_EQ(fixture->home, "Chelsea");
    EXPECT_EQ(fixture->away, "Arsenal");

    auto us = FixtureImporter::parse_fixture_line("Lakers @ Celtics");
    ASSERT_TRUE(us.has_value());
    EXPECT_EQ(us->home, "Lakers");
    EXPECT_EQ(us->away, "Celtics");
}

TEST(FixtureImporter, RejectsAmbiguousLines) {
    EXPECT_FALSE(FixtureImporter::parse_fixture_line("A v B v C").has_value());
    EXPECT_FALSE(FixtureImporter::parse_fixture_line("Matchday 12").has_value());
    EXPECT_FALSE(FixtureImporter::parse_fixture_line("").has_value());
}

TEST(FixtureImporter, CleansTeamNames) {
    EXPECT_EQ(FixtureImporter::clean_team_name("Arsenal (W)"), "Arsenal (W)");
    EXPECT_EQ(FixtureImporter::clean_team_name("Arsenal (Eng)"), "Arsenal");
    EXPECT_EQ(FixtureImporter::clean_team_name(" Real Madrid  12/03 "), "Real Madrid");
    EXPECT_EQ(FixtureImporter::clean_team_name("Porto"), "Porto");
}

TEST(FixtureImporter, ImportsTeamsOnce) {
    InMemoryEntityDirectory directory;
    FixtureImporter importer(directory, "Football");

    std::istringstream in("Chelsea v Arsenal\nround 2\nChelsea v Spurs (Eng)\n");
    auto summary = importer.import_lines(in);

    EXPECT_EQ(summary.fixtures, 2u);
    EXPECT_EQ(summary.teams_added, 3u);
    EXPECT_EQ(summary.aliases_added, 0u);
    EXPECT_EQ(directory.teams().at("spurs").sport, "football");
    EXPECT_EQ(directory.teams().at("chelsea").aliases, std::vector<std::string>{"Chelsea"});
}

TEST(FixtureImporter, KnownTeamGainsSpelling) {
    InMemoryEntityDirectory directory;
    directory.add_team("chelsea", "football");
    FixtureImporter importer(directory, "football");

    ImportSummary summary;
    importer.import_team("Chelsea", summary);
    EXPECT_EQ(summary.teams_added, 0u);
    EXPECT_EQ(summary.aliases_added, 1u);
    EXPECT_EQ(directory.teams().at("chelsea").aliases, std::vector<std::string>{"chelsea"});
}
