#pragma once

#include "repositories/IEntityDirectory.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <string>

namespace vbe::services {

struct Fixture {
    std::string home;
    std::string away;
};

struct ImportSummary {
    std::size_t fixtures = 0;
    std::size_t teams_added = 0;
    std::size_t aliases_added = 0;
};

// Seeds the team directory from historical fixture listings, one
// "Home v Away" (or "Home @ Away") per line.
class FixtureImporter {
public:
    FixtureImporter(vbe::repositories::IEntityDirectory& directory, std::string sport);

    static std::optional<Fixture> parse_fixture_line(const std::string& line);

    // Keeps a trailing "(W)"; otherwise drops anything from the first "("
    // or run of two spaces.
    static std::string clean_team_name(const std::string& name);

    ImportSummary import_lines(std::istream& in);
    void import_team(const std::string& raw_name, ImportSummary& summary);

private:
    vbe::repositories::IEntityDirectory& directory_;
    std::string sport_;
};

} // namespace vbe::services
