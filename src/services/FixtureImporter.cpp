#include "services/FixtureImporter.hpp"

#include "domain/text/Normalization.hpp"

#include <regex>

using namespace vbe::domain;

namespace vbe::services {

namespace {

const std::regex kTrailingNoise(R"(\s{2,}|\()");

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

FixtureImporter::FixtureImporter(vbe::repositories::IEntityDirectory& directory, std::string sport)
    : directory_(directory)
    , sport_(text::to_lower(text::trim(sport))) {}

std::string FixtureImporter::clean_team_name(const std::string& name) {
    std::string trimmed = text::trim(name);
    if (ends_with(trimmed, "(W)")) return trimmed;

    std::smatch m;
    if (std::regex_search(trimmed, m, kTrailingNoise)) {
        return text::trim(trimmed.substr(0, static_cast<std::size_t>(m.position(0))));
    }
    return trimmed;
}

std::optional<Fixture> FixtureImporter::parse_fixture_line(const std::string& line) {
    std::string trimmed = text::trim(line);

    std::string separator;
    if (text::contains(trimmed, " v ")) {
        separator = " v ";
    } else if (text::contains(trimmed, " @ ")) {
        separator = " @ ";
    } else {
        return std::nullopt;
    }

    std::size_t first = trimmed.find(separator);
    if (trimmed.find(separator, first + separator.size()) != std::string::npos) {
        return std::nullopt;
    }

    Fixture fixture{clean_team_name(trimmed.substr(0, first)),
                    clean_team_name(trimmed.substr(first + separator.size()))};
    if (fixture.home.empty() || fixture.away.empty()) return std::nullopt;
    return fixture;
}

ImportSummary FixtureImporter::import_lines(std::istream& in) {
    ImportSummary summary;
    std::string line;
    while (std::getline(in, line)) {
        auto fixture = parse_fixture_line(line);
        if (!fixture) continue;
        ++summary.fixtures;
        import_team(fixture->home, summary);
        import_team(fixture->away, summary);
    }
    return summary;
}

void FixtureImporter::import_team(const std::string& raw_name, ImportSummary& summary) {
    std::string canonical = text::to_lower(text::trim(raw_name));
    if (canonical.empty()) return;

    if (auto existing = directory_.find_team_by_alias(canonical)) {
        if (directory_.add_alias(EntityKind::TEAM, *existing, raw_name)) {
            ++summary.aliases_added;
        }
        return;
    }
    if (directory_.add_team(canonical, sport_, {text::trim(raw_name)})) {
        ++summary.teams_added;
    }
}

} // namespace vbe::services
