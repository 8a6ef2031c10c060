#include "repositories/json/JsonEntityDirectory.hpp"
#include "services/FixtureImporter.hpp"

#include <fstream>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: team_extractor <sport> <matches_file> [data_dir]" << std::endl;
        return 1;
    }

    std::string sport = argv[1];
    std::string matches_file = argv[2];
    std::string data_dir = argc >= 4 ? argv[3] : "data";

    std::ifstream in(matches_file);
    if (!in) {
        std::cerr << "[import] Cannot open " << matches_file << std::endl;
        return 1;
    }

    vbe::repositories::js::JsonEntityDirectory directory(
        vbe::repositories::js::JsonEntityDirectory::make_local_fs(data_dir));
    directory.set_autosave(false);

    vbe::services::FixtureImporter importer(directory, sport);
    auto summary = importer.import_lines(in);

    if (!directory.save_all()) {
        std::cerr << "[import] Failed to write the team directory to " << data_dir << std::endl;
        return 1;
    }

    std::cout << "[import] fixtures=" << summary.fixtures
              << " teams_added=" << summary.teams_added
              << " aliases_added=" << summary.aliases_added
              << " teams_total=" << directory.teams().size()
              << std::endl;
    return 0;
}
