#include "repositories/json/JsonEntityDirectory.hpp"

#include <arrow/buffer.h>
#include <arrow/filesystem/localfs.h>
#include <arrow/io/interfaces.h>
#include <nlohmann/json.hpp>

#include <iostream>

using namespace vbe::domain;

namespace vbe::repositories::js {

namespace {

std::vector<std::string> string_list(const nlohmann::json& obj, const char* key) {
    std::vector<std::string> out;
    if (!obj.contains(key) || !obj[key].is_array()) return out;
    for (const auto& item : obj[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

std::string string_or(const nlohmann::json& obj, const char* key, const std::string& fallback) {
    if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return fallback;
}

// Markets written by older tooling carry a single "type" string.
std::vector<std::string> market_types(const nlohmann::json& obj) {
    auto types = string_list(obj, "types");
    if (types.empty() && obj.contains("type") && obj["type"].is_string()) {
        types.push_back(obj["type"].get<std::string>());
    }
    return types;
}

nlohmann::json parse_object(const std::string& filename, const std::string& content) {
    if (content.empty()) return nlohmann::json::object();
    auto doc = nlohmann::json::parse(content, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        std::cerr << "[directory] Error decoding JSON in file " << filename
                  << ", treating it as empty" << std::endl;
        return nlohmann::json::object();
    }
    return doc;
}

} // namespace

JsonEntityDirectory::JsonEntityDirectory(std::shared_ptr<arrow::fs::FileSystem> fs)
    : fs_(std::move(fs)) {
    load();
}

std::shared_ptr<arrow::fs::FileSystem> JsonEntityDirectory::make_local_fs(const std::string& root_dir) {
    auto local = std::make_shared<arrow::fs::LocalFileSystem>();
    (void)local->CreateDir(root_dir, /*recursive=*/true);
    return std::make_shared<arrow::fs::SubTreeFileSystem>(root_dir, local);
}

void JsonEntityDirectory::load() {
    std::map<std::string, Team> teams;
    std::map<std::string, Market> markets;
    std::map<std::string, Player> players;

    auto teams_json = parse_object(kTeamsFile, read_file(kTeamsFile));
    for (const auto& [name, data] : teams_json.items()) {
        if (!data.is_object()) continue;
        teams.emplace(name, Team{name, string_or(data, "sport", ""),
                                 string_list(data, "aliases"), string_list(data, "players")});
    }

    auto markets_json = parse_object(kMarketsFile, read_file(kMarketsFile));
    for (const auto& [name, data] : markets_json.items()) {
        if (!data.is_object()) continue;
        markets.emplace(name, Market{name, string_or(data, "sport", ""),
                                     string_list(data, "aliases"), market_types(data),
                                     string_or(data, "description", "")});
    }

    auto players_json = parse_object(kPlayersFile, read_file(kPlayersFile));
    for (const auto& [name, data] : players_json.items()) {
        if (!data.is_object()) continue;
        std::optional<std::string> team;
        if (data.contains("team") && data["team"].is_string()) {
            team = data["team"].get<std::string>();
        }
        players.emplace(name, Player{name, string_or(data, "sport", ""), team,
                                     string_list(data, "aliases")});
    }

    if (teams.empty()) {
        std::cerr << "[directory] No teams loaded; every team will be unrecognized" << std::endl;
    }
    if (markets.empty()) {
        std::cerr << "[directory] No markets loaded; market recognition is disabled" << std::endl;
    }

    reset(std::move(teams), std::move(markets), std::move(players));
}

bool JsonEntityDirectory::save_all() const {
    nlohmann::json teams_json = nlohmann::json::object();
    for (const auto& [name, team] : teams()) {
        nlohmann::json entry = {{"sport", team.sport}, {"aliases", team.aliases}};
        if (!team.players.empty()) entry["players"] = team.players;
        teams_json[name] = std::move(entry);
    }

    nlohmann::json markets_json = nlohmann::json::object();
    for (const auto& [name, market] : markets()) {
        markets_json[name] = {
            {"sport", market.sport},
            {"aliases", market.aliases},
            {"types", market.type_codes},
            {"description", market.description},
        };
    }

    nlohmann::json players_json = nlohmann::json::object();
    for (const auto& [name, player] : players()) {
        players_json[name] = {
            {"sport", player.sport},
            {"team", player.team ? nlohmann::json(*player.team) : nlohmann::json(nullptr)},
            {"aliases", player.aliases},
        };
    }

    bool ok = write_file(kTeamsFile, teams_json.dump(4));
    ok = write_file(kMarketsFile, markets_json.dump(4)) && ok;
    ok = write_file(kPlayersFile, players_json.dump(4)) && ok;
    return ok;
}

void JsonEntityDirectory::on_mutation() {
    if (autosave_ && !save_all()) {
        std::cerr << "[directory] Directory changes were not fully persisted" << std::endl;
    }
}

std::string JsonEntityDirectory::read_file(const std::string& path) const {
    if (!fs_) return {};

    auto result = fs_->OpenInputFile(path);
    if (!result.ok()) {
        std::cerr << "[directory] File " << path << " not found, returning empty data" << std::endl;
        return {};
    }

    auto file = *result;
    auto size_result = file->GetSize();
    if (!size_result.ok()) return {};

    auto buf_result = file->Read(*size_result);
    if (!buf_result.ok()) {
        std::cerr << "[directory] Failed to read " << path << ": "
                  << buf_result.status().ToString() << std::endl;
        return {};
    }

    return std::string(reinterpret_cast<const char*>((*buf_result)->data()),
                       static_cast<size_t>((*buf_result)->size()));
}

bool JsonEntityDirectory::write_file(const std::string& path, const std::string& content) const {
    if (!fs_) return false;

    auto result = fs_->OpenOutputStream(path);
    if (!result.ok()) {
        std::cerr << "[directory] Failed to save " << path << ": "
                  << result.status().ToString() << std::endl;
        return false;
    }

    auto stream = *result;
    auto status = stream->Write(content.data(), static_cast<int64_t>(content.size()));
    if (status.ok()) status = stream->Close();
    if (!status.ok()) {
        std::cerr << "[directory] Failed to save " << path << ": " << status.ToString() << std::endl;
        return false;
    }
    return true;
}

} // namespace vbe::repositories::js
