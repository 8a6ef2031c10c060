#pragma once

#include "repositories/InMemoryEntityDirectory.hpp"

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

namespace vbe::repositories::js {

// Entity directory persisted as teams.json, markets.json and players.json
// at the root of the given filesystem. Loaded on construction, saved after
// every mutation.
class JsonEntityDirectory : public vbe::repositories::InMemoryEntityDirectory {
public:
    explicit JsonEntityDirectory(std::shared_ptr<arrow::fs::FileSystem> fs);

    /// Create a local filesystem rooted at root_dir (creates dir if needed).
    static std::shared_ptr<arrow::fs::FileSystem> make_local_fs(const std::string& root_dir);

    void load();
    bool save_all() const;

    // Bulk imports switch this off and call save_all() once at the end.
    void set_autosave(bool enabled) { autosave_ = enabled; }

protected:
    void on_mutation() override;

private:
    std::string read_file(const std::string& path) const;
    bool write_file(const std::string& path, const std::string& content) const;

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    bool autosave_{true};

    static constexpr const char* kTeamsFile = "teams.json";
    static constexpr const char* kMarketsFile = "markets.json";
    static constexpr const char* kPlayersFile = "players.json";
};

} // namespace vbe::repositories::js
