#pragma once

#include "config/Settings.hpp"
#include "domain/entities/Market.hpp"
#include "domain/entities/Team.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vbe::services {

struct AliasSource {
    std::string canonical;
    std::vector<std::string> aliases;
};

// Two entities claimed the same normalized alias.
struct AliasConflict {
    std::string alias;
    std::string kept;
    std::string discarded;
};

// Normalized alias -> canonical name. Every canonical name is reachable
// through its own normalized form, and no other entity's alias can take
// that key away from it.
class AliasDirectory {
public:
    AliasDirectory() = default;

    static AliasDirectory build(const std::vector<AliasSource>& sources,
                                vbe::config::AliasConflictPolicy policy =
                                    vbe::config::AliasConflictPolicy::LAST_WINS);
    static AliasDirectory from_teams(const std::map<std::string, vbe::domain::Team>& teams,
                                     vbe::config::AliasConflictPolicy policy =
                                         vbe::config::AliasConflictPolicy::LAST_WINS);
    static AliasDirectory from_markets(const std::map<std::string, vbe::domain::Market>& markets,
                                       vbe::config::AliasConflictPolicy policy =
                                           vbe::config::AliasConflictPolicy::LAST_WINS);

    std::optional<std::string> canonical_of(const std::string& normalized_alias) const;

    const std::vector<AliasConflict>& conflicts() const { return conflicts_; }
    const std::map<std::string, std::string>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    void insert(const std::string& key, const std::string& canonical, bool is_canonical_key,
                vbe::config::AliasConflictPolicy policy);

    std::map<std::string, std::string> entries_;
    std::map<std::string, bool> canonical_keys_;
    std::vector<AliasConflict> conflicts_;
};

} // namespace vbe::services
