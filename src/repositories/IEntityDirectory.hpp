#pragma once

#include "domain/entities/EntityKind.hpp"
#include "domain/entities/Market.hpp"
#include "domain/entities/Player.hpp"
#include "domain/entities/Team.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vbe::repositories {

class IEntityDirectory {
public:
    // Read access, keyed by canonical name
    virtual const std::map<std::string, vbe::domain::Team>& teams() const = 0;
    virtual const std::map<std::string, vbe::domain::Market>& markets() const = 0;
    virtual const std::map<std::string, vbe::domain::Player>& players() const = 0;

    // Incremented by every successful mutation; alias maps built from an
    // older version are stale.
    virtual uint64_t version() const = 0;

    virtual std::optional<std::string> find_team_by_alias(const std::string& alias) const = 0;
    virtual std::optional<std::string> find_market_by_alias(const std::string& alias) const = 0;

    // Mutations return false when nothing changed (entity exists, alias known)
    virtual bool add_team(const std::string& name, const std::string& sport,
                          std::vector<std::string> aliases = {}) = 0;
    virtual bool add_market(const std::string& name, const std::string& sport,
                            std::vector<std::string> type_codes,
                            std::vector<std::string> aliases = {}) = 0;
    virtual bool add_player(const std::string& name, const std::string& sport,
                            const std::optional<std::string>& team,
                            std::vector<std::string> aliases = {}) = 0;
    virtual bool add_alias(vbe::domain::EntityKind kind, const std::string& canonical,
                           const std::string& alias) = 0;

    virtual ~IEntityDirectory() = default;
};

} // namespace vbe::repositories
