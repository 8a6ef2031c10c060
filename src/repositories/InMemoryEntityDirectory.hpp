#pragma once

#include "repositories/IEntityDirectory.hpp"

namespace vbe::repositories {

class InMemoryEntityDirectory : public IEntityDirectory {
public:
    InMemoryEntityDirectory() = default;
    InMemoryEntityDirectory(std::map<std::string, vbe::domain::Team> teams,
                            std::map<std::string, vbe::domain::Market> markets,
                            std::map<std::string, vbe::domain::Player> players = {});

    const std::map<std::string, vbe::domain::Team>& teams() const override { return teams_; }
    const std::map<std::string, vbe::domain::Market>& markets() const override { return markets_; }
    const std::map<std::string, vbe::domain::Player>& players() const override { return players_; }
    uint64_t version() const override { return version_; }

    std::optional<std::string> find_team_by_alias(const std::string& alias) const override;
    std::optional<std::string> find_market_by_alias(const std::string& alias) const override;

    bool add_team(const std::string& name, const std::string& sport,
                  std::vector<std::string> aliases = {}) override;
    bool add_market(const std::string& name, const std::string& sport,
                    std::vector<std::string> type_codes,
                    std::vector<std::string> aliases = {}) override;
    bool add_player(const std::string& name, const std::string& sport,
                    const std::optional<std::string>& team,
                    std::vector<std::string> aliases = {}) override;
    bool add_alias(vbe::domain::EntityKind kind, const std::string& canonical,
                   const std::string& alias) override;

protected:
    // Called after every successful mutation, once the version is bumped.
    virtual void on_mutation() {}

    // Replace contents wholesale (loading from storage); does not bump the version.
    void reset(std::map<std::string, vbe::domain::Team> teams,
               std::map<std::string, vbe::domain::Market> markets,
               std::map<std::string, vbe::domain::Player> players);

private:
    void mutated();

    std::map<std::string, vbe::domain::Team> teams_;
    std::map<std::string, vbe::domain::Market> markets_;
    std::map<std::string, vbe::domain::Player> players_;
    uint64_t version_{0};
};

} // namespace vbe::repositories
