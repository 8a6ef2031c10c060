#pragma once

#include <string>

namespace vbe::domain {

enum class EntityKind { TEAM, MARKET, PLAYER };

inline std::string to_string(EntityKind kind) {
    switch (kind) {
        case EntityKind::TEAM: return "team";
        case EntityKind::MARKET: return "market";
        case EntityKind::PLAYER: return "player";
    }
    return "team";
}

} // namespace vbe::domain
