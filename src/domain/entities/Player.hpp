#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vbe::domain {

struct Player {
    std::string name;
    std::string sport;
    std::optional<std::string> team;
    std::vector<std::string> aliases;
};

} // namespace vbe::domain
