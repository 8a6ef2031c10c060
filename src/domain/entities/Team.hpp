#pragma once

#include <string>
#include <vector>

namespace vbe::domain {

struct Team {
    std::string name;
    std::string sport;
    std::vector<std::string> aliases;
    std::vector<std::string> players;
};

} // namespace vbe::domain
