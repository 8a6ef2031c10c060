#pragma once

#include <string>
#include <vector>

namespace vbe::domain {

struct Market {
    std::string name;
    std::string sport;
    std::vector<std::string> aliases;
    std::vector<std::string> type_codes;
    std::string description;
};

} // namespace vbe::domain
