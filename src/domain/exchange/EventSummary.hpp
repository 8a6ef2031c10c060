#pragma once

#include "domain/value_objects/Timestamp.hpp"

#include <string>

namespace vbe::domain {

struct EventSummary {
    std::string id;
    std::string name;
    Timestamp open_date;
};

} // namespace vbe::domain
