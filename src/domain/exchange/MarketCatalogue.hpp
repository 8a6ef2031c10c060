#pragma once

#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vbe::domain {

struct RunnerDescription {
    int64_t selection_id;
    std::string name;
};

struct MarketCatalogue {
    std::string market_id;
    std::string name;
    std::optional<Timestamp> start_time;
    std::vector<RunnerDescription> runners;
};

} // namespace vbe::domain
