#pragma once

#include "config/Settings.hpp"

#include <string>
#include <vector>

namespace vbe::services {

class MarketTypeMapper {
public:
    explicit MarketTypeMapper(const vbe::config::SportSettings& settings);

    // Exchange market type codes for a canonical market name. Never empty,
    // except for "to win to nil" whose side-specific code depends on the event.
    std::vector<std::string> map(const std::string& market_name, const std::string& sport) const;

private:
    const vbe::config::SportSettings& settings_;
};

} // namespace vbe::services
