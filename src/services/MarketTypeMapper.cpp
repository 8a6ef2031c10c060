#include "services/MarketTypeMapper.hpp"

#include "domain/text/Normalization.hpp"

namespace vbe::services {

MarketTypeMapper::MarketTypeMapper(const vbe::config::SportSettings& settings)
    : settings_(settings) {}

std::vector<std::string> MarketTypeMapper::map(const std::string& market_name,
                                               const std::string& sport) const {
    using namespace vbe::domain;

    std::string name = text::to_lower(text::trim(market_name));
    if (name.empty()) name = "match odds";

    if (name == "to win to nil") return {};

    auto it = settings_.market_name_to_types.find(name);
    if (it != settings_.market_name_to_types.end()) return it->second;

    if (text::to_lower(sport) == settings_.primary_sport) {
        return {settings_.primary_fallback_type};
    }
    return {settings_.generic_fallback_type};
}

} // namespace vbe::services
