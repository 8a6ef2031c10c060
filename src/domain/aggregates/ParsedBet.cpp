#include "domain/aggregates/ParsedBet.hpp"

#include <algorithm>
#include <sstream>

namespace vbe::domain {

namespace {

void write_list(std::ostringstream& out, const std::vector<std::string>& items) {
    out << "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out << ", ";
        out << "'" << items[i] << "'";
    }
    out << "]";
}

} // namespace

bool ParsedBet::has_market(const std::string& market) const {
    return std::find(markets.begin(), markets.end(), market) != markets.end();
}

std::string ParsedBet::to_string() const {
    std::ostringstream out;
    out << "{'teams': ";
    write_list(out, teams);
    out << ", 'markets': ";
    write_list(out, markets);
    if (!scores.empty()) {
        out << ", 'scores': [";
        for (std::size_t i = 0; i < scores.size(); ++i) {
            if (i > 0) out << ", ";
            out << "(" << scores[i].home() << ", " << scores[i].away() << ")";
        }
        out << "]";
    }
    out << ", 'unrecognized': ";
    write_list(out, unrecognized);
    out << "}";
    return out.str();
}

} // namespace vbe::domain
