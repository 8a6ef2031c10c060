#include "domain/entities/SavedBet.hpp"

#include "domain/value_objects/Sport.hpp"

#include <iomanip>
#include <sstream>

namespace vbe::domain {

std::string format_decimal(double value) {
    std::ostringstream out;
    out << std::setprecision(12) << value;
    std::string str = out.str();
    if (str.find('.') == std::string::npos && str.find('e') == std::string::npos) {
        str += ".0";
    }
    return str;
}

std::string SavedBet::to_line() const {
    std::string line = bookmaker + " - " + sport_display_name(sport) + " - " + bet_text
        + " - " + format_decimal(odds) + " / " + format_decimal(price);
    if (decision == ValueDecision::TWO_PERCENT) {
        line += " 2pc";
    }
    return line;
}

} // namespace vbe::domain
