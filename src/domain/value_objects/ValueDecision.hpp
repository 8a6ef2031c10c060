#pragma once

#include <stdexcept>
#include <string>

namespace vbe::domain {

enum class ValueDecision { NOT_VALUE, TWO_PERCENT, VALUE };

inline std::string to_string(ValueDecision decision) {
    switch (decision) {
        case ValueDecision::VALUE: return "VALUE";
        case ValueDecision::TWO_PERCENT: return "2PC";
        case ValueDecision::NOT_VALUE: return "NOT VALUE";
    }
    return "NOT VALUE";
}

inline ValueDecision value_decision_from_string(const std::string& str) {
    if (str == "VALUE") return ValueDecision::VALUE;
    if (str == "2PC") return ValueDecision::TWO_PERCENT;
    if (str == "NOT VALUE") return ValueDecision::NOT_VALUE;
    throw std::invalid_argument("Invalid value decision: " + str);
}

} // namespace vbe::domain
