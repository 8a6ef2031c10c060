#include "services/BetInterpreter.hpp"

#include <cstdint>
#include <iostream>
#include <utility>

namespace vbe::services {

BetInterpreter::BetInterpreter(vbe::repositories::IEntityDirectory& directory,
                               BetParser& parser,
                               EntityClassifier* classifier)
    : directory_(directory)
    , parser_(parser)
    , classifier_(classifier) {}

Interpretation BetInterpreter::interpret(const std::string& raw_line) {
    return interpret(raw_line, BetLineParser::parse_bet_line(raw_line));
}

Interpretation BetInterpreter::interpret(const std::string& raw_line, BetLine line) {
    Interpretation result;
    result.line = std::move(line);

    if (BetLineParser::has_multiple_matches(raw_line)) {
        result.parsed_text = BetLineParser::simplify_multiple_matches(result.line.bet_text);
    } else {
        result.parsed_text = BetLineParser::preprocess_input(result.line.bet_text);
    }

    result.bet = parser_.parse(result.parsed_text);
    if (classifier_ == nullptr || result.bet.unrecognized.empty()) {
        return result;
    }

    uint64_t version = directory_.version();
    bool changed = classifier_->review_unrecognized(result.bet.unrecognized);

    if (changed || directory_.version() != version) {
        std::cerr << "[parser] Re-parsing the input after adding new data" << std::endl;
        result.bet = parser_.parse(result.parsed_text);
        result.reparsed = true;
    }
    return result;
}

} // namespace vbe::services
