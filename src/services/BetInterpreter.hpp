#pragma once

#include "domain/aggregates/ParsedBet.hpp"
#include "repositories/IEntityDirectory.hpp"
#include "services/BetLineParser.hpp"
#include "services/BetParser.hpp"
#include "services/EntityClassifier.hpp"

#include <string>

namespace vbe::services {

struct Interpretation {
    BetLine line;
    std::string parsed_text;      // text handed to the parser
    vbe::domain::ParsedBet bet;
    bool reparsed = false;        // directory grew while reviewing leftovers
};

// Raw console line to parsed bet: splits the optional bookmaker/sport/odds
// fields, collapses multi-fixture lines to their home teams, parses, then
// offers unrecognized fragments for classification and parses again when
// that taught the directory something new.
class BetInterpreter {
public:
    BetInterpreter(vbe::repositories::IEntityDirectory& directory,
                   BetParser& parser,
                   EntityClassifier* classifier = nullptr);

    Interpretation interpret(const std::string& raw_line);
    // Same, for a line whose fields were already split.
    Interpretation interpret(const std::string& raw_line, BetLine line);

private:
    vbe::repositories::IEntityDirectory& directory_;
    BetParser& parser_;
    EntityClassifier* classifier_;
};

} // namespace vbe::services
