#include "config/Settings.hpp"
#include "domain/entities/SavedBet.hpp"
#include "domain/text/Normalization.hpp"
#include "domain/value_objects/Timestamp.hpp"
#include "infrastructure/BetfairClient.hpp"
#include "infrastructure/ConsoleClassificationStrategy.hpp"
#include "repositories/IBetLedger.hpp"
#include "repositories/IEntityDirectory.hpp"
#include "repositories/InMemoryBetLedger.hpp"
#include "repositories/InMemoryEntityDirectory.hpp"
#include "repositories/json/JsonEntityDirectory.hpp"
#include "services/AutoAcceptClassificationStrategy.hpp"
#include "services/BetEvaluationService.hpp"
#include "services/BetInterpreter.hpp"
#include "services/BetParser.hpp"
#include "services/EntityClassifier.hpp"
#include "services/LayPriceService.hpp"
#include "services/MarketTypeMapper.hpp"

#ifdef VBE_HAS_PARQUET
#include "repositories/parquet/ParquetBetLedger.hpp"
#endif

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

std::optional<std::string> read_line(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return std::nullopt;
    return vbe::domain::text::trim(line);
}

std::optional<double> prompt_for_odds() {
    while (true) {
        auto answer = read_line("Enter odds (must be a positive decimal): ");
        if (!answer) return std::nullopt;
        if (auto odds = vbe::services::BetLineParser::parse_odds(*answer)) {
            return odds;
        }
        std::cout << "Invalid input. Please enter a positive decimal number." << std::endl;
    }
}

void offer_to_save(const vbe::services::Interpretation& interpretation,
                   const vbe::services::BetEvaluation& evaluation,
                   double odds,
                   const vbe::services::BetEvaluationService& evaluator,
                   vbe::repositories::IBetLedger& ledger) {
    auto choice = read_line("Do you want to save this bet? (y/n): ");
    if (!choice || vbe::domain::text::to_lower(*choice) != "y") return;

    std::string bookmaker = interpretation.line.bookmaker.value_or("");
    if (bookmaker.empty()) {
        auto answer = read_line("Enter the bookmaker name: ");
        if (!answer) return;
        bookmaker = *answer;
    }

    std::string sport = interpretation.line.sport
        ? vbe::domain::text::to_lower(*interpretation.line.sport)
        : evaluator.bet_sport(interpretation.bet);

    vbe::domain::SavedBet saved{bookmaker,
                                sport,
                                vbe::domain::text::trim(interpretation.line.bet_text),
                                odds,
                                evaluation.display_price,
                                evaluation.decision,
                                vbe::domain::Timestamp::now()};
    std::cout << "Saved line: " << saved.to_line() << std::endl;
    ledger.record(saved);
}

} // namespace

int main(int argc, char* argv[]) {
    vbe::config::Settings settings;
    try {
        settings = vbe::config::Settings::from_environment();
    } catch (const std::exception& e) {
        std::cerr << "[engine] " << e.what() << std::endl;
        return 1;
    }

    bool auto_classify = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--auto-classify") {
            auto_classify = true;
        } else {
            std::cerr << "Usage: valuebet [--auto-classify]" << std::endl;
            return 1;
        }
    }

    std::unique_ptr<vbe::repositories::IEntityDirectory> directory;
    if (settings.storage.backend == "json") {
        directory = std::make_unique<vbe::repositories::js::JsonEntityDirectory>(
            vbe::repositories::js::JsonEntityDirectory::make_local_fs(settings.storage.data_directory));
    } else {
        directory = std::make_unique<vbe::repositories::InMemoryEntityDirectory>();
    }

    std::unique_ptr<vbe::repositories::IBetLedger> ledger;
    if (settings.storage.ledger_backend == "parquet") {
#ifdef VBE_HAS_PARQUET
        ledger = std::make_unique<vbe::repositories::pq::ParquetBetLedger>(
            vbe::repositories::js::JsonEntityDirectory::make_local_fs(settings.storage.data_directory),
            settings.storage.ledger_file);
#else
        std::cerr << "Parquet ledger requested but not compiled in. "
                  << "Rebuild with Apache Parquet installed." << std::endl;
        return 1;
#endif
    } else {
        ledger = std::make_unique<vbe::repositories::InMemoryBetLedger>();
    }

    vbe::infrastructure::BetfairClient client(settings.exchange);
    vbe::services::MarketTypeMapper mapper(settings.sports);
    vbe::services::LayPriceService lay_prices(client, mapper);
    vbe::services::BetEvaluationService evaluator(*directory, client, lay_prices, settings.sports);

    std::unique_ptr<vbe::services::IClassificationStrategy> strategy;
    if (auto_classify) {
        strategy = std::make_unique<vbe::services::AutoAcceptClassificationStrategy>();
    } else {
        strategy = std::make_unique<vbe::infrastructure::ConsoleClassificationStrategy>(std::cin, std::cout);
    }
    vbe::services::EntityClassifier classifier(*directory, *strategy,
                                               settings.parser.max_classification_attempts);
    vbe::services::BetParser parser(*directory, settings.parser, &classifier);
    vbe::services::BetInterpreter interpreter(*directory, parser, &classifier);

    std::cout << "[engine] Started" << std::endl;

    size_t saved_before = ledger->saved_bets().size();
    while (true) {
        auto input = read_line("Enter a bet (or 'quit' to exit): ");
        if (!input || vbe::domain::text::to_lower(*input) == "quit") break;
        if (input->empty()) continue;

        auto line = vbe::services::BetLineParser::parse_bet_line(*input);
        std::optional<double> odds = line.odds;
        if (!odds) {
            odds = prompt_for_odds();
            if (!odds) break;
        }

        auto interpretation = interpreter.interpret(*input, line);
        std::cout << "Parsed: " << interpretation.bet.to_string() << std::endl;
        std::cout << std::string(60, '-') << std::endl;

        auto evaluation = evaluator.evaluate(interpretation.bet, *odds);
        if (!evaluation) {
            std::cout << "No lay prices found or no valid bets parsed." << std::endl;
            continue;
        }

        std::cout << "Multiplied Lay Price: " << vbe::domain::format_decimal(evaluation->display_price)
                  << std::endl;
        std::cout << vbe::domain::to_string(evaluation->decision) << std::endl;

        if (evaluation->decision != vbe::domain::ValueDecision::NOT_VALUE &&
            !interpretation.line.explicit_format) {
            offer_to_save(interpretation, *evaluation, *odds, evaluator, *ledger);
        }
    }

    std::cout << "\n[engine] Done. Saved " << ledger->saved_bets().size() - saved_before
              << " bets." << std::endl;
    return 0;
}
