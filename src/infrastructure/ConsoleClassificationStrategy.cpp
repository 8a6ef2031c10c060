#include "infrastructure/ConsoleClassificationStrategy.hpp"

#include "domain/text/Normalization.hpp"
#include "services/EntityClassifier.hpp"

#include <cctype>
#include <optional>

using namespace vbe::domain;
using namespace vbe::services;

namespace vbe::infrastructure {

namespace {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::optional<std::string> canonical_for(const vbe::repositories::IEntityDirectory& directory,
                                         EntityKind kind, const std::string& alias) {
    switch (kind) {
        case EntityKind::TEAM: return directory.find_team_by_alias(alias);
        case EntityKind::MARKET: return directory.find_market_by_alias(alias);
        case EntityKind::PLAYER:
            if (directory.players().count(alias) > 0) return alias;
            return std::nullopt;
    }
    return std::nullopt;
}

std::string describe(const vbe::repositories::IEntityDirectory& directory, EntityKind kind,
                     const std::string& canonical) {
    if (kind == EntityKind::TEAM) {
        auto it = directory.teams().find(canonical);
        if (it != directory.teams().end()) return "Sport: " + it->second.sport;
    } else if (kind == EntityKind::MARKET) {
        auto it = directory.markets().find(canonical);
        if (it != directory.markets().end()) {
            std::string types;
            for (const auto& code : it->second.type_codes) {
                if (!types.empty()) types += ",";
                types += code;
            }
            return "Sport: " + it->second.sport + ", Type: " + (types.empty() ? "regular" : types);
        }
    }
    return "Sport: unknown";
}

} // namespace

ConsoleClassificationStrategy::ConsoleClassificationStrategy(std::istream& in, std::ostream& out)
    : in_(in)
    , out_(out) {}

std::string ConsoleClassificationStrategy::ask(const std::string& prompt) {
    out_ << prompt << std::flush;
    std::string answer;
    if (!std::getline(in_, answer)) return {};
    return text::trim(answer);
}

std::vector<std::string> ConsoleClassificationStrategy::ask_list(const std::string& prompt) {
    std::vector<std::string> items;
    std::string answer = ask(prompt);
    std::size_t start = 0;
    while (start <= answer.size()) {
        std::size_t comma = answer.find(',', start);
        std::string item = text::to_lower(text::trim(
            answer.substr(start, comma == std::string::npos ? std::string::npos : comma - start)));
        if (!item.empty()) items.push_back(item);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return items;
}

ClassificationResult ConsoleClassificationStrategy::classify(
    const std::string& token, const vbe::repositories::IEntityDirectory& directory) {
    out_ << "Unrecognized token: '" << token << "'" << std::endl;
    std::string answer = text::to_lower(ask("Options: (T)eam/(P)layer/(M)arket/(I)gnore? "));
    if (!in_) return IgnoreEntity{};

    if (answer == "t") return classify_entity(token, EntityKind::TEAM, directory);
    if (answer == "m") return classify_entity(token, EntityKind::MARKET, directory);
    if (answer == "p") {
        NewEntity player{EntityKind::PLAYER, token, {}, {}, {}, std::nullopt};
        player.sport = text::to_lower(ask("Enter the sport for player '" + token + "': "));
        std::string team = ask("Enter the player's team name or leave blank if none: ");
        if (!team.empty()) player.team = team;
        player.aliases = ask_list("Enter aliases for this player (comma-separated) or leave blank: ");
        return player;
    }
    if (answer == "i") return IgnoreEntity{};

    out_ << "Invalid choice, please select T/P/M/I." << std::endl;
    return InvalidChoice{"expected T, P, M or I, got '" + answer + "'"};
}

ClassificationResult ConsoleClassificationStrategy::classify_entity(
    const std::string& token, EntityKind kind, const vbe::repositories::IEntityDirectory& directory) {
    const std::string kind_name = to_string(kind);

    auto matches = closest_aliases(directory, token, kind);
    if (!matches.empty()) {
        out_ << "Close " << kind_name << " matches found:" << std::endl;
        std::vector<std::string> canonicals;
        for (std::size_t i = 0; i < matches.size(); ++i) {
            std::string canonical = canonical_for(directory, kind, matches[i]).value_or(matches[i]);
            canonicals.push_back(canonical);
            out_ << (i + 1) << ". " << canonical << " (" << describe(directory, kind, canonical) << ")"
                 << std::endl;
        }

        std::string choice = text::to_lower(
            ask("Select a matching " + kind_name + " by number, or (N)one to add as new " + kind_name + ": "));
        if (all_digits(choice) && choice.size() <= 3) {
            std::size_t index = std::stoul(choice);
            if (index >= 1 && index <= canonicals.size()) {
                return ExistingEntity{kind, canonicals[index - 1]};
            }
            out_ << "Invalid choice number." << std::endl;
            return InvalidChoice{"no match numbered " + choice};
        }
        if (choice != "n") {
            out_ << "Invalid choice, returning to main classification options." << std::endl;
            return InvalidChoice{"expected a number or N, got '" + choice + "'"};
        }
    } else {
        out_ << "No close " << kind_name << " matches found." << std::endl;
    }

    std::string mode = text::to_lower(
        ask("No suitable match. Enter (M)anual " + kind_name + " name or (N)ew " + kind_name + ": "));
    if (mode == "m") {
        std::string manual = text::to_lower(ask("Type the canonical " + kind_name + " name exactly: "));
        auto manual_matches = closest_aliases(directory, manual, kind);
        if (!manual_matches.empty()) {
            auto canonical = canonical_for(directory, kind, manual_matches.front());
            return ExistingEntity{kind, canonical.value_or(manual_matches.front())};
        }
        if (manual.empty()) return InvalidChoice{"empty " + kind_name + " name"};
        return new_entity(manual, token, kind);
    }
    return new_entity(token, token, kind);
}

ClassificationResult ConsoleClassificationStrategy::new_entity(const std::string& name,
                                                               const std::string& token,
                                                               EntityKind kind) {
    const std::string kind_name = to_string(kind);
    NewEntity entity{kind, name, {}, {}, {}, std::nullopt};
    entity.sport = text::to_lower(ask("Enter the sport for " + kind_name + " '" + name + "': "));
    entity.aliases = ask_list("Enter aliases for this " + kind_name + " (comma-separated) or leave blank: ");
    if (kind == EntityKind::MARKET) {
        entity.type_codes = ask_list("Enter the exchange market type codes (comma-separated) or leave blank: ");
        for (auto& code : entity.type_codes) {
            for (auto& c : code) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    if (name != text::to_lower(token)) {
        out_ << "New " << kind_name << " '" << name << "' will carry '" << token << "' as an alias." << std::endl;
    }
    return entity;
}

std::vector<std::string> ConsoleClassificationStrategy::review_unrecognized(
    const std::vector<std::string>& segments) {
    std::vector<std::string> picked;
    for (const auto& segment : segments) {
        out_ << std::endl << "Current unrecognized segment: '" << segment << "'" << std::endl;
        while (true) {
            std::string action = text::to_lower(
                ask("Select action: (S)elect substring/(I)gnore remainder/(D)one/(Q)uit handling: "));
            if (!in_) return picked;

            if (action == "s") {
                std::string substring = ask("Type the substring you want to classify: ");
                if (!substring.empty()) picked.push_back(substring);
            } else if (action == "i") {
                out_ << "Ignoring remainder of '" << segment << "'." << std::endl;
                break;
            } else if (action == "d") {
                out_ << "Done with this segment." << std::endl;
                break;
            } else if (action == "q") {
                out_ << "Quitting handling unrecognized segments." << std::endl;
                return picked;
            } else {
                out_ << "Invalid choice. Please choose (S), (I), (D), or (Q)." << std::endl;
            }
        }
    }
    return picked;
}

} // namespace vbe::infrastructure
