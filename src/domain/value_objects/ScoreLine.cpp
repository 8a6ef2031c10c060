#include "domain/value_objects/ScoreLine.hpp"

#include <cctype>
#include <stdexcept>

namespace vbe::domain {

namespace {

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

ScoreLine::ScoreLine(int home, int away) : home_(home), away_(away) {
    if (home < 0 || away < 0) {
        throw std::out_of_range("Score must be non-negative, got: "
            + std::to_string(home) + "-" + std::to_string(away));
    }
}

std::vector<ScoreLine> ScoreLine::find_all(const std::string& text) {
    std::vector<ScoreLine> scores;
    std::size_t i = 0;
    while (i < text.size()) {
        if (!is_digit(text[i])) {
            ++i;
            continue;
        }
        std::size_t home_end = i;
        while (home_end < text.size() && is_digit(text[home_end])) ++home_end;
        if (home_end + 1 < text.size() && text[home_end] == '-' && is_digit(text[home_end + 1])) {
            std::size_t away_end = home_end + 1;
            while (away_end < text.size() && is_digit(text[away_end])) ++away_end;
            try {
                scores.emplace_back(std::stoi(text.substr(i, home_end - i)),
                                    std::stoi(text.substr(home_end + 1, away_end - home_end - 1)));
            } catch (const std::out_of_range&) {
                // absurdly long digit runs are not scores
            }
            i = away_end;
        } else {
            i = home_end;
        }
    }
    return scores;
}

std::string ScoreLine::to_token() const {
    return std::to_string(home_) + "-" + std::to_string(away_);
}

std::string ScoreLine::to_runner_name() const {
    return std::to_string(home_) + " - " + std::to_string(away_);
}

} // namespace vbe::domain
