#include "domain/text/Similarity.hpp"

#include <algorithm>
#include <utility>

namespace vbe::domain::text {

namespace {

std::size_t longest_common_subsequence(const std::string& a, const std::string& b) {
    std::vector<std::size_t> row(b.size() + 1, 0);
    for (std::size_t i = 1; i <= a.size(); ++i) {
        std::size_t diag = 0;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            std::size_t up = row[j];
            if (a[i - 1] == b[j - 1]) {
                row[j] = diag + 1;
            } else {
                row[j] = std::max(row[j], row[j - 1]);
            }
            diag = up;
        }
    }
    return row[b.size()];
}

} // namespace

double ratio(const std::string& a, const std::string& b) {
    std::size_t total = a.size() + b.size();
    if (total == 0) return 100.0;
    return 200.0 * static_cast<double>(longest_common_subsequence(a, b))
        / static_cast<double>(total);
}

std::vector<std::string> closest_matches(const std::string& query,
                                         const std::vector<std::string>& choices,
                                         std::size_t n,
                                         double cutoff) {
    std::vector<std::pair<double, std::size_t>> scored;
    for (std::size_t i = 0; i < choices.size(); ++i) {
        double score = ratio(query, choices[i]) / 100.0;
        if (score >= cutoff) {
            scored.emplace_back(score, i);
        }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.first > rhs.first; });

    std::vector<std::string> result;
    for (std::size_t i = 0; i < scored.size() && i < n; ++i) {
        result.push_back(choices[scored[i].second]);
    }
    return result;
}

} // namespace vbe::domain::text
