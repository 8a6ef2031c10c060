#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace vbe::domain::text {

// Symmetric similarity on a 0-100 scale: 200 * LCS(a, b) / (|a| + |b|),
// i.e. one minus the normalized insert/delete distance. Two empty strings
// score 100.
double ratio(const std::string& a, const std::string& b);

// Up to n choices whose ratio / 100 reaches cutoff, best first. Equal
// scores keep the order of choices.
std::vector<std::string> closest_matches(const std::string& query,
                                         const std::vector<std::string>& choices,
                                         std::size_t n = 5,
                                         double cutoff = 0.6);

} // namespace vbe::domain::text
