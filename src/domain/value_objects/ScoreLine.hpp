#pragma once

#include <compare>
#include <optional>
#include <string>
#include <vector>

namespace vbe::domain {

// A correct-score prediction, home goals first.
class ScoreLine {
public:
    ScoreLine(int home, int away);

    // Every "<digits>-<digits>" occurrence inside the token, in order.
    static std::vector<ScoreLine> find_all(const std::string& text);

    int home() const noexcept { return home_; }
    int away() const noexcept { return away_; }

    ScoreLine reversed() const { return ScoreLine(away_, home_); }

    // "2-1", the form the bettor types.
    std::string to_token() const;
    // "2 - 1", the form exchange runners are named.
    std::string to_runner_name() const;

    bool operator==(const ScoreLine&) const = default;
    auto operator<=>(const ScoreLine&) const = default;

private:
    int home_;
    int away_;
};

} // namespace vbe::domain
