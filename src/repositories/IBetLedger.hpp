#pragma once

#include "domain/entities/SavedBet.hpp"

#include <vector>

namespace vbe::repositories {

class IBetLedger {
public:
    virtual void record(const vbe::domain::SavedBet& bet) = 0;
    virtual std::vector<vbe::domain::SavedBet> saved_bets() const = 0;

    virtual ~IBetLedger() = default;
};

} // namespace vbe::repositories
