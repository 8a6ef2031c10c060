#pragma once

#include "repositories/IBetLedger.hpp"

#include <vector>

namespace vbe::repositories {

class InMemoryBetLedger : public vbe::repositories::IBetLedger {
public:
    void record(const vbe::domain::SavedBet& bet) override {
        bets_.push_back(bet);
    }

    std::vector<vbe::domain::SavedBet> saved_bets() const override {
        return bets_;
    }

    size_t size() const { return bets_.size(); }

private:
    std::vector<vbe::domain::SavedBet> bets_;
};

} // namespace vbe::repositories
