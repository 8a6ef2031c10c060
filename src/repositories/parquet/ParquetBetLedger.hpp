#pragma once

#include "repositories/IBetLedger.hpp"

#include <arrow/filesystem/api.h>

#include <memory>
#include <string>
#include <vector>

namespace vbe::repositories::pq {

// Saved bets kept in a single Parquet file. The file is read once on
// construction and rewritten on every record().
class ParquetBetLedger : public vbe::repositories::IBetLedger {
public:
    ParquetBetLedger(std::shared_ptr<arrow::fs::FileSystem> fs, std::string path);

    void record(const vbe::domain::SavedBet& bet) override;
    std::vector<vbe::domain::SavedBet> saved_bets() const override;

private:
    void load();
    bool write_all() const;

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    std::string path_;
    std::vector<vbe::domain::SavedBet> bets_;
};

} // namespace vbe::repositories::pq
