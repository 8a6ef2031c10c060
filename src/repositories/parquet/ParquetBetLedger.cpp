#include "repositories/parquet/ParquetBetLedger.hpp"
#include "repositories/parquet/ParquetSchemas.hpp"

#include <arrow/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <iostream>

using namespace vbe::domain;

namespace vbe::repositories::pq {

ParquetBetLedger::ParquetBetLedger(std::shared_ptr<arrow::fs::FileSystem> fs, std::string path)
    : fs_(std::move(fs))
    , path_(std::move(path)) {
    load();
}

void ParquetBetLedger::record(const SavedBet& bet) {
    bets_.push_back(bet);
    if (!write_all()) {
        std::cerr << "[ledger] Failed to persist saved bet to " << path_ << std::endl;
    }
}

std::vector<SavedBet> ParquetBetLedger::saved_bets() const {
    return bets_;
}

void ParquetBetLedger::load() {
    auto file_info = fs_->GetFileInfo(path_);
    if (!file_info.ok() || file_info->type() == arrow::fs::FileType::NotFound) {
        return;
    }

    auto infile_result = fs_->OpenInputFile(path_);
    if (!infile_result.ok()) return;

    auto reader_result = ::parquet::arrow::FileReader::Make(
        arrow::default_memory_pool(), ::parquet::ParquetFileReader::Open(*infile_result));
    if (!reader_result.ok()) {
        std::cerr << "[ledger] Unreadable ledger " << path_ << ": "
                  << reader_result.status().ToString() << std::endl;
        return;
    }
    auto reader = std::move(reader_result).ValueOrDie();

    std::shared_ptr<arrow::Table> table;
    auto read_status = reader->ReadTable(&table);
    if (!read_status.ok()) {
        std::cerr << "[ledger] Unreadable ledger " << path_ << ": " << read_status.ToString() << std::endl;
        return;
    }

    auto combined = table->CombineChunks();
    if (!combined.ok()) return;
    table = *combined;
    if (table->num_rows() == 0) return;

    auto bookmaker = std::static_pointer_cast<arrow::StringArray>(table->column(0)->chunk(0));
    auto sport = std::static_pointer_cast<arrow::StringArray>(table->column(1)->chunk(0));
    auto bet_text = std::static_pointer_cast<arrow::StringArray>(table->column(2)->chunk(0));
    auto odds = std::static_pointer_cast<arrow::DoubleArray>(table->column(3)->chunk(0));
    auto price = std::static_pointer_cast<arrow::DoubleArray>(table->column(4)->chunk(0));
    auto decision = std::static_pointer_cast<arrow::StringArray>(table->column(5)->chunk(0));
    auto recorded = std::static_pointer_cast<arrow::Int64Array>(table->column(6)->chunk(0));

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        try {
            bets_.push_back(SavedBet{
                bookmaker->GetString(i),
                sport->GetString(i),
                bet_text->GetString(i),
                odds->Value(i),
                price->Value(i),
                value_decision_from_string(decision->GetString(i)),
                Timestamp(recorded->Value(i)),
            });
        } catch (const std::exception& e) {
            std::cerr << "[ledger] Skipping malformed row " << i << ": " << e.what() << std::endl;
        }
    }
}

bool ParquetBetLedger::write_all() const {
    auto schema = ParquetSchemas::saved_bet_schema();

    arrow::StringBuilder bookmaker_builder, sport_builder, bet_text_builder, decision_builder;
    arrow::DoubleBuilder odds_builder, price_builder;
    arrow::Int64Builder recorded_builder;

    for (const auto& bet : bets_) {
        (void)bookmaker_builder.Append(bet.bookmaker);
        (void)sport_builder.Append(bet.sport);
        (void)bet_text_builder.Append(bet.bet_text);
        (void)odds_builder.Append(bet.odds);
        (void)price_builder.Append(bet.price);
        (void)decision_builder.Append(to_string(bet.decision));
        (void)recorded_builder.Append(bet.recorded_at.milliseconds());
    }

    std::shared_ptr<arrow::Array> arr_bookmaker, arr_sport, arr_text, arr_odds, arr_price,
        arr_decision, arr_recorded;
    (void)bookmaker_builder.Finish(&arr_bookmaker);
    (void)sport_builder.Finish(&arr_sport);
    (void)bet_text_builder.Finish(&arr_text);
    (void)odds_builder.Finish(&arr_odds);
    (void)price_builder.Finish(&arr_price);
    (void)decision_builder.Finish(&arr_decision);
    (void)recorded_builder.Finish(&arr_recorded);

    auto table = arrow::Table::Make(schema,
        {arr_bookmaker, arr_sport, arr_text, arr_odds, arr_price, arr_decision, arr_recorded});

    auto outfile = fs_->OpenOutputStream(path_);
    if (!outfile.ok()) return false;
    auto status = ::parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), *outfile,
                                               std::max<int64_t>(1, static_cast<int64_t>(bets_.size())));
    if (!status.ok()) return false;
    return (*outfile)->Close().ok();
}

} // namespace vbe::repositories::pq
