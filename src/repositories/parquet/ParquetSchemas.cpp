#include "repositories/parquet/ParquetSchemas.hpp"

namespace vbe::repositories::pq {

std::shared_ptr<arrow::Schema> ParquetSchemas::saved_bet_schema() {
    return arrow::schema({
        arrow::field("bookmaker", arrow::utf8()),
        arrow::field("sport", arrow::utf8()),
        arrow::field("bet_text", arrow::utf8()),
        arrow::field("odds", arrow::float64()),
        arrow::field("price", arrow::float64()),
        arrow::field("decision", arrow::utf8()),
        arrow::field("recorded_at_ms", arrow::int64()),
    });
}

} // namespace vbe::repositories::pq
