#pragma once

#include <arrow/api.h>

namespace vbe::repositories::pq {

class ParquetSchemas {
public:
    static std::shared_ptr<arrow::Schema> saved_bet_schema();
};

} // namespace vbe::repositories::pq
