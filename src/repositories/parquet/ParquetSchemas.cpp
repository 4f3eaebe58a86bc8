#include "repositories/parquet/ParquetSchemas.hpp"

namespace ses::repositories::pq {

namespace {

arrow::FieldVector envelope_fields() {
    return {
        arrow::field("aggregate_id", arrow::utf8(), /*nullable=*/false),
        arrow::field("aggregate_type", arrow::utf8(), /*nullable=*/false),
        arrow::field("event_id", arrow::utf8(), /*nullable=*/false),
        arrow::field("event_type", arrow::utf8(), /*nullable=*/false),
        arrow::field("event_data", arrow::utf8(), /*nullable=*/false),
    };
}

arrow::FieldVector metadata_fields() {
    return {
        arrow::field("correlation_id", arrow::utf8(), /*nullable=*/false),
        arrow::field("causation_id", arrow::utf8(), /*nullable=*/false),
        arrow::field("user_id", arrow::utf8()),
        arrow::field("trace_id", arrow::utf8()),
    };
}

arrow::FieldVector extend(arrow::FieldVector base, arrow::FieldVector extra) {
    base.insert(base.end(), extra.begin(), extra.end());
    return base;
}

} // namespace

std::shared_ptr<arrow::Schema> ParquetSchemas::stored_event_schema() {
    return arrow::schema(extend(extend(envelope_fields(), metadata_fields()), {
        arrow::field("version", arrow::uint64(), /*nullable=*/false),
        arrow::field("timestamp_ms", arrow::int64(), /*nullable=*/false),
    }));
}

} // namespace ses::repositories::pq
