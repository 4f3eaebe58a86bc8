#pragma once

#include <arrow/api.h>

namespace ses::repositories::pq {

class ParquetSchemas {
public:
    // Column order of stored_event_schema()
    enum StoredEventColumn : int {
        kAggregateId = 0,
        kAggregateType,
        kEventId,
        kEventType,
        kEventData,
        kCorrelationId,
        kCausationId,
        kUserId,
        kTraceId,
        kVersion,
        kTimestampMs,
    };

    // One row per stored event. event_data holds the payload as a JSON string.
    static std::shared_ptr<arrow::Schema> stored_event_schema();
};

} // namespace ses::repositories::pq
