#pragma once

#include "repositories/IEventStore.hpp"

#include <arrow/filesystem/api.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ses::repositories::pq {

// Event store persisted as Parquet files, one file per committed batch:
//
//   events/<shard>/<aggregate_id>/<first_version>/<first_version>_<last_version>.parquet
//
// The <first_version> directory is the batch's claim on its versions. A batch
// is written into a private staging directory which is then moved onto the
// claim. The filesystem refuses to move a directory over an existing non-empty
// one, so exactly one writer per (aggregate_id, expected_version) wins, across
// store instances and processes, and the loser gets ConcurrencyError. Requires
// a filesystem with that Move behaviour (local POSIX, Arrow's mock; not S3).
class ParquetEventStore : public ses::repositories::IEventStore {
public:
    explicit ParquetEventStore(std::shared_ptr<arrow::fs::FileSystem> fs);

    /// Create a local filesystem rooted at root_dir (creates dir if needed).
    static std::shared_ptr<arrow::fs::FileSystem> make_local_fs(const std::string& root_dir);

    std::vector<ses::domain::StoredEvent> append(
        const std::string& aggregate_id, const std::string& aggregate_type,
        const std::vector<ses::domain::UncommittedEvent>& events, uint64_t expected_version,
        const ses::domain::EventMetadata& metadata = {}) override;

    std::optional<ses::domain::EventStream> get_stream(const std::string& aggregate_id) const override;

    std::vector<ses::domain::StoredEvent> get_events_after_version(
        const std::string& aggregate_id, uint64_t version) const override;

    std::unique_ptr<IEventCursor> scan_all_events(
        std::optional<ses::domain::Timestamp> after_timestamp = std::nullopt) const override;

    uint64_t current_version(const std::string& aggregate_id) const override;

private:
    struct BatchFile {
        std::string path;
        uint64_t first_version;
        uint64_t last_version;
    };

    class Cursor;

    // Batch files of one stream, ascending and checked for gaps.
    std::vector<BatchFile> list_batches(const std::string& aggregate_id) const;
    std::vector<std::string> list_all_batch_paths() const;

    void write_batch(const std::string& path, const std::vector<ses::domain::StoredEvent>& events);
    void discard_staging(const std::string& staging_dir);
    std::vector<ses::domain::StoredEvent> read_batch(const std::string& path) const;

    static std::string stream_dir(const std::string& aggregate_id);
    static std::string slot_name(uint64_t first_version);
    static std::string batch_filename(uint64_t first_version, uint64_t last_version);
    static void validate_aggregate_id(const std::string& aggregate_id);

    std::shared_ptr<arrow::fs::FileSystem> fs_;
};

} // namespace ses::repositories::pq
