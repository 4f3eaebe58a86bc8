#include "repositories/parquet/ParquetEventStore.hpp"
#include "repositories/parquet/ParquetSchemas.hpp"

#include "domain/errors/DomainErrors.hpp"
#include "domain/value_objects/Uuid.hpp"

#include <arrow/api.h>
#include <arrow/filesystem/api.h>
#include <arrow/filesystem/localfs.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <stdexcept>

using namespace ses::domain;

namespace ses::repositories::pq {

namespace {

constexpr const char* kEventsRoot = "events";
constexpr const char* kBatchSuffix = ".parquet";

void check(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw std::runtime_error(context + ": " + status.ToString());
    }
}

template <typename T>
T unwrap(arrow::Result<T> result, const std::string& context) {
    check(result.status(), context);
    return std::move(result).ValueOrDie();
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Extract filename stem from a path string (no directory, no extension)
std::string stem(const std::string& path) {
    auto slash = path.rfind('/');
    std::string filename = (slash == std::string::npos) ? path : path.substr(slash + 1);
    auto dot = filename.rfind('.');
    if (dot == std::string::npos) return filename;
    return filename.substr(0, dot);
}

// Name of the directory holding path, e.g. "0000000003" for ".../0000000003/x.parquet"
std::string parent_name(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos || slash == 0) return "";
    auto parent_slash = path.rfind('/', slash - 1);
    size_t start = (parent_slash == std::string::npos) ? 0 : parent_slash + 1;
    return path.substr(start, slash - start);
}

// Committed batches live in a directory named by their zero-padded first
// version; staging directories carry a suffix and never match.
bool is_slot_name(const std::string& name) {
    return name.size() == 10
        && std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool is_committed_batch(const arrow::fs::FileInfo& file_info) {
    return file_info.type() == arrow::fs::FileType::File
        && ends_with(file_info.path(), kBatchSuffix)
        && is_slot_name(parent_name(file_info.path()));
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "Failed to build column " + column);
    return array;
}

void append_optional(arrow::StringBuilder& builder, const std::optional<std::string>& value) {
    if (value) {
        check(builder.Append(*value), "Failed to append string value");
    } else {
        check(builder.AppendNull(), "Failed to append null value");
    }
}

} // namespace

// Reads one batch file at a time, in path order. Batch filenames are
// zero-padded, so path order is version order within a stream.
class ParquetEventStore::Cursor : public IEventCursor {
public:
    Cursor(const ParquetEventStore& store, std::vector<std::string> paths,
           std::optional<Timestamp> after)
        : store_(store), paths_(std::move(paths)), after_(after) {}

    std::optional<StoredEvent> next() override {
        while (true) {
            while (index_ < buffer_.size()) {
                auto& event = buffer_[index_++];
                if (!after_ || event.timestamp > *after_) return std::move(event);
            }
            if (next_path_ >= paths_.size()) return std::nullopt;
            buffer_ = store_.read_batch(paths_[next_path_++]);
            index_ = 0;
        }
    }

private:
    const ParquetEventStore& store_;
    std::vector<std::string> paths_;
    std::optional<Timestamp> after_;
    size_t next_path_{0};
    std::vector<StoredEvent> buffer_;
    size_t index_{0};
};

ParquetEventStore::ParquetEventStore(std::shared_ptr<arrow::fs::FileSystem> fs)
    : fs_(std::move(fs)) {
    if (!fs_) {
        throw std::invalid_argument("ParquetEventStore requires a filesystem");
    }
}

std::shared_ptr<arrow::fs::FileSystem> ParquetEventStore::make_local_fs(const std::string& root_dir) {
    auto local = std::make_shared<arrow::fs::LocalFileSystem>();
    check(local->CreateDir(root_dir, /*recursive=*/true), "Failed to create data directory " + root_dir);
    return std::make_shared<arrow::fs::SubTreeFileSystem>(root_dir, local);
}

// --- IEventStore ---

std::vector<StoredEvent> ParquetEventStore::append(
    const std::string& aggregate_id, const std::string& aggregate_type,
    const std::vector<UncommittedEvent>& events, uint64_t expected_version,
    const EventMetadata& metadata) {
    if (events.empty()) return {};
    validate_aggregate_id(aggregate_id);

    // Fast rejection; the move below is what actually decides a race.
    auto batches = list_batches(aggregate_id);
    uint64_t actual = batches.empty() ? 0 : batches.back().last_version;
    if (actual != expected_version) {
        throw ConcurrencyError(aggregate_id, expected_version, actual);
    }
    if (!batches.empty()) {
        auto existing = read_batch(batches.front().path);
        if (!existing.empty() && existing.front().aggregate_type != aggregate_type) {
            throw std::invalid_argument("Aggregate " + aggregate_id + " is a "
                                        + existing.front().aggregate_type + ", not a " + aggregate_type);
        }
    }

    auto stored = make_stored_events(aggregate_id, aggregate_type, events, expected_version, metadata);
    uint64_t first = stored.front().version;

    std::string dir = stream_dir(aggregate_id);
    std::string slot = dir + "/" + slot_name(first);
    std::string staging = slot + "." + Uuid::generate().str() + ".tmp";
    check(fs_->CreateDir(staging, /*recursive=*/true), "Failed to create staging directory " + staging);

    try {
        write_batch(staging + "/" + batch_filename(first, stored.back().version), stored);
    } catch (const std::exception&) {
        discard_staging(staging);
        throw;
    }

    auto committed = fs_->Move(staging, slot);
    if (!committed.ok()) {
        discard_staging(staging);
        auto slot_info = unwrap(fs_->GetFileInfo(slot), "Failed to stat " + slot);
        if (slot_info.type() == arrow::fs::FileType::Directory) {
            // another writer claimed version `first` after our check
            throw ConcurrencyError(aggregate_id, expected_version, current_version(aggregate_id));
        }
        check(committed, "Failed to commit batch " + slot);
    }

    return stored;
}

std::optional<EventStream> ParquetEventStore::get_stream(const std::string& aggregate_id) const {
    validate_aggregate_id(aggregate_id);

    auto batches = list_batches(aggregate_id);
    if (batches.empty()) return std::nullopt;

    EventStream stream{aggregate_id, {}, batches.back().last_version};
    for (const auto& batch : batches) {
        auto events = read_batch(batch.path);
        stream.events.insert(stream.events.end(),
                             std::make_move_iterator(events.begin()),
                             std::make_move_iterator(events.end()));
    }
    return stream;
}

std::vector<StoredEvent> ParquetEventStore::get_events_after_version(
    const std::string& aggregate_id, uint64_t version) const {
    validate_aggregate_id(aggregate_id);

    std::vector<StoredEvent> result;
    for (const auto& batch : list_batches(aggregate_id)) {
        // Skip whole files that end at or before the requested version
        if (batch.last_version <= version) continue;
        for (auto& event : read_batch(batch.path)) {
            if (event.version > version) result.push_back(std::move(event));
        }
    }
    return result;
}

std::unique_ptr<IEventCursor> ParquetEventStore::scan_all_events(
    std::optional<Timestamp> after_timestamp) const {
    return std::make_unique<Cursor>(*this, list_all_batch_paths(), after_timestamp);
}

uint64_t ParquetEventStore::current_version(const std::string& aggregate_id) const {
    validate_aggregate_id(aggregate_id);
    auto batches = list_batches(aggregate_id);
    return batches.empty() ? 0 : batches.back().last_version;
}

// --- Listing ---

std::vector<ParquetEventStore::BatchFile> ParquetEventStore::list_batches(
    const std::string& aggregate_id) const {
    arrow::fs::FileSelector selector;
    selector.base_dir = stream_dir(aggregate_id);
    selector.allow_not_found = true;
    selector.recursive = true;
    auto listing = unwrap(fs_->GetFileInfo(selector), "Failed to list " + selector.base_dir);

    std::vector<BatchFile> batches;
    for (const auto& file_info : listing) {
        if (!is_committed_batch(file_info)) continue;

        // Format: {first:010}/{first:010}_{last:010}
        std::string name = stem(file_info.path());
        auto underscore = name.find('_');
        if (underscore == std::string::npos || name.substr(0, underscore) != parent_name(file_info.path())) {
            throw std::runtime_error("Unexpected batch file " + file_info.path());
        }
        try {
            batches.push_back(BatchFile{
                file_info.path(),
                std::stoull(name.substr(0, underscore)),
                std::stoull(name.substr(underscore + 1)),
            });
        } catch (const std::logic_error&) {
            throw std::runtime_error("Unexpected batch file " + file_info.path());
        }
    }

    std::sort(batches.begin(), batches.end(), [](const BatchFile& a, const BatchFile& b) {
        return a.first_version < b.first_version;
    });

    uint64_t expected_first = 1;
    for (const auto& batch : batches) {
        if (batch.first_version != expected_first || batch.last_version < batch.first_version) {
            throw std::runtime_error("Stream " + aggregate_id + " has a version gap at "
                                     + batch.path);
        }
        expected_first = batch.last_version + 1;
    }
    return batches;
}

std::vector<std::string> ParquetEventStore::list_all_batch_paths() const {
    arrow::fs::FileSelector selector;
    selector.base_dir = kEventsRoot;
    selector.allow_not_found = true;
    selector.recursive = true;
    auto listing = unwrap(fs_->GetFileInfo(selector), "Failed to list event files");

    std::vector<std::string> paths;
    for (const auto& file_info : listing) {
        if (is_committed_batch(file_info)) paths.push_back(file_info.path());
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

// --- Parquet read/write ---

void ParquetEventStore::write_batch(const std::string& path, const std::vector<StoredEvent>& events) {
    auto schema = ParquetSchemas::stored_event_schema();

    arrow::StringBuilder aggregate_id_b, aggregate_type_b, event_id_b, event_type_b, event_data_b;
    arrow::StringBuilder correlation_b, causation_b, user_b, trace_b;
    arrow::UInt64Builder version_b;
    arrow::Int64Builder timestamp_b;

    for (const auto& event : events) {
        check(aggregate_id_b.Append(event.aggregate_id), "Failed to append aggregate_id");
        check(aggregate_type_b.Append(event.aggregate_type), "Failed to append aggregate_type");
        check(event_id_b.Append(event.event_id), "Failed to append event_id");
        check(event_type_b.Append(event.event_type), "Failed to append event_type");
        check(event_data_b.Append(event.event_data.dump()), "Failed to append event_data");
        check(correlation_b.Append(event.metadata.correlation_id), "Failed to append correlation_id");
        check(causation_b.Append(event.metadata.causation_id), "Failed to append causation_id");
        append_optional(user_b, event.metadata.user_id);
        append_optional(trace_b, event.metadata.trace_id);
        check(version_b.Append(event.version), "Failed to append version");
        check(timestamp_b.Append(event.timestamp.milliseconds()), "Failed to append timestamp");
    }

    auto table = arrow::Table::Make(schema, {
        finish(aggregate_id_b, "aggregate_id"),
        finish(aggregate_type_b, "aggregate_type"),
        finish(event_id_b, "event_id"),
        finish(event_type_b, "event_type"),
        finish(event_data_b, "event_data"),
        finish(correlation_b, "correlation_id"),
        finish(causation_b, "causation_id"),
        finish(user_b, "user_id"),
        finish(trace_b, "trace_id"),
        finish(version_b, "version"),
        finish(timestamp_b, "timestamp_ms"),
    });

    auto outfile = unwrap(fs_->OpenOutputStream(path), "Failed to open " + path);
    check(::parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                       static_cast<int64_t>(events.size())),
          "Failed to write " + path);
    check(outfile->Close(), "Failed to close " + path);
}

void ParquetEventStore::discard_staging(const std::string& staging_dir) {
    // staging directories are invisible to readers; removal is best effort
    auto status = fs_->DeleteDir(staging_dir);
    if (!status.ok()) {
        std::cerr << "[parquet-store] Could not remove " << staging_dir << ": "
                  << status.ToString() << std::endl;
    }
}

std::vector<StoredEvent> ParquetEventStore::read_batch(const std::string& path) const {
    auto infile = unwrap(fs_->OpenInputFile(path), "Failed to open " + path);
    auto reader = unwrap(::parquet::arrow::FileReader::Make(
                             arrow::default_memory_pool(), ::parquet::ParquetFileReader::Open(infile)),
                         "Failed to read " + path);

    std::shared_ptr<arrow::Table> table;
    check(reader->ReadTable(&table), "Failed to read " + path);

    std::vector<StoredEvent> result;
    if (table->num_rows() == 0) return result;

    if (table->num_columns() != ParquetSchemas::stored_event_schema()->num_fields()) {
        throw std::runtime_error("Unexpected schema in " + path);
    }
    table = unwrap(table->CombineChunks(), "Failed to combine chunks of " + path);

    auto string_column = [&table](int index) {
        return std::static_pointer_cast<arrow::StringArray>(table->column(index)->chunk(0));
    };
    auto aggregate_id = string_column(ParquetSchemas::kAggregateId);
    auto aggregate_type = string_column(ParquetSchemas::kAggregateType);
    auto event_id = string_column(ParquetSchemas::kEventId);
    auto event_type = string_column(ParquetSchemas::kEventType);
    auto event_data = string_column(ParquetSchemas::kEventData);
    auto correlation = string_column(ParquetSchemas::kCorrelationId);
    auto causation = string_column(ParquetSchemas::kCausationId);
    auto user = string_column(ParquetSchemas::kUserId);
    auto trace = string_column(ParquetSchemas::kTraceId);
    auto version = std::static_pointer_cast<arrow::UInt64Array>(
        table->column(ParquetSchemas::kVersion)->chunk(0));
    auto timestamp = std::static_pointer_cast<arrow::Int64Array>(
        table->column(ParquetSchemas::kTimestampMs)->chunk(0));

    result.reserve(static_cast<size_t>(table->num_rows()));
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        EventMetadata metadata{correlation->GetString(i), causation->GetString(i), std::nullopt, std::nullopt};
        if (!user->IsNull(i)) metadata.user_id = user->GetString(i);
        if (!trace->IsNull(i)) metadata.trace_id = trace->GetString(i);

        nlohmann::json data;
        try {
            data = nlohmann::json::parse(event_data->GetString(i));
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Corrupt event_data in " + path + ": " + e.what());
        }

        result.push_back(StoredEvent{
            event_id->GetString(i),
            aggregate_id->GetString(i),
            aggregate_type->GetString(i),
            event_type->GetString(i),
            std::move(data),
            std::move(metadata),
            version->Value(i),
            Timestamp(timestamp->Value(i)),
        });
    }
    return result;
}

// --- Path helpers ---

std::string ParquetEventStore::stream_dir(const std::string& aggregate_id) {
    // Two-character shard keeps directories small; UUIDs spread evenly over it.
    return std::string(kEventsRoot) + "/" + aggregate_id.substr(0, std::min<size_t>(2, aggregate_id.size()))
        + "/" + aggregate_id;
}

std::string ParquetEventStore::slot_name(uint64_t first_version) {
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "%010llu", static_cast<unsigned long long>(first_version));
    return buffer;
}

std::string ParquetEventStore::batch_filename(uint64_t first_version, uint64_t last_version) {
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%010llu_%010llu",
                  static_cast<unsigned long long>(first_version),
                  static_cast<unsigned long long>(last_version));
    return std::string(buffer) + kBatchSuffix;
}

void ParquetEventStore::validate_aggregate_id(const std::string& aggregate_id) {
    if (aggregate_id.empty() || aggregate_id == "." || aggregate_id == ".."
        || aggregate_id.find_first_of("/\\") != std::string::npos) {
        throw std::invalid_argument("Aggregate id is not usable as a path component: '"
                                    + aggregate_id + "'");
    }
}

} // namespace ses::repositories::pq
