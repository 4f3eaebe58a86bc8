#pragma once

#include <cstddef>
#include <string>

namespace ses::config {

struct StorageSettings {
    std::string backend = "memory";       // "memory" or "parquet"
    std::string data_directory = "data";
};

struct DispatchSettings {
    int max_retries = 3;                  // re-fetch-and-retry attempts after a version conflict
};

struct ProjectionSettings {
    std::size_t dead_letter_capacity = 1000;
    bool live_feed = true;
};

struct Settings {
    StorageSettings storage;
    DispatchSettings dispatch;
    ProjectionSettings projection;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace ses::config
