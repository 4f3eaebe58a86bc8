#include "config/Settings.hpp"

#include <cstdlib>
#include <stdexcept>

namespace ses::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    if (s == "true" || s == "1" || s == "yes") return true;
    if (s == "false" || s == "0" || s == "no") return false;
    return fallback;
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("SES_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.storage.backend = env_or("SES_STORAGE_BACKEND", s.storage.backend);
    s.storage.data_directory = env_or("SES_DATA_DIRECTORY", s.storage.data_directory);
    int retries = env_int_or("SES_DISPATCH_MAX_RETRIES", s.dispatch.max_retries);
    if (retries >= 0) {
        s.dispatch.max_retries = retries;
    }

    int capacity = env_int_or("SES_DEAD_LETTER_CAPACITY",
                              static_cast<int>(s.projection.dead_letter_capacity));
    if (capacity > 0) {
        s.projection.dead_letter_capacity = static_cast<std::size_t>(capacity);
    }
    s.projection.live_feed = env_bool_or("SES_LIVE_FEED", s.projection.live_feed);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.storage.data_directory = "data/dev";
    return s;
}

Settings Settings::production() {
    Settings s;
    s.storage.backend = "parquet";
    s.storage.data_directory = "data/prod";
    s.dispatch.max_retries = 5;
    s.projection.dead_letter_capacity = 10000;
    return s;
}

} // namespace ses::config
