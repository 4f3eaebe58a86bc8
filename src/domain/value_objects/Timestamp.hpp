#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace ses::domain {

class Timestamp {
public:
    explicit Timestamp(int64_t milliseconds_since_epoch);

    static Timestamp now();

    // Accepts "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)".
    // Fractions beyond milliseconds are truncated.
    static Timestamp from_iso8601(const std::string& str);

    int64_t milliseconds() const noexcept { return ms_; }

    // UTC, always with milliseconds: "2025-06-20T14:02:26.322Z"
    std::string to_iso8601() const;
    std::string date_string() const;

    bool operator==(const Timestamp&) const = default;
    auto operator<=>(const Timestamp&) const = default;

private:
    int64_t ms_;
};

} // namespace ses::domain
