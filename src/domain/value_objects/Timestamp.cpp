#include "domain/value_objects/Timestamp.hpp"

#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace ses::domain {

namespace {

constexpr int64_t kMillisPerDay = 86'400'000;

int parse_digits(const std::string& str, std::size_t pos, std::size_t count) {
    if (pos + count > str.size()) {
        throw std::invalid_argument("Truncated ISO-8601 timestamp: " + str);
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        char c = str[i];
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid ISO-8601 timestamp: " + str);
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

void expect_char(const std::string& str, std::size_t pos, char expected) {
    if (pos >= str.size() || str[pos] != expected) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + str);
    }
}

} // namespace

Timestamp::Timestamp(int64_t milliseconds_since_epoch) : ms_(milliseconds_since_epoch) {
    if (milliseconds_since_epoch < 0) {
        throw std::out_of_range(
            "Timestamp must be non-negative, got: " + std::to_string(milliseconds_since_epoch));
    }
}

Timestamp Timestamp::now() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

Timestamp Timestamp::from_iso8601(const std::string& str) {
    using namespace std::chrono;

    int y = parse_digits(str, 0, 4);
    expect_char(str, 4, '-');
    int mo = parse_digits(str, 5, 2);
    expect_char(str, 7, '-');
    int d = parse_digits(str, 8, 2);
    if (str.size() <= 10 || (str[10] != 'T' && str[10] != 't' && str[10] != ' ')) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + str);
    }
    int hh = parse_digits(str, 11, 2);
    expect_char(str, 13, ':');
    int mm = parse_digits(str, 14, 2);
    expect_char(str, 16, ':');
    int ss = parse_digits(str, 17, 2);

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || hh > 23 || mm > 59 || ss > 60) {
        throw std::invalid_argument("Out-of-range ISO-8601 timestamp: " + str);
    }

    std::size_t pos = 19;
    int64_t fraction_ms = 0;
    if (pos < str.size() && str[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
            if (digits < 3) {
                fraction_ms = fraction_ms * 10 + (str[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            throw std::invalid_argument("Invalid ISO-8601 fraction: " + str);
        }
        for (int i = digits; i < 3; ++i) {
            fraction_ms *= 10;
        }
    }

    int64_t offset_ms = 0;
    if (pos < str.size()) {
        char zone = str[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int oh = parse_digits(str, pos + 1, 2);
            expect_char(str, pos + 3, ':');
            int om = parse_digits(str, pos + 4, 2);
            offset_ms = (static_cast<int64_t>(oh) * 60 + om) * 60'000;
            if (zone == '-') offset_ms = -offset_ms;
            pos += 6;
        }
    }
    if (pos != str.size()) {
        throw std::invalid_argument("Trailing characters in ISO-8601 timestamp: " + str);
    }

    int64_t days_since_epoch = sys_days{ymd}.time_since_epoch().count();
    int64_t ms = days_since_epoch * kMillisPerDay
        + ((static_cast<int64_t>(hh) * 60 + mm) * 60 + ss) * 1000
        + fraction_ms - offset_ms;
    if (ms < 0) {
        throw std::invalid_argument("ISO-8601 timestamp before the epoch: " + str);
    }
    return Timestamp(ms);
}

std::string Timestamp::to_iso8601() const {
    using namespace std::chrono;

    int64_t days_since_epoch = ms_ / kMillisPerDay;
    int64_t ms_of_day = ms_ % kMillisPerDay;
    year_month_day ymd{sys_days{days{days_since_epoch}}};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(ms_of_day / 3'600'000),
                  static_cast<int>((ms_of_day / 60'000) % 60),
                  static_cast<int>((ms_of_day / 1000) % 60),
                  static_cast<int>(ms_of_day % 1000));
    return buf;
}

std::string Timestamp::date_string() const {
    return to_iso8601().substr(0, 10);
}

} // namespace ses::domain
