#include "domain/value_objects/Uuid.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <random>
#include <stdexcept>

namespace ses::domain {

namespace {

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

std::mt19937_64& generator() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

} // namespace

Uuid::Uuid(std::string value) : value_(std::move(value)) {}

Uuid Uuid::generate() {
    std::array<uint8_t, 16> bytes{};
    auto& engine = generator();
    uint64_t hi = engine();
    uint64_t lo = engine();
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(hi >> (8 * i));
        bytes[8 + i] = static_cast<uint8_t>(lo >> (8 * i));
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return Uuid(std::move(out));
}

// 8-4-4-4-12 hex groups, version 1-5, variant 8/9/a/b
bool Uuid::is_valid(const std::string& str) noexcept {
    if (str.size() != 36) return false;
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (str[i] != '-') return false;
        } else if (!is_hex(str[i])) {
            return false;
        }
    }
    if (str[14] < '1' || str[14] > '5') return false;
    char variant = static_cast<char>(std::tolower(static_cast<unsigned char>(str[19])));
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

} // namespace ses::domain
