#pragma once

#include <compare>
#include <string>

namespace ses::domain {

// RFC 4122 identifier. generate() yields the canonical lowercase form.
class Uuid {
public:
    static Uuid generate();
    static bool is_valid(const std::string& str) noexcept;

    const std::string& str() const noexcept { return value_; }

    bool operator==(const Uuid&) const = default;
    auto operator<=>(const Uuid&) const = default;

private:
    explicit Uuid(std::string value);

    std::string value_;
};

} // namespace ses::domain
