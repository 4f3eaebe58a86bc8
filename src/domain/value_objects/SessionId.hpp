#pragma once

#include <compare>
#include <string>

namespace ses::domain {

class SessionId {
public:
    static SessionId generate();

    // Throws InvalidSessionIdError unless value is a UUID.
    static SessionId from_string(const std::string& value);

    const std::string& value() const noexcept { return value_; }

    bool operator==(const SessionId&) const = default;
    auto operator<=>(const SessionId&) const = default;

private:
    explicit SessionId(std::string value);

    std::string value_;
};

} // namespace ses::domain
