#pragma once

#include <cstddef>
#include <string>

namespace ses::domain {

class MessageContent {
public:
    static constexpr std::size_t kMaxLength = 100'000;

    // Trims surrounding whitespace, then rejects empty or over-long text.
    static MessageContent create(const std::string& text);

    const std::string& text() const noexcept { return text_; }

    // Length in Unicode code points.
    std::size_t length() const noexcept;

    bool operator==(const MessageContent&) const = default;

private:
    explicit MessageContent(std::string text);

    std::string text_;
};

} // namespace ses::domain
