#include "domain/value_objects/MessageContent.hpp"

#include "domain/errors/DomainErrors.hpp"

namespace ses::domain {

namespace {

constexpr const char* kWhitespace = " \t\n\r\f\v";

std::size_t count_code_points(const std::string& text) noexcept {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

} // namespace

MessageContent::MessageContent(std::string text) : text_(std::move(text)) {}

MessageContent MessageContent::create(const std::string& text) {
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        throw EmptyMessageError();
    }
    auto last = text.find_last_not_of(kWhitespace);
    std::string trimmed = text.substr(first, last - first + 1);

    auto length = count_code_points(trimmed);
    if (length > kMaxLength) {
        throw MessageTooLongError(length, kMaxLength);
    }
    return MessageContent(std::move(trimmed));
}

std::size_t MessageContent::length() const noexcept {
    return count_code_points(text_);
}

} // namespace ses::domain
