#include "domain/errors/DomainErrors.hpp"
#include "domain/value_objects/MessageContent.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace ses::domain;

TEST(MessageContent, TrimsSurroundingWhitespace) {
    auto content = MessageContent::create("  hello world \n");
    EXPECT_EQ(content.text(), "hello world");
    EXPECT_EQ(content.length(), 11u);
}

TEST(MessageContent, RejectsEmptyAndBlankText) {
    EXPECT_THROW(MessageContent::create(""), EmptyMessageError);
    EXPECT_THROW(MessageContent::create(" \t\r\n"), EmptyMessageError);
}

TEST(MessageContent, AcceptsTextAtMaximumLength) {
    std::string text(MessageContent::kMaxLength, 'a');
    EXPECT_EQ(MessageContent::create(text).length(), MessageContent::kMaxLength);
}

TEST(MessageContent, RejectsTextOverMaximumLength) {
    std::string text(MessageContent::kMaxLength + 1, 'a');
    EXPECT_THROW(MessageContent::create(text), MessageTooLongError);
}

TEST(MessageContent, CountsCodePointsNotBytes) {
    // "héllo" is 6 bytes but 5 characters
    auto content = MessageContent::create("h\xC3\xA9llo");
    EXPECT_EQ(content.text().size(), 6u);
    EXPECT_EQ(content.length(), 5u);
}
