/**
 * @file test_validate.cpp
 * @brief Unit tests for Core/Validate and the exception hierarchy
 */

#include <gtest/gtest.h>
#include <PathoMorph/Core/Validate.h>

#include <string>
#include <vector>

using namespace Patho::Morph;

TEST(ValidateTest, ValidBufferPasses) {
    std::vector<uint8_t> data(4 * 3 * 4, 255);
    PixelBuffer buffer(data.data(), 4, 3, data.size());
    EXPECT_TRUE(buffer.IsValid());
    EXPECT_NO_THROW(Validate::RequirePixelBuffer(buffer, "Test"));
}

TEST(ValidateTest, NullBufferThrows) {
    PixelBuffer buffer(nullptr, 4, 4, 64);
    EXPECT_FALSE(buffer.IsValid());
    EXPECT_THROW(Validate::RequirePixelBuffer(buffer, "Test"), InvalidInputException);
}

TEST(ValidateTest, ZeroDimensionThrows) {
    std::vector<uint8_t> data(16, 0);
    PixelBuffer buffer(data.data(), 0, 4, data.size());
    EXPECT_THROW(Validate::RequirePixelBuffer(buffer, "Test"), InvalidInputException);
}

TEST(ValidateTest, ShortBufferThrows) {
    std::vector<uint8_t> data(4 * 4 * 4 - 1, 0);
    PixelBuffer buffer(data.data(), 4, 4, data.size());
    EXPECT_THROW(Validate::RequirePixelBuffer(buffer, "Test"), InvalidInputException);
}

TEST(ValidateTest, OversizedBufferThrows) {
    // 100x60 pixels declared as 100x50
    std::vector<uint8_t> data(100 * 60 * 4, 0);
    PixelBuffer buffer(data.data(), 100, 50, data.size());
    EXPECT_FALSE(buffer.IsValid());
    EXPECT_THROW(Validate::RequirePixelBuffer(buffer, "Test"), InvalidInputException);
}

TEST(ValidateTest, MessageCarriesPrefixAndFunction) {
    PixelBuffer buffer;
    try {
        Validate::RequirePixelBuffer(buffer, "Decode");
        FAIL() << "expected InvalidInputException";
    } catch (const InvalidInputException& e) {
        std::string message = e.what();
        EXPECT_EQ(message.rfind("Invalid input: Decode", 0), 0u) << message;
    }
}

TEST(ValidateTest, SizeMismatchThrows) {
    ChannelImage a(4, 4);
    ChannelImage b(4, 5);
    EXPECT_THROW(Validate::RequireSameSize(a, b, "Test"), InvalidInputException);
    EXPECT_NO_THROW(Validate::RequireSameSize(a, a, "Test"));
}

TEST(ValidateTest, EmptyChannelThrows) {
    EXPECT_THROW(Validate::RequireChannel(ChannelImage(), "Test"), InvalidInputException);
}

TEST(ValidateTest, ExceptionHierarchy) {
    EXPECT_THROW(throw ConfigurationException("x"), Exception);
    EXPECT_THROW(throw InvalidInputException("x"), std::runtime_error);
    EXPECT_STREQ(ConfigurationException("weights").what(), "Configuration error: weights");
}

TEST(ValidateTest, RangeChecks) {
    EXPECT_NO_THROW(Validate::RequireRange(5, 0, 10, "value", "Test"));
    EXPECT_THROW(Validate::RequireRange(11, 0, 10, "value", "Test"), InvalidArgumentException);
    EXPECT_THROW(Validate::RequireNonNegative(-1.0, "value", "Test"), InvalidArgumentException);
    EXPECT_THROW(Validate::RequireFiniteConfig(std::nan(""), "value", "Test"), ConfigurationException);
}
