/**
 * @file test_channel_image.cpp
 * @brief Unit tests for Core/ChannelImage
 */

#include <gtest/gtest.h>
#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Exception.h>

#include <vector>

using namespace Patho::Morph;

TEST(ChannelImageTest, DefaultIsEmpty) {
    ChannelImage image;
    EXPECT_TRUE(image.Empty());
    EXPECT_EQ(image.Width(), 0);
    EXPECT_EQ(image.Height(), 0);
    EXPECT_DOUBLE_EQ(image.Mean(), 0.0);
}

TEST(ChannelImageTest, ConstructWithFill) {
    ChannelImage image(8, 4, 77);
    EXPECT_FALSE(image.Empty());
    EXPECT_EQ(image.PixelCount(), 32u);
    EXPECT_EQ(image.At(7, 3), 77);
    EXPECT_DOUBLE_EQ(image.Mean(), 77.0);
}

TEST(ChannelImageTest, NegativeDimensionsThrow) {
    EXPECT_THROW(ChannelImage(-1, 4), InvalidArgumentException);
}

TEST(ChannelImageTest, FromDataCopies) {
    std::vector<uint8_t> data = {1, 2, 3, 4, 5, 6};
    ChannelImage image = ChannelImage::FromData(data.data(), 3, 2);
    data[0] = 99;

    EXPECT_EQ(image.At(0, 0), 1);
    EXPECT_EQ(image.At(2, 1), 6);
    EXPECT_EQ(image.RowPtr(1)[0], 4);
}

TEST(ChannelImageTest, FromDataNullThrows) {
    EXPECT_THROW(ChannelImage::FromData(nullptr, 3, 2), InvalidArgumentException);
}

TEST(ChannelImageTest, FillRectIsClipped) {
    ChannelImage image(10, 10, 0);
    image.FillRect(Rect2i(-5, 8, 8, 10), 200);

    EXPECT_EQ(image.At(0, 8), 200);
    EXPECT_EQ(image.At(2, 9), 200);
    EXPECT_EQ(image.At(3, 9), 0);
    EXPECT_EQ(image.At(0, 7), 0);
    EXPECT_DOUBLE_EQ(image.Mean(), 200.0 * 6 / 100.0);
}

TEST(ChannelImageTest, SetAtAndContains) {
    ChannelImage image(4, 4);
    image.SetAt(3, 2, 9);
    EXPECT_EQ(image.At(3, 2), 9);
    EXPECT_TRUE(image.Contains(3, 3));
    EXPECT_FALSE(image.Contains(4, 0));
    EXPECT_FALSE(image.Contains(0, -1));
}
