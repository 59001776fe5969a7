#pragma once

/**
 * @file ChannelImage.h
 * @brief Single-channel 8-bit intensity image
 *
 * Holds one stain (or enhanced) channel. Storage is contiguous row-major
 * with stride == width. Copies are deep.
 */

#include <PathoMorph/Core/Export.h>
#include <PathoMorph/Core/Types.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Patho::Morph {

class PATHOMORPH_API ChannelImage {
public:
    /// Create an empty image
    ChannelImage() = default;

    /**
     * @brief Create an image filled with a constant value
     * @param width Width in pixels (>= 0)
     * @param height Height in pixels (>= 0)
     * @param fill Initial pixel value
     * @throws InvalidArgumentException on negative dimensions
     */
    ChannelImage(int32_t width, int32_t height, uint8_t fill = 0);

    /**
     * @brief Create an image by copying row-major bytes
     * @throws InvalidArgumentException if data is null or dimensions are negative
     */
    static ChannelImage FromData(const uint8_t* data, int32_t width, int32_t height);

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }
    size_t PixelCount() const { return data_.size(); }
    bool Empty() const { return data_.empty(); }

    uint8_t* Data() { return data_.data(); }
    const uint8_t* Data() const { return data_.data(); }

    uint8_t* RowPtr(int32_t y) { return data_.data() + static_cast<size_t>(y) * width_; }
    const uint8_t* RowPtr(int32_t y) const {
        return data_.data() + static_cast<size_t>(y) * width_;
    }

    /// Unchecked pixel access
    uint8_t At(int32_t x, int32_t y) const { return data_[static_cast<size_t>(y) * width_ + x]; }
    void SetAt(int32_t x, int32_t y, uint8_t value) {
        data_[static_cast<size_t>(y) * width_ + x] = value;
    }

    bool Contains(int32_t x, int32_t y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    /// Fill a rectangle (clipped to the image) with a constant value
    void FillRect(const Rect2i& rect, uint8_t value);

    /// Arithmetic mean of all pixels, 0 for an empty image
    double Mean() const;

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<uint8_t> data_;
};

} // namespace Patho::Morph
