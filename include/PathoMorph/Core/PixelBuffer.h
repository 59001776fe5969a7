#pragma once

/**
 * @file PixelBuffer.h
 * @brief Non-owning view of a decoded RGBA bitmap
 *
 * The buffer is supplied by the caller (decoder, canvas, file loader) and is
 * never modified by the pipeline. Layout is row-major, 4 bytes per pixel,
 * no row padding.
 */

#include <PathoMorph/Core/Export.h>

#include <cstddef>
#include <cstdint>

namespace Patho::Morph {

class PATHOMORPH_API PixelBuffer {
public:
    static constexpr int32_t BYTES_PER_PIXEL = 4;

    PixelBuffer() = default;

    /**
     * @brief Wrap caller-owned RGBA memory
     * @param data Pointer to width*height*4 bytes
     * @param width Width in pixels
     * @param height Height in pixels
     * @param byteCount Number of bytes at data, must equal width*height*4
     */
    PixelBuffer(const uint8_t* data, int32_t width, int32_t height, size_t byteCount)
        : data_(data), width_(width), height_(height), byteCount_(byteCount) {}

    const uint8_t* Data() const { return data_; }
    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }
    size_t ByteCount() const { return byteCount_; }

    size_t PixelCount() const {
        return static_cast<size_t>(width_ > 0 ? width_ : 0) *
               static_cast<size_t>(height_ > 0 ? height_ : 0);
    }

    const uint8_t* PixelPtr(int32_t x, int32_t y) const {
        return data_ + (static_cast<size_t>(y) * width_ + x) * BYTES_PER_PIXEL;
    }

    /**
     * @brief Check the view describes a usable bitmap
     *
     * Requires non-null data, positive dimensions and exactly
     * width*height*4 bytes.
     */
    bool IsValid() const {
        return data_ != nullptr && width_ > 0 && height_ > 0 &&
               byteCount_ == PixelCount() * BYTES_PER_PIXEL;
    }

private:
    const uint8_t* data_ = nullptr;
    int32_t width_ = 0;
    int32_t height_ = 0;
    size_t byteCount_ = 0;
};

} // namespace Patho::Morph
