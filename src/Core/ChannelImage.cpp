/**
 * @file ChannelImage.cpp
 * @brief Single-channel image implementation
 */

#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Exception.h>

#include <algorithm>
#include <cstring>
#include <numeric>
#include <string>

namespace Patho::Morph {

ChannelImage::ChannelImage(int32_t width, int32_t height, uint8_t fill) {
    if (width < 0 || height < 0) {
        throw InvalidArgumentException("ChannelImage: negative dimensions " +
                                       std::to_string(width) + "x" + std::to_string(height));
    }
    width_ = width;
    height_ = height;
    data_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), fill);
}

ChannelImage ChannelImage::FromData(const uint8_t* data, int32_t width, int32_t height) {
    if (data == nullptr) {
        throw InvalidArgumentException("ChannelImage::FromData: data is null");
    }
    ChannelImage image(width, height);
    if (!image.data_.empty()) {
        std::memcpy(image.data_.data(), data, image.data_.size());
    }
    return image;
}

void ChannelImage::FillRect(const Rect2i& rect, uint8_t value) {
    int32_t x0 = std::max(rect.x, 0);
    int32_t y0 = std::max(rect.y, 0);
    int32_t x1 = std::min(rect.x + rect.width, width_);
    int32_t y1 = std::min(rect.y + rect.height, height_);
    if (x0 >= x1 || y0 >= y1) return;

    for (int32_t y = y0; y < y1; ++y) {
        std::memset(RowPtr(y) + x0, value, static_cast<size_t>(x1 - x0));
    }
}

double ChannelImage::Mean() const {
    if (data_.empty()) return 0.0;
    uint64_t sum = std::accumulate(data_.begin(), data_.end(), uint64_t{0});
    return static_cast<double>(sum) / static_cast<double>(data_.size());
}

} // namespace Patho::Morph
