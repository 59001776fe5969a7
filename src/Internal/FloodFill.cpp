/**
 * @file FloodFill.cpp
 * @brief Explicit-stack flood fill
 */

#include <PathoMorph/Internal/FloodFill.h>

namespace Patho::Morph::Internal {

namespace {

constexpr int32_t DX4[4] = {1, -1, 0, 0};
constexpr int32_t DY4[4] = {0, 0, 1, -1};

constexpr int32_t DX8[8] = {1, -1, 0, 0, 1, 1, -1, -1};
constexpr int32_t DY8[8] = {0, 0, 1, -1, 1, -1, 1, -1};

} // anonymous namespace

FloodFillResult FloodFill(const ChannelImage& channel,
                          std::vector<uint8_t>& visited,
                          const Point2i& seed,
                          int32_t threshold,
                          Connectivity connectivity,
                          int64_t maxPixels) {
    FloodFillResult result;

    const int32_t width = channel.Width();
    const int32_t height = channel.Height();

    if (!channel.Contains(seed.x, seed.y)) return result;
    size_t seedIdx = static_cast<size_t>(seed.y) * width + seed.x;
    if (visited[seedIdx] || channel.At(seed.x, seed.y) <= threshold) return result;

    const int32_t* dx = (connectivity == Connectivity::Eight) ? DX8 : DX4;
    const int32_t* dy = (connectivity == Connectivity::Eight) ? DY8 : DY4;
    const int32_t numNeighbors = (connectivity == Connectivity::Eight) ? 8 : 4;

    std::vector<Point2i> stack;
    stack.push_back(seed);
    visited[seedIdx] = 1;

    while (!stack.empty()) {
        if (static_cast<int64_t>(result.pixels.size()) >= maxPixels) {
            result.truncated = true;
            for (const auto& p : stack) {
                visited[static_cast<size_t>(p.y) * width + p.x] = 0;
            }
            break;
        }

        Point2i p = stack.back();
        stack.pop_back();
        result.pixels.push_back(p);

        for (int32_t k = 0; k < numNeighbors; ++k) {
            int32_t nx = p.x + dx[k];
            int32_t ny = p.y + dy[k];
            if (nx < 0 || ny < 0 || nx >= width || ny >= height) continue;

            size_t idx = static_cast<size_t>(ny) * width + nx;
            if (visited[idx]) continue;
            if (channel.At(nx, ny) <= threshold) continue;

            visited[idx] = 1;
            stack.emplace_back(nx, ny);
        }
    }

    return result;
}

} // namespace Patho::Morph::Internal
