/**
 * @file Morphometry.cpp
 * @brief Per-region shape and intensity measurements
 */

#include <PathoMorph/Measure/Morphometry.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Internal/RegionFeatures.h>
#include <PathoMorph/Platform/Thread.h>

#include <algorithm>

namespace Patho::Morph::Measure {

namespace {

RegionMorphometry MeasureShape(const Region& region) {
    RegionMorphometry m;
    m.area = static_cast<int64_t>(region.pixels.size());
    m.truncated = region.truncated;
    if (region.pixels.empty()) {
        return m;
    }

    m.centroid = Internal::ComputeCentroid(region.pixels);
    m.boundingBox = Internal::ComputeBoundingBox(region.pixels);
    m.perimeter = region.perimeter > 0 ? region.perimeter
                                       : Internal::ComputeEdgePerimeter(region.pixels);
    m.hull = Internal::ComputeConvexHull(region.pixels);
    m.hullArea = Internal::ComputePolygonArea(m.hull);
    m.shapeComplexity = Internal::ComputeShapeComplexity(static_cast<double>(m.area), m.hullArea);
    m.circularity = Internal::ComputeCircularity(static_cast<double>(m.area),
                                                 static_cast<double>(m.perimeter));

    int32_t longSide = std::max(m.boundingBox.width, m.boundingBox.height);
    int32_t shortSide = std::min(m.boundingBox.width, m.boundingBox.height);
    m.elongation = shortSide > 0 ? static_cast<double>(longSide) / shortSide : 1.0;
    return m;
}

} // anonymous namespace

double MeanIntensity(const std::vector<Point2i>& pixels, const ChannelImage& channel) {
    if (pixels.empty()) return 0.0;

    uint64_t sum = 0;
    for (const auto& p : pixels) {
        if (!channel.Contains(p.x, p.y)) {
            throw InvalidArgumentException("MeanIntensity: pixel (" + std::to_string(p.x) + ", " +
                                           std::to_string(p.y) + ") outside channel");
        }
        sum += channel.At(p.x, p.y);
    }
    return static_cast<double>(sum) / (255.0 * static_cast<double>(pixels.size()));
}

RegionMorphometry MorphometricAnalyzer::Analyze(const Region& region) const {
    RegionMorphometry m = MeasureShape(region);
    m.meanIntensity = std::clamp(region.meanIntensity / 255.0, 0.0, 1.0);
    return m;
}

RegionMorphometry MorphometricAnalyzer::Analyze(const Region& region,
                                                const ChannelImage& intensity) const {
    RegionMorphometry m = MeasureShape(region);
    m.meanIntensity = MeanIntensity(region.pixels, intensity);
    return m;
}

std::vector<RegionMorphometry> MorphometricAnalyzer::AnalyzeAll(
    const std::vector<Region>& regions) const {
    std::vector<RegionMorphometry> results(regions.size());
    Platform::ParallelFor(0, regions.size(), [&](size_t i) {
        results[i] = Analyze(regions[i]);
    });
    return results;
}

std::vector<RegionMorphometry> MorphometricAnalyzer::AnalyzeAll(
    const std::vector<Region>& regions, const ChannelImage& intensity) const {
    std::vector<RegionMorphometry> results(regions.size());
    Platform::ParallelFor(0, regions.size(), [&](size_t i) {
        results[i] = Analyze(regions[i], intensity);
    });
    return results;
}

} // namespace Patho::Morph::Measure
