/**
 * @file Scorers.cpp
 * @brief Catalog scorer implementations
 */

#include <PathoMorph/Grading/Scorers.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Core/Validate.h>
#include <PathoMorph/Texture/Texture.h>

#include <algorithm>
#include <cmath>

namespace Patho::Morph::Grading {

namespace {

void RequireContext(const ScoringContext& context, const char* funcName) {
    Validate::RequireChannel(context.hematoxylin, funcName);
    Validate::RequireChannel(context.eosin, funcName);
    Validate::RequireSameSize(context.hematoxylin, context.eosin, funcName);
}

// Coefficient of variation (stddev / mean); 0 when the mean is 0
double CoefficientOfVariation(const std::vector<double>& values) {
    Texture::TextureStats stats = Texture::ComputeTextureStats(values);
    return stats.mean > 0.0 ? stats.stddev / stats.mean : 0.0;
}

double Mean(const std::vector<double>& values) {
    return Texture::ComputeTextureStats(values).mean;
}

double Variance(const std::vector<double>& values) {
    return Texture::ComputeTextureStats(values).variance;
}

// Pixels above threshold in a square window around a centroid
int64_t CountAbove(const ChannelImage& channel, const Point2d& center, int32_t radius,
                   int32_t threshold) {
    int32_t cx = static_cast<int32_t>(std::lround(center.x));
    int32_t cy = static_cast<int32_t>(std::lround(center.y));
    int32_t x0 = std::max(cx - radius, 0);
    int32_t y0 = std::max(cy - radius, 0);
    int32_t x1 = std::min(cx + radius, channel.Width() - 1);
    int32_t y1 = std::min(cy + radius, channel.Height() - 1);

    int64_t count = 0;
    for (int32_t y = y0; y <= y1; ++y) {
        const uint8_t* row = channel.RowPtr(y);
        for (int32_t x = x0; x <= x1; ++x) {
            if (row[x] > threshold) ++count;
        }
    }
    return count;
}

} // anonymous namespace

// =============================================================================
// NuclearMorphometryScorer
// =============================================================================

NuclearMorphometryScorer::NuclearMorphometryScorer(InterpretationTable bands,
                                                   const NuclearMorphometryParams& params)
    : FeatureScorer(std::move(bands))
    , params_(params) {
    if (params_.minNuclei < 1 || params_.cytoplasmRadius < 1) {
        throw ConfigurationException("NuclearMorphometryScorer: minNuclei and cytoplasmRadius must be >= 1");
    }
}

AlgorithmResult NuclearMorphometryScorer::Score(const ScoringContext& context) const {
    RequireContext(context, "NuclearMorphometryScorer::Score");

    const auto& nuclei = context.nuclei;
    const int64_t count = static_cast<int64_t>(nuclei.size());
    if (count < params_.minNuclei) {
        return MakeInsufficient(DEFAULT_SCORE, DEFAULT_CONFIDENCE, count, params_.minNuclei);
    }

    std::vector<double> areas;
    std::vector<double> intensities;
    std::vector<double> complexities;
    std::vector<double> ncRatios;
    areas.reserve(nuclei.size());
    intensities.reserve(nuclei.size());
    int64_t withHull = 0;

    for (const auto& n : nuclei) {
        areas.push_back(static_cast<double>(n.area));
        intensities.push_back(n.meanIntensity);
        if (!n.hull.empty()) {
            complexities.push_back(n.shapeComplexity);
            ++withHull;
        }

        int64_t cytoplasm = CountAbove(context.eosin, n.centroid, params_.cytoplasmRadius,
                                       params_.cytoplasmThreshold);
        double ratio = cytoplasm > 0 ? static_cast<double>(n.area) / cytoplasm : 1.0;
        ncRatios.push_back(std::min(ratio, 1.0));
    }

    double complexity = Mean(complexities);
    double sizeCV = std::min(CoefficientOfVariation(areas), 1.0);
    double intensityCV = std::min(CoefficientOfVariation(intensities), 1.0);
    double pleomorphism = std::min((sizeCV + intensityCV) / 2.0, 1.0);
    double ncRatio = Mean(ncRatios);

    double score = 0.3 * complexity + 0.3 * pleomorphism + 0.2 * ncRatio + 0.2 * sizeCV;

    double hullConfidence = withHull > 10 ? 0.8 : 0.5;
    double pleoConfidence = pleomorphism > 0.1 ? 0.8 : 0.4;
    double confidence = std::min((hullConfidence + pleoConfidence) / 2.0 + 0.1, 0.95);

    FeatureVector features;
    features.Set("nucleus_count", static_cast<double>(count));
    features.Set("mean_area", Mean(areas));
    features.Set("shape_complexity", complexity);
    features.Set("pleomorphism", pleomorphism);
    features.Set("nc_ratio", ncRatio);
    features.Set("size_cv", sizeCV);
    features.Set("intensity_cv", intensityCV);

    return MakeResult(score, confidence, std::move(features), count);
}

// =============================================================================
// ArchitecturalPatternScorer
// =============================================================================

ArchitecturalPatternScorer::ArchitecturalPatternScorer(InterpretationTable bands,
                                                       const ArchitecturalPatternParams& params)
    : FeatureScorer(std::move(bands))
    , params_(params) {
    if (params_.windowSize < 2 || params_.minDenseWindows < 1) {
        throw ConfigurationException("ArchitecturalPatternScorer: windowSize must be >= 2 and minDenseWindows >= 1");
    }
}

AlgorithmResult ArchitecturalPatternScorer::Score(const ScoringContext& context) const {
    RequireContext(context, "ArchitecturalPatternScorer::Score");

    const ChannelImage& hema = context.hematoxylin;
    std::vector<double> densities =
        Texture::WindowDensitySamples(hema, params_.windowSize, params_.densityThreshold);

    std::vector<double> dense;
    for (double d : densities) {
        if (d > params_.denseFraction) dense.push_back(d);
    }

    const int64_t denseCount = static_cast<int64_t>(dense.size());
    if (denseCount < params_.minDenseWindows) {
        return MakeInsufficient(DEFAULT_SCORE, DEFAULT_CONFIDENCE, denseCount,
                                params_.minDenseWindows);
    }

    double density = std::min(Mean(dense), 1.0);

    Texture::TextureStats texture =
        Texture::ComputeTextureStats(Texture::WindowMeanSamples(hema, params_.windowSize));

    // Lumen: unstained in both channels
    int64_t lumen = 0;
    for (int32_t y = 0; y < hema.Height(); ++y) {
        const uint8_t* h = hema.RowPtr(y);
        const uint8_t* e = context.eosin.RowPtr(y);
        for (int32_t x = 0; x < hema.Width(); ++x) {
            if (h[x] < params_.lumenThreshold && e[x] < params_.lumenThreshold) ++lumen;
        }
    }
    double lumenFraction = static_cast<double>(lumen) / static_cast<double>(hema.PixelCount());

    Texture::TextureStats gradient =
        Texture::ComputeTextureStats(Texture::WindowGradientSamples(hema, params_.windowSize));
    double regularity = 1.0 - std::min(2.0 * gradient.stddev, 1.0);
    double organization = std::clamp((lumenFraction + regularity) / 2.0, 0.0, 1.0);

    auto quadrants = Texture::QuadrantMeans(hema);
    double spatial = std::clamp(1.0 - Variance(std::vector<double>(quadrants.begin(), quadrants.end())), 0.0, 1.0);

    double score = 0.3 * density + 0.25 * texture.textureScore + 0.25 * organization + 0.2 * spatial;

    double textureConfidence = denseCount >= 2 * params_.minDenseWindows ? 0.8 : 0.6;
    double organizationConfidence = densities.size() >= 16 ? 0.7 : 0.5;
    double confidence = std::min((textureConfidence + organizationConfidence) / 2.0 + 0.1, 0.95);

    FeatureVector features;
    features.Set("dense_windows", static_cast<double>(denseCount));
    features.Set("cell_density", density);
    features.Set("texture_score", texture.textureScore);
    features.Set("texture_homogeneity", texture.homogeneity);
    features.Set("lumen_fraction", lumenFraction);
    features.Set("organization", organization);
    features.Set("spatial_distribution", spatial);

    return MakeResult(score, confidence, std::move(features), denseCount);
}

// =============================================================================
// MitoticActivityScorer
// =============================================================================

MitoticActivityScorer::MitoticActivityScorer(InterpretationTable bands,
                                             const MitoticActivityParams& params)
    : FeatureScorer(std::move(bands))
    , params_(params) {
    if (params_.minNuclei < 1 || params_.maxCandidateArea < params_.minCandidateArea ||
        !(params_.pixelsPerMm > 0.0) || !(params_.hpfAreaMm2 > 0.0) ||
        !(params_.referenceCountPer10Hpf > 0.0)) {
        throw ConfigurationException("MitoticActivityScorer: invalid parameters");
    }
}

AlgorithmResult MitoticActivityScorer::Score(const ScoringContext& context) const {
    RequireContext(context, "MitoticActivityScorer::Score");

    const auto& nuclei = context.nuclei;
    const int64_t count = static_cast<int64_t>(nuclei.size());
    if (count < params_.minNuclei) {
        return MakeInsufficient(DEFAULT_SCORE, DEFAULT_CONFIDENCE, count, params_.minNuclei);
    }

    std::vector<double> candidateIntensities;
    for (const auto& n : nuclei) {
        if (n.area >= params_.minCandidateArea && n.area <= params_.maxCandidateArea &&
            n.meanIntensity >= params_.minCandidateIntensity &&
            n.shapeComplexity >= params_.minCandidateComplexity) {
            candidateIntensities.push_back(n.meanIntensity);
        }
    }
    const double candidates = static_cast<double>(candidateIntensities.size());

    double hpfPixels = params_.hpfAreaMm2 * params_.pixelsPerMm * params_.pixelsPerMm;
    double imageHpf = static_cast<double>(context.hematoxylin.PixelCount()) / hpfPixels;
    double per10Hpf = candidates / imageHpf * 10.0;

    double densityTerm = std::min(per10Hpf / params_.referenceCountPer10Hpf, 1.0);
    double fraction = candidates / static_cast<double>(count);
    double intensity = Mean(candidateIntensities);

    double score = 0.4 * densityTerm + 0.3 * fraction + 0.3 * intensity;
    double confidence = std::min(0.5 + 0.4 * std::min(static_cast<double>(count) / 50.0, 1.0), 0.95);

    FeatureVector features;
    features.Set("nucleus_count", static_cast<double>(count));
    features.Set("candidate_count", candidates);
    features.Set("count_per_10_hpf", per10Hpf);
    features.Set("candidate_fraction", fraction);
    features.Set("candidate_intensity", intensity);

    return MakeResult(score, confidence, std::move(features), count);
}

// =============================================================================
// StromalPatternScorer
// =============================================================================

StromalPatternScorer::StromalPatternScorer(InterpretationTable bands,
                                           const StromalPatternParams& params)
    : FeatureScorer(std::move(bands))
    , params_(params) {
    if (params_.minRegions < 1 || params_.windowSize < 1) {
        throw ConfigurationException("StromalPatternScorer: minRegions and windowSize must be >= 1");
    }
}

AlgorithmResult StromalPatternScorer::Score(const ScoringContext& context) const {
    RequireContext(context, "StromalPatternScorer::Score");

    const auto& stroma = context.stroma;
    const int64_t count = static_cast<int64_t>(stroma.size());
    if (count < params_.minRegions) {
        return MakeInsufficient(DEFAULT_SCORE, DEFAULT_CONFIDENCE, count, params_.minRegions);
    }

    int64_t stromalArea = 0;
    std::vector<double> complexities;
    complexities.reserve(stroma.size());
    for (const auto& region : stroma) {
        stromalArea += region.area;
        complexities.push_back(region.shapeComplexity);
    }

    double areaFraction = std::min(
        static_cast<double>(stromalArea) / static_cast<double>(context.eosin.PixelCount()), 1.0);

    Texture::TextureStats texture =
        Texture::ComputeTextureStats(Texture::WindowMeanSamples(context.eosin, params_.windowSize));
    double contrast = std::min(2.0 * texture.stddev, 1.0);
    double complexity = Mean(complexities);

    double score = 0.4 * areaFraction + 0.3 * contrast + 0.3 * complexity;
    double confidence = std::min(0.6 + 0.3 * std::min(static_cast<double>(count) / 20.0, 1.0), 0.95);

    FeatureVector features;
    features.Set("region_count", static_cast<double>(count));
    features.Set("area_fraction", areaFraction);
    features.Set("eosin_contrast", contrast);
    features.Set("shape_complexity", complexity);

    return MakeResult(score, confidence, std::move(features), count);
}

} // namespace Patho::Morph::Grading
