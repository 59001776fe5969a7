/**
 * @file TissueAnalyzer.cpp
 * @brief End-to-end H&E analysis
 */

#include <PathoMorph/Pipeline/TissueAnalyzer.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Core/Validate.h>
#include <PathoMorph/Platform/Log.h>
#include <PathoMorph/Platform/Timer.h>

namespace Patho::Morph::Pipeline {

namespace {

size_t ResolveChannel(const Color::StainMatrix& matrix, const std::string& name) {
    int32_t index = matrix.IndexOf(name);
    if (index < 0) {
        throw ConfigurationException("TissueAnalyzer: stain matrix has no channel '" + name + "'");
    }
    return static_cast<size_t>(index);
}

DetectionSummary Summarize(const Segment::DetectionResult& detection) {
    DetectionSummary summary;
    summary.regionCount = static_cast<int64_t>(detection.regions.size());
    summary.threshold = detection.thresholdUsed;
    summary.truncatedCount = detection.truncatedCount;
    summary.discardedCount = detection.discardedCount;
    summary.regionLimitReached = detection.regionLimitReached;
    return summary;
}

} // anonymous namespace

// =============================================================================
// AnalysisConfig
// =============================================================================

AnalysisConfig AnalysisConfig::Default() {
    AnalysisConfig config;

    config.nuclei.useOtsu = true;
    config.nuclei.minRegionPx = 20;
    config.nuclei.maxRegionPx = 2000;
    config.nuclei.maxRegionCount = 20000;
    config.nuclei.connectivity = Connectivity::Eight;

    config.stroma.useOtsu = true;
    config.stroma.minRegionPx = 50;
    config.stroma.maxRegionPx = 200000;
    config.stroma.maxRegionCount = 5000;
    config.stroma.connectivity = Connectivity::Eight;

    config.weights = {
        {"nuclear_morphometry", 0.35},
        {"architectural_pattern", 0.30},
        {"mitotic_activity", 0.20},
        {"stromal_pattern", 0.15}
    };
    config.gradeBands = Grading::GradeClassifier::DefaultBands();
    config.interpretationBands = Grading::InterpretationTable::Default().Bands();
    return config;
}

// =============================================================================
// TissueAnalyzer
// =============================================================================

TissueAnalyzer::TissueAnalyzer(AnalysisConfig config)
    : config_(std::move(config))
    , deconvolver_(config_.stainMatrix, config_.maxOpticalDensity)
    , enhancer_(config_.enhance)
    , nucleiDetector_(config_.nuclei)
    , stromaDetector_(config_.stroma)
    , aggregator_(config_.weights, config_.weightEpsilon)
    , classifier_(config_.gradeBands) {
    nucleiIndex_ = ResolveChannel(config_.stainMatrix, config_.nucleiChannel);
    stromaIndex_ = ResolveChannel(config_.stainMatrix, config_.stromaChannel);

    Grading::InterpretationTable bands(config_.interpretationBands);
    for (const auto& entry : config_.weights) {
        scorers_.push_back(Grading::CreateScorer(entry.name, bands));
    }

    PATHOMORPH_LOG_INFO("TissueAnalyzer: %zu stain channel(s), %zu scorer(s), %zu grade band(s)",
                        config_.stainMatrix.Size(), scorers_.size(), classifier_.Bands().size());
}

TissueAnalyzer::~TissueAnalyzer() = default;

std::vector<std::string> TissueAnalyzer::ScorerNames() const {
    std::vector<std::string> names;
    for (const auto& scorer : scorers_) {
        names.push_back(scorer->Name());
    }
    return names;
}

AnalysisResult TissueAnalyzer::Analyze(const PixelBuffer& buffer) const {
    Validate::RequirePixelBuffer(buffer, "TissueAnalyzer::Analyze");

    AnalysisResult result;
    result.width = buffer.Width();
    result.height = buffer.Height();

    Platform::Timer total;
    Platform::Timer stage;

    // Stain separation
    std::vector<ChannelImage> channels = deconvolver_.Deconvolve(buffer);
    result.timings.deconvolveMs = stage.Lap();

    for (auto& channel : channels) {
        channel = enhancer_.Enhance(channel);
    }
    result.timings.enhanceMs = stage.Lap();

    const ChannelImage& hematoxylin = channels[nucleiIndex_];
    const ChannelImage& eosin = channels[stromaIndex_];

    // Segmentation
    Segment::DetectionResult nuclei = nucleiDetector_.Detect(hematoxylin);
    Segment::DetectionResult stroma = stromaDetector_.Detect(eosin);
    result.nuclei = Summarize(nuclei);
    result.stroma = Summarize(stroma);
    result.timings.detectMs = stage.Lap();

    // Morphometry
    std::vector<Measure::RegionMorphometry> nucleiMorph = morphometry_.AnalyzeAll(nuclei.regions);
    std::vector<Measure::RegionMorphometry> stromaMorph = morphometry_.AnalyzeAll(stroma.regions);
    result.timings.measureMs = stage.Lap();

    // Scoring, aggregation, grading
    Grading::ScoringContext context{hematoxylin, eosin, nucleiMorph, stromaMorph};
    std::vector<Grading::AlgorithmResult> scored;
    scored.reserve(scorers_.size());
    for (const auto& scorer : scorers_) {
        scored.push_back(scorer->Score(context));
    }

    result.aggregate = aggregator_.Aggregate(std::move(scored));
    result.grade = classifier_.Classify(result.aggregate.overallScore);
    result.timings.scoreMs = stage.Lap();
    result.timings.totalMs = total.ElapsedMs();

    PATHOMORPH_LOG_INFO("TissueAnalyzer: %dx%d, %lld nuclei, %lld stromal regions, "
                        "score %.3f, confidence %.3f, grade %s (%.1f ms)",
                        result.width, result.height,
                        static_cast<long long>(result.nuclei.regionCount),
                        static_cast<long long>(result.stroma.regionCount),
                        result.aggregate.overallScore, result.aggregate.overallConfidence,
                        result.grade.label.c_str(), result.timings.totalMs);
    return result;
}

} // namespace Patho::Morph::Pipeline
