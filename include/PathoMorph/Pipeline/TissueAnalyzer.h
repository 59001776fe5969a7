#pragma once

/**
 * @file TissueAnalyzer.h
 * @brief End-to-end H&E analysis: deconvolve, enhance, detect, measure, score, grade
 *
 * All configuration is validated when the analyzer is constructed; a bad
 * weight table, stain matrix or band list fails there, before any image is
 * processed. The analyzer is immutable afterwards and Analyze may be called
 * from several threads at once. Every call works on its own buffers.
 *
 * Usage:
 * @code
 * TissueAnalyzer analyzer(AnalysisConfig::Default());
 * PixelBuffer buffer(rgba, width, height, width * height * 4);
 * AnalysisResult result = analyzer.Analyze(buffer);
 * printf("%s (%.2f)\n", result.grade.label.c_str(), result.aggregate.overallScore);
 * @endcode
 */

#include <PathoMorph/Color/StainDeconvolve.h>
#include <PathoMorph/Core/Export.h>
#include <PathoMorph/Core/PixelBuffer.h>
#include <PathoMorph/Filter/Enhance.h>
#include <PathoMorph/Grading/FeatureScorer.h>
#include <PathoMorph/Grading/GradeClassifier.h>
#include <PathoMorph/Grading/Interpretation.h>
#include <PathoMorph/Grading/WeightedAggregator.h>
#include <PathoMorph/Measure/Morphometry.h>
#include <PathoMorph/Segment/RegionDetector.h>

#include <memory>
#include <string>
#include <vector>

namespace Patho::Morph::Pipeline {

// =============================================================================
// Configuration
// =============================================================================

struct PATHOMORPH_API AnalysisConfig {
    Color::StainMatrix stainMatrix = Color::StainMatrix::HematoxylinEosin();
    double maxOpticalDensity = DEFAULT_MAX_OPTICAL_DENSITY;

    Filter::EnhanceParams enhance;

    std::string nucleiChannel = "hematoxylin";      ///< Stain row segmented for nuclei
    std::string stromaChannel = "eosin";            ///< Stain row segmented for stroma
    Segment::RegionDetectorParams nuclei;
    Segment::RegionDetectorParams stroma;

    std::vector<Grading::WeightEntry> weights;      ///< Scorer name -> weight
    double weightEpsilon = WEIGHT_SUM_EPSILON;
    std::vector<Grading::GradeBand> gradeBands;
    std::vector<Grading::InterpretationBand> interpretationBands;

    /**
     * @brief Default H&E profile
     *
     * Weights: nuclear_morphometry 0.35, architectural_pattern 0.30,
     * mitotic_activity 0.20, stromal_pattern 0.15. Grades G1/G2/G3.
     */
    static AnalysisConfig Default();
};

// =============================================================================
// Result
// =============================================================================

struct PATHOMORPH_API DetectionSummary {
    int64_t regionCount = 0;
    int32_t threshold = 0;
    int64_t truncatedCount = 0;
    int64_t discardedCount = 0;
    bool regionLimitReached = false;
};

struct PATHOMORPH_API StageTimings {
    double deconvolveMs = 0;
    double enhanceMs = 0;
    double detectMs = 0;
    double measureMs = 0;
    double scoreMs = 0;
    double totalMs = 0;
};

struct PATHOMORPH_API AnalysisResult {
    int32_t width = 0;
    int32_t height = 0;
    Grading::AggregateResult aggregate;
    Grading::GradeResult grade;
    DetectionSummary nuclei;
    DetectionSummary stroma;
    StageTimings timings;
};

// =============================================================================
// TissueAnalyzer
// =============================================================================

class PATHOMORPH_API TissueAnalyzer {
public:
    /**
     * @throws ConfigurationException if any part of the configuration is invalid
     */
    explicit TissueAnalyzer(AnalysisConfig config = AnalysisConfig::Default());

    ~TissueAnalyzer();

    TissueAnalyzer(const TissueAnalyzer&) = delete;
    TissueAnalyzer& operator=(const TissueAnalyzer&) = delete;

    /**
     * @brief Run the full pipeline on one image
     * @throws InvalidInputException if the buffer is null, empty or undersized
     */
    AnalysisResult Analyze(const PixelBuffer& buffer) const;

    const AnalysisConfig& Config() const { return config_; }

    /// Scorer names in reporting order
    std::vector<std::string> ScorerNames() const;

private:
    AnalysisConfig config_;
    Color::ColorDeconvolver deconvolver_;
    Filter::ImageEnhancer enhancer_;
    Segment::RegionDetector nucleiDetector_;
    Segment::RegionDetector stromaDetector_;
    Measure::MorphometricAnalyzer morphometry_;
    std::vector<std::unique_ptr<Grading::FeatureScorer>> scorers_;
    Grading::WeightedAggregator aggregator_;
    Grading::GradeClassifier classifier_;
    size_t nucleiIndex_ = 0;
    size_t stromaIndex_ = 0;
};

} // namespace Patho::Morph::Pipeline
