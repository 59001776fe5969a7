#pragma once

/**
 * @file FeatureScorer.h
 * @brief Scorer interface and catalog
 *
 * A scorer turns the measurements of one analysis into an AlgorithmResult.
 * Every scorer is deterministic, keeps score and confidence within [0, 1],
 * and answers with its documented low defaults (insufficientSamples set)
 * when it has too few samples rather than throwing.
 *
 * Usage:
 * @code
 * auto scorer = CreateScorer("nuclear_morphometry", InterpretationTable::Default());
 * AlgorithmResult result = scorer->Score(context);
 * @endcode
 */

#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Export.h>
#include <PathoMorph/Grading/Interpretation.h>
#include <PathoMorph/Grading/Result.h>
#include <PathoMorph/Measure/Morphometry.h>

#include <memory>
#include <string>
#include <vector>

namespace Patho::Morph::Grading {

/**
 * @brief Everything a scorer may read for one image
 *
 * Channels are the enhanced stain channels; nuclei are measured
 * hematoxylin regions and stroma are measured eosin regions.
 */
struct PATHOMORPH_API ScoringContext {
    const ChannelImage& hematoxylin;
    const ChannelImage& eosin;
    const std::vector<Measure::RegionMorphometry>& nuclei;
    const std::vector<Measure::RegionMorphometry>& stroma;
};

class PATHOMORPH_API FeatureScorer {
public:
    virtual ~FeatureScorer() = default;

    /// Catalog name, also the key in the aggregator weight table
    virtual std::string Name() const = 0;

    /**
     * @throws InvalidInputException if the context channels are empty or differ in size
     */
    virtual AlgorithmResult Score(const ScoringContext& context) const = 0;

    const InterpretationTable& Bands() const { return bands_; }

protected:
    explicit FeatureScorer(InterpretationTable bands) : bands_(std::move(bands)) {}

    /// Clamp score/confidence and attach the interpretation
    AlgorithmResult MakeResult(double score, double confidence, FeatureVector features,
                               int64_t sampleCount) const;

    /// Default result for too few samples
    AlgorithmResult MakeInsufficient(double defaultScore, double defaultConfidence,
                                     int64_t sampleCount, int64_t required) const;

private:
    InterpretationTable bands_;
};

// =============================================================================
// Catalog
// =============================================================================

/// Names accepted by CreateScorer, in default reporting order
PATHOMORPH_API std::vector<std::string> AvailableScorers();

/**
 * @brief Create a catalog scorer with default parameters
 * @throws ConfigurationException for an unknown name
 */
PATHOMORPH_API std::unique_ptr<FeatureScorer> CreateScorer(const std::string& name,
                                                           const InterpretationTable& bands);

} // namespace Patho::Morph::Grading
