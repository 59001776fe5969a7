#pragma once

/**
 * @file Scorers.h
 * @brief Catalog scorers
 *
 * | name                  | samples             | default score / conf |
 * |-----------------------|---------------------|----------------------|
 * | nuclear_morphometry   | nuclei              | 0.10 / 0.20          |
 * | architectural_pattern | dense windows       | 0.20 / 0.30          |
 * | mitotic_activity      | nuclei              | 0.10 / 0.20          |
 * | stromal_pattern       | stromal regions     | 0.15 / 0.25          |
 */

#include <PathoMorph/Grading/FeatureScorer.h>

#include <cstdint>

namespace Patho::Morph::Grading {

// =============================================================================
// Nuclear morphometry
// =============================================================================

struct PATHOMORPH_API NuclearMorphometryParams {
    int64_t minNuclei = 20;
    int32_t cytoplasmRadius = 15;       ///< Half-size of the window around each centroid
    int32_t cytoplasmThreshold = 100;   ///< Eosin values above this count as cytoplasm
};

/**
 * @brief Nuclear shape irregularity, pleomorphism and N/C ratio
 *
 * score = 0.3 * mean shape complexity
 *       + 0.3 * pleomorphism (mean of area CV and intensity CV, capped at 1)
 *       + 0.2 * mean N/C ratio (nuclear area / cytoplasm pixels in the window, capped at 1)
 *       + 0.2 * area CV (capped at 1)
 *
 * confidence = min((hullConf + pleoConf) / 2 + 0.1, 0.95) with hullConf 0.8
 * when more than 10 nuclei have a hull (else 0.5) and pleoConf 0.8 when
 * pleomorphism exceeds 0.1 (else 0.4).
 */
class PATHOMORPH_API NuclearMorphometryScorer : public FeatureScorer {
public:
    static constexpr const char* NAME = "nuclear_morphometry";
    static constexpr double DEFAULT_SCORE = 0.1;
    static constexpr double DEFAULT_CONFIDENCE = 0.2;

    explicit NuclearMorphometryScorer(InterpretationTable bands = InterpretationTable::Default(),
                                      const NuclearMorphometryParams& params = {});

    std::string Name() const override { return NAME; }
    AlgorithmResult Score(const ScoringContext& context) const override;

private:
    NuclearMorphometryParams params_;
};

// =============================================================================
// Architectural pattern
// =============================================================================

struct PATHOMORPH_API ArchitecturalPatternParams {
    int32_t windowSize = 50;            ///< Sampling window side
    int32_t densityThreshold = 150;     ///< Hematoxylin values above this are cellular
    double denseFraction = 0.3;         ///< Windows above this density are kept
    int64_t minDenseWindows = 15;
    int32_t lumenThreshold = 40;        ///< Pixels below this in both channels are lumen
};

/**
 * @brief Multi-scale tissue architecture
 *
 * score = 0.3 * mean density of dense windows
 *       + 0.25 * texture score of window means
 *       + 0.25 * organization (mean of lumen fraction and gradient regularity)
 *       + 0.2 * spatial distribution (1 - variance of quadrant means)
 *
 * confidence = min((textureConf + organizationConf) / 2 + 0.1, 0.95) with
 * textureConf 0.8 when at least twice the required dense windows exist
 * (else 0.6) and organizationConf 0.7 when at least 16 windows fit (else 0.5).
 */
class PATHOMORPH_API ArchitecturalPatternScorer : public FeatureScorer {
public:
    static constexpr const char* NAME = "architectural_pattern";
    static constexpr double DEFAULT_SCORE = 0.2;
    static constexpr double DEFAULT_CONFIDENCE = 0.3;

    explicit ArchitecturalPatternScorer(InterpretationTable bands = InterpretationTable::Default(),
                                        const ArchitecturalPatternParams& params = {});

    std::string Name() const override { return NAME; }
    AlgorithmResult Score(const ScoringContext& context) const override;

private:
    ArchitecturalPatternParams params_;
};

// =============================================================================
// Mitotic activity
// =============================================================================

struct PATHOMORPH_API MitoticActivityParams {
    int64_t minNuclei = 10;
    int64_t minCandidateArea = 30;
    int64_t maxCandidateArea = 200;
    double minCandidateIntensity = 0.6;     ///< Normalized hematoxylin intensity
    double minCandidateComplexity = 0.15;   ///< Irregular outline
    double pixelsPerMm = 1000.0;
    double hpfAreaMm2 = 0.237;              ///< One high-power field
    double referenceCountPer10Hpf = 20.0;   ///< Count that saturates the density term
};

/**
 * @brief Mitotic figure candidates among detected nuclei
 *
 * score = 0.4 * min(candidates per 10 HPF / reference count, 1)
 *       + 0.3 * candidate fraction of nuclei
 *       + 0.3 * mean candidate intensity
 *
 * confidence = min(0.5 + 0.4 * min(nuclei / 50, 1), 0.95)
 */
class PATHOMORPH_API MitoticActivityScorer : public FeatureScorer {
public:
    static constexpr const char* NAME = "mitotic_activity";
    static constexpr double DEFAULT_SCORE = 0.1;
    static constexpr double DEFAULT_CONFIDENCE = 0.2;

    explicit MitoticActivityScorer(InterpretationTable bands = InterpretationTable::Default(),
                                   const MitoticActivityParams& params = {});

    std::string Name() const override { return NAME; }
    AlgorithmResult Score(const ScoringContext& context) const override;

private:
    MitoticActivityParams params_;
};

// =============================================================================
// Stromal pattern
// =============================================================================

struct PATHOMORPH_API StromalPatternParams {
    int64_t minRegions = 5;
    int32_t windowSize = 32;
};

/**
 * @brief Extent and texture of eosin-stained stroma
 *
 * score = 0.4 * stromal area fraction
 *       + 0.3 * eosin contrast (min(2 * stddev of window means, 1))
 *       + 0.3 * mean stromal region shape complexity
 *
 * confidence = min(0.6 + 0.3 * min(regions / 20, 1), 0.95)
 */
class PATHOMORPH_API StromalPatternScorer : public FeatureScorer {
public:
    static constexpr const char* NAME = "stromal_pattern";
    static constexpr double DEFAULT_SCORE = 0.15;
    static constexpr double DEFAULT_CONFIDENCE = 0.25;

    explicit StromalPatternScorer(InterpretationTable bands = InterpretationTable::Default(),
                                  const StromalPatternParams& params = {});

    std::string Name() const override { return NAME; }
    AlgorithmResult Score(const ScoringContext& context) const override;

private:
    StromalPatternParams params_;
};

} // namespace Patho::Morph::Grading
