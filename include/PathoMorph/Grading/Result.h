#pragma once

/**
 * @file Result.h
 * @brief Scoring, aggregation and grading result types
 */

#include <PathoMorph/Core/Export.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace Patho::Morph::Grading {

/**
 * @brief Ordered named measurements of one feature category
 *
 * Insertion order is preserved; Set on an existing name replaces the value.
 */
class PATHOMORPH_API FeatureVector {
public:
    using Entry = std::pair<std::string, double>;

    void Set(const std::string& name, double value);

    bool Has(const std::string& name) const;

    /// Value of a feature, or fallback if absent
    double Get(const std::string& name, double fallback = 0.0) const;

    const std::vector<Entry>& Entries() const { return entries_; }
    size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
};

/**
 * @brief Output of one FeatureScorer
 *
 * score and confidence are always within [0, 1]. When the scorer had fewer
 * samples than it needs, insufficientSamples is set and score/confidence hold
 * that scorer's documented low defaults.
 */
struct PATHOMORPH_API AlgorithmResult {
    std::string name;
    double weight = 0.0;            ///< Filled in by WeightedAggregator
    double score = 0.0;
    double confidence = 0.0;
    FeatureVector features;
    std::string interpretation;
    bool insufficientSamples = false;
    int64_t sampleCount = 0;
};

/**
 * @brief Combined output of WeightedAggregator
 */
struct PATHOMORPH_API AggregateResult {
    double overallScore = 0.0;          ///< Sum of score*weight, in [0, 1]
    double overallConfidence = 0.0;     ///< Weighted mean confidence + bonus, below 1
    std::vector<AlgorithmResult> results;   ///< In configured weight order
    int32_t insufficientCount = 0;      ///< Results that fell back to defaults
};

/**
 * @brief Output of GradeClassifier
 */
struct PATHOMORPH_API GradeResult {
    std::string label;
    int32_t rank = 0;   ///< 0 for the lowest band, increasing with score
};

} // namespace Patho::Morph::Grading
