#pragma once

/**
 * @file WeightedAggregator.h
 * @brief Weighted combination of per-algorithm results
 *
 * overallScore      = sum(score_i * weight_i), clamped to [0, 1]
 * overallConfidence = sum(confidence_i * weight_i) + CONFIDENCE_BONUS,
 *                     clamped to [0, CONFIDENCE_CEILING]
 *
 * Weights must sum to 1 within epsilon; this is checked once, at
 * construction. Results flagged insufficientSamples take part with their
 * default values.
 */

#include <PathoMorph/Core/Constants.h>
#include <PathoMorph/Core/Export.h>
#include <PathoMorph/Grading/Result.h>

#include <string>
#include <vector>

namespace Patho::Morph::Grading {

struct PATHOMORPH_API WeightEntry {
    std::string name;
    double weight = 0.0;
};

/**
 * @brief Scale weights so they sum to exactly 1
 *
 * Offered for callers that prefer renormalization to a hard failure;
 * the aggregator itself never renormalizes.
 * @throws ConfigurationException if a weight is negative or not finite,
 *         or the sum is not positive
 */
PATHOMORPH_API std::vector<WeightEntry> NormalizeWeights(std::vector<WeightEntry> weights);

class PATHOMORPH_API WeightedAggregator {
public:
    /**
     * @param weights Algorithm weights in reporting order
     * @param epsilon Accepted deviation of the sum from 1
     * @throws ConfigurationException if weights is empty, a name is empty or
     *         repeated, a weight is negative or not finite, or the sum is
     *         off by more than epsilon
     */
    explicit WeightedAggregator(std::vector<WeightEntry> weights,
                                double epsilon = WEIGHT_SUM_EPSILON);

    /**
     * @brief Combine one result per configured algorithm
     *
     * Each result's weight is overwritten with the configured weight.
     * @throws InvalidArgumentException if a result names an unknown algorithm,
     *         an algorithm appears twice, or a configured algorithm is missing
     */
    AggregateResult Aggregate(std::vector<AlgorithmResult> results) const;

    /// Configured weight, or 0 for an unknown name
    double WeightOf(const std::string& name) const;

    const std::vector<WeightEntry>& Weights() const { return weights_; }

private:
    std::vector<WeightEntry> weights_;
};

} // namespace Patho::Morph::Grading
