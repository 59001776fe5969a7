/**
 * @file WeightedAggregator.cpp
 * @brief Weighted combination of per-algorithm results
 */

#include <PathoMorph/Grading/WeightedAggregator.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Platform/Log.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace Patho::Morph::Grading {

namespace {

void RequireValidWeight(const WeightEntry& entry, const char* funcName) {
    if (!std::isfinite(entry.weight) || entry.weight < 0.0) {
        throw ConfigurationException(std::string(funcName) + ": weight of '" + entry.name +
                                     "' must be finite and >= 0");
    }
}

} // anonymous namespace

std::vector<WeightEntry> NormalizeWeights(std::vector<WeightEntry> weights) {
    double sum = 0.0;
    for (const auto& entry : weights) {
        RequireValidWeight(entry, "NormalizeWeights");
        sum += entry.weight;
    }
    if (!(sum > 0.0)) {
        throw ConfigurationException("NormalizeWeights: weights sum to zero");
    }
    for (auto& entry : weights) {
        entry.weight /= sum;
    }
    return weights;
}

WeightedAggregator::WeightedAggregator(std::vector<WeightEntry> weights, double epsilon)
    : weights_(std::move(weights)) {
    if (weights_.empty()) {
        throw ConfigurationException("WeightedAggregator: weight table is empty");
    }
    if (!std::isfinite(epsilon) || epsilon < 0.0) {
        throw ConfigurationException("WeightedAggregator: epsilon must be finite and >= 0");
    }

    std::set<std::string> names;
    double sum = 0.0;
    for (const auto& entry : weights_) {
        if (entry.name.empty()) {
            throw ConfigurationException("WeightedAggregator: algorithm name is empty");
        }
        if (!names.insert(entry.name).second) {
            throw ConfigurationException("WeightedAggregator: duplicate algorithm '" +
                                         entry.name + "'");
        }
        RequireValidWeight(entry, "WeightedAggregator");
        sum += entry.weight;
    }

    if (std::abs(sum - 1.0) > epsilon) {
        throw ConfigurationException("WeightedAggregator: weights sum to " + std::to_string(sum) +
                                     ", expected 1 +/- " + std::to_string(epsilon));
    }
}

double WeightedAggregator::WeightOf(const std::string& name) const {
    for (const auto& entry : weights_) {
        if (entry.name == name) return entry.weight;
    }
    return 0.0;
}

AggregateResult WeightedAggregator::Aggregate(std::vector<AlgorithmResult> results) const {
    std::vector<const AlgorithmResult*> byWeight(weights_.size(), nullptr);

    for (const auto& result : results) {
        auto it = std::find_if(weights_.begin(), weights_.end(),
                               [&](const WeightEntry& e) { return e.name == result.name; });
        if (it == weights_.end()) {
            throw InvalidArgumentException("WeightedAggregator::Aggregate: unknown algorithm '" +
                                           result.name + "'");
        }
        size_t idx = static_cast<size_t>(it - weights_.begin());
        if (byWeight[idx] != nullptr) {
            throw InvalidArgumentException("WeightedAggregator::Aggregate: algorithm '" +
                                           result.name + "' given twice");
        }
        byWeight[idx] = &result;
    }

    AggregateResult aggregate;
    aggregate.results.reserve(weights_.size());

    double scoreSum = 0.0;
    double confidenceSum = 0.0;
    for (size_t i = 0; i < weights_.size(); ++i) {
        if (byWeight[i] == nullptr) {
            throw InvalidArgumentException("WeightedAggregator::Aggregate: missing result for '" +
                                           weights_[i].name + "'");
        }
        AlgorithmResult result = *byWeight[i];
        result.weight = weights_[i].weight;

        scoreSum += result.score * result.weight;
        confidenceSum += result.confidence * result.weight;
        if (result.insufficientSamples) {
            ++aggregate.insufficientCount;
        }
        aggregate.results.push_back(std::move(result));
    }

    aggregate.overallScore = std::clamp(scoreSum, 0.0, 1.0);
    aggregate.overallConfidence = std::clamp(confidenceSum + CONFIDENCE_BONUS, 0.0, CONFIDENCE_CEILING);

    if (aggregate.insufficientCount > 0) {
        PATHOMORPH_LOG_INFO("WeightedAggregator: %d of %zu results used sample-count defaults",
                            aggregate.insufficientCount, weights_.size());
    }
    return aggregate;
}

} // namespace Patho::Morph::Grading
