/**
 * @file FeatureScorer.cpp
 * @brief Scorer base helpers and catalog
 */

#include <PathoMorph/Grading/FeatureScorer.h>
#include <PathoMorph/Grading/Scorers.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Platform/Log.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <utility>

namespace Patho::Morph::Grading {

namespace {

double Clamp01(double v) {
    return std::isfinite(v) ? std::clamp(v, 0.0, 1.0) : 0.0;
}

using ScorerFactory = std::function<std::unique_ptr<FeatureScorer>(const InterpretationTable&)>;

const std::vector<std::pair<std::string, ScorerFactory>>& Catalog() {
    static const std::vector<std::pair<std::string, ScorerFactory>> catalog = {
        {NuclearMorphometryScorer::NAME, [](const InterpretationTable& bands) {
            return std::make_unique<NuclearMorphometryScorer>(bands);
        }},
        {ArchitecturalPatternScorer::NAME, [](const InterpretationTable& bands) {
            return std::make_unique<ArchitecturalPatternScorer>(bands);
        }},
        {MitoticActivityScorer::NAME, [](const InterpretationTable& bands) {
            return std::make_unique<MitoticActivityScorer>(bands);
        }},
        {StromalPatternScorer::NAME, [](const InterpretationTable& bands) {
            return std::make_unique<StromalPatternScorer>(bands);
        }},
    };
    return catalog;
}

} // anonymous namespace

// =============================================================================
// FeatureScorer
// =============================================================================

AlgorithmResult FeatureScorer::MakeResult(double score, double confidence, FeatureVector features,
                                          int64_t sampleCount) const {
    AlgorithmResult result;
    result.name = Name();
    result.score = Clamp01(score);
    result.confidence = Clamp01(confidence);
    result.features = std::move(features);
    result.interpretation = bands_.Interpret(result.score);
    result.sampleCount = sampleCount;
    return result;
}

AlgorithmResult FeatureScorer::MakeInsufficient(double defaultScore, double defaultConfidence,
                                                int64_t sampleCount, int64_t required) const {
    FeatureVector features;
    features.Set("sample_count", static_cast<double>(sampleCount));
    features.Set("required_samples", static_cast<double>(required));

    AlgorithmResult result = MakeResult(defaultScore, defaultConfidence, std::move(features),
                                        sampleCount);
    result.insufficientSamples = true;

    PATHOMORPH_LOG_WARN("%s: %lld sample(s), %lld required; using defaults",
                        result.name.c_str(), static_cast<long long>(sampleCount),
                        static_cast<long long>(required));
    return result;
}

// =============================================================================
// Catalog
// =============================================================================

std::vector<std::string> AvailableScorers() {
    std::vector<std::string> names;
    for (const auto& entry : Catalog()) {
        names.push_back(entry.first);
    }
    return names;
}

std::unique_ptr<FeatureScorer> CreateScorer(const std::string& name,
                                            const InterpretationTable& bands) {
    for (const auto& entry : Catalog()) {
        if (entry.first == name) {
            return entry.second(bands);
        }
    }
    throw ConfigurationException("unknown scorer '" + name + "'");
}

} // namespace Patho::Morph::Grading
