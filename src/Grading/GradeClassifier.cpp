/**
 * @file GradeClassifier.cpp
 * @brief Threshold-band grade classification
 */

#include <PathoMorph/Grading/GradeClassifier.h>
#include <PathoMorph/Core/Exception.h>

#include <algorithm>
#include <cmath>

namespace Patho::Morph::Grading {

GradeClassifier::GradeClassifier(std::vector<GradeBand> bands)
    : bands_(std::move(bands)) {
    if (bands_.empty()) {
        throw ConfigurationException("GradeClassifier: at least one band is required");
    }
    for (const auto& band : bands_) {
        if (!std::isfinite(band.lowerBound)) {
            throw ConfigurationException("GradeClassifier: band '" + band.label +
                                         "' has a non-finite bound");
        }
        if (band.label.empty()) {
            throw ConfigurationException("GradeClassifier: band labels must not be empty");
        }
    }

    std::sort(bands_.begin(), bands_.end(), [](const GradeBand& a, const GradeBand& b) {
        return a.lowerBound > b.lowerBound;
    });

    for (size_t i = 1; i < bands_.size(); ++i) {
        if (bands_[i].lowerBound == bands_[i - 1].lowerBound) {
            throw ConfigurationException("GradeClassifier: duplicate bound " +
                                         std::to_string(bands_[i].lowerBound));
        }
    }
}

std::vector<GradeBand> GradeClassifier::DefaultBands() {
    return {
        {0.66, "G3"},
        {0.31, "G2"},
        {0.0, "G1"}
    };
}

GradeResult GradeClassifier::Classify(double score) const {
    if (std::isnan(score)) {
        throw InvalidArgumentException("GradeClassifier::Classify: score is NaN");
    }

    const int32_t count = static_cast<int32_t>(bands_.size());
    for (int32_t i = 0; i < count - 1; ++i) {
        if (score >= bands_[i].lowerBound) {
            return {bands_[i].label, count - 1 - i};
        }
    }
    return {bands_.back().label, 0};
}

} // namespace Patho::Morph::Grading
