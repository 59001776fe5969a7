/**
 * @file Interpretation.cpp
 * @brief Score interpretation bands
 */

#include <PathoMorph/Grading/Interpretation.h>
#include <PathoMorph/Core/Exception.h>

#include <algorithm>
#include <cmath>

namespace Patho::Morph::Grading {

InterpretationTable::InterpretationTable(std::vector<InterpretationBand> bands)
    : bands_(std::move(bands)) {
    if (bands_.empty()) {
        throw ConfigurationException("InterpretationTable: at least one band is required");
    }
    for (const auto& band : bands_) {
        if (!std::isfinite(band.lowerBound)) {
            throw ConfigurationException("InterpretationTable: band '" + band.label +
                                         "' has a non-finite bound");
        }
        if (band.label.empty()) {
            throw ConfigurationException("InterpretationTable: band labels must not be empty");
        }
    }

    std::sort(bands_.begin(), bands_.end(),
              [](const InterpretationBand& a, const InterpretationBand& b) {
                  return a.lowerBound > b.lowerBound;
              });

    for (size_t i = 1; i < bands_.size(); ++i) {
        if (bands_[i].lowerBound == bands_[i - 1].lowerBound) {
            throw ConfigurationException("InterpretationTable: duplicate bound for '" +
                                         bands_[i - 1].label + "' and '" + bands_[i].label + "'");
        }
    }
}

InterpretationTable InterpretationTable::Default() {
    return InterpretationTable({
        {0.8, "high"},
        {0.6, "moderate"},
        {0.4, "low"},
        {0.0, "minimal"}
    });
}

const std::string& InterpretationTable::Interpret(double score) const {
    for (size_t i = 0; i + 1 < bands_.size(); ++i) {
        if (score > bands_[i].lowerBound) {
            return bands_[i].label;
        }
    }
    return bands_.back().label;
}

} // namespace Patho::Morph::Grading
