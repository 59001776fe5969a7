#pragma once

/**
 * @file Interpretation.h
 * @brief Ordered score bands mapping a score to a descriptive label
 *
 * A score takes the label of the highest band whose lower bound it strictly
 * exceeds. The lowest band is a catch-all, so every score gets a label.
 */

#include <PathoMorph/Core/Export.h>

#include <string>
#include <vector>

namespace Patho::Morph::Grading {

struct PATHOMORPH_API InterpretationBand {
    double lowerBound = 0.0;
    std::string label;
};

class PATHOMORPH_API InterpretationTable {
public:
    /**
     * @param bands Bands in any order; stored highest bound first
     * @throws ConfigurationException if bands is empty, a bound is not
     *         finite, two bounds are equal, or a label is empty
     */
    explicit InterpretationTable(std::vector<InterpretationBand> bands);

    /// >0.8 high, >0.6 moderate, >0.4 low, otherwise minimal
    static InterpretationTable Default();

    const std::string& Interpret(double score) const;

    /// Bands ordered highest bound first
    const std::vector<InterpretationBand>& Bands() const { return bands_; }

private:
    std::vector<InterpretationBand> bands_;
};

} // namespace Patho::Morph::Grading
