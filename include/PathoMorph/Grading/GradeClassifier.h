#pragma once

/**
 * @file GradeClassifier.h
 * @brief Maps an overall score to a categorical grade
 *
 * Bands are (lower bound, label) pairs scanned highest bound first; the first
 * band whose bound the score meets (>=) wins. The lowest band also catches
 * scores below its bound, so classification is total and monotonic.
 */

#include <PathoMorph/Core/Export.h>
#include <PathoMorph/Grading/Result.h>

#include <string>
#include <vector>

namespace Patho::Morph::Grading {

struct PATHOMORPH_API GradeBand {
    double lowerBound = 0.0;
    std::string label;
};

class PATHOMORPH_API GradeClassifier {
public:
    /**
     * @param bands Bands in any order
     * @throws ConfigurationException if bands is empty, a bound is not
     *         finite, two bounds are equal, or a label is empty
     */
    explicit GradeClassifier(std::vector<GradeBand> bands);

    /// >=0.66 G3, >=0.31 G2, otherwise G1
    static std::vector<GradeBand> DefaultBands();

    /**
     * @throws InvalidArgumentException if score is NaN
     */
    GradeResult Classify(double score) const;

    /// Bands ordered highest bound first
    const std::vector<GradeBand>& Bands() const { return bands_; }

private:
    std::vector<GradeBand> bands_;
};

} // namespace Patho::Morph::Grading
