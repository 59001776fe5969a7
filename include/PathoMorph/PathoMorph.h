#pragma once

/**
 * @file PathoMorph.h
 * @brief Main header file for the PathoMorph library
 *
 * PathoMorph measures the morphology of H&E stained tissue images:
 * stain deconvolution, enhancement, region detection, morphometry,
 * feature scoring, weighted aggregation and grade classification.
 */

// Configuration and export macros
#include <PathoMorph/PathoMorphConfig.h>
#include <PathoMorph/Core/Export.h>

// Core types
#include <PathoMorph/Core/Constants.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Core/Types.h>
#include <PathoMorph/Core/PixelBuffer.h>
#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Region.h>

// Platform
#include <PathoMorph/Platform/Log.h>

// Stages
#include <PathoMorph/Color/StainDeconvolve.h>
#include <PathoMorph/Filter/Enhance.h>
#include <PathoMorph/Segment/RegionDetector.h>
#include <PathoMorph/Measure/Morphometry.h>
#include <PathoMorph/Texture/Texture.h>
#include <PathoMorph/Grading/FeatureScorer.h>
#include <PathoMorph/Grading/Scorers.h>
#include <PathoMorph/Grading/WeightedAggregator.h>
#include <PathoMorph/Grading/GradeClassifier.h>

// Facade and configuration
#include <PathoMorph/Pipeline/TissueAnalyzer.h>
#include <PathoMorph/Config/ConfigIO.h>

namespace Patho::Morph {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return PATHOMORPH_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = PATHOMORPH_VERSION_MAJOR;
    minor = PATHOMORPH_VERSION_MINOR;
    patch = PATHOMORPH_VERSION_PATCH;
}

} // namespace Patho::Morph
