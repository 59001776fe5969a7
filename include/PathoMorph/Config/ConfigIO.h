#pragma once

/**
 * @file ConfigIO.h
 * @brief YAML serialization of AnalysisConfig
 *
 * Keys left out of a document keep their AnalysisConfig::Default() values.
 * Unknown keys are ignored.
 *
 * @code{.yaml}
 * stain_matrix:
 *   names: [hematoxylin, eosin, residual]
 *   rows: [[0.65, 0.70, 0.29], [0.07, 0.99, 0.11], [0.27, 0.57, 0.78]]
 *   normalize: true
 *   max_optical_density: 2.0
 * enhance: {denoise: median, radius: 1, contrast: stretch}
 * nuclei: {threshold: otsu, min_region_px: 20, max_region_px: 2000,
 *          max_region_count: 20000, connectivity: 8, channel: hematoxylin}
 * stroma: {threshold: 120, min_region_px: 50, channel: eosin}
 * weights: {nuclear_morphometry: 0.35, architectural_pattern: 0.30,
 *           mitotic_activity: 0.20, stromal_pattern: 0.15}
 * weight_epsilon: 0.001
 * grade_bands: [[0.66, G3], [0.31, G2], [0.0, G1]]
 * interpretation_bands: [[0.8, high], [0.6, moderate], [0.4, low], [0.0, minimal]]
 * @endcode
 */

#include <PathoMorph/Core/Export.h>
#include <PathoMorph/Pipeline/TissueAnalyzer.h>

#include <string>

namespace Patho::Morph::Config {

/**
 * @brief Parse a YAML document
 * @throws ConfigurationException on malformed YAML or invalid values
 */
PATHOMORPH_API Pipeline::AnalysisConfig ParseAnalysisConfig(const std::string& yamlText);

/**
 * @brief Load a YAML file
 * @throws IOException if the file cannot be read
 * @throws ConfigurationException on malformed YAML or invalid values
 */
PATHOMORPH_API Pipeline::AnalysisConfig LoadAnalysisConfig(const std::string& path);

/// Serialize every field to YAML
PATHOMORPH_API std::string EmitAnalysisConfig(const Pipeline::AnalysisConfig& config);

/**
 * @brief Write EmitAnalysisConfig output to a file
 * @throws IOException if the file cannot be written
 */
PATHOMORPH_API void SaveAnalysisConfig(const Pipeline::AnalysisConfig& config,
                                       const std::string& path);

} // namespace Patho::Morph::Config
