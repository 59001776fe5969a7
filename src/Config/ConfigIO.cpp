/**
 * @file ConfigIO.cpp
 * @brief YAML serialization of AnalysisConfig
 */

#include <PathoMorph/Config/ConfigIO.h>
#include <PathoMorph/Core/Exception.h>

#include <yaml-cpp/yaml.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace Patho::Morph::Config {

namespace {

// =============================================================================
// Parsing helpers
// =============================================================================

template<typename T>
T Scalar(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationException("'" + key + "': " + e.what());
    }
}

template<typename T>
void ReadIf(const YAML::Node& parent, const char* key, T& target) {
    if (parent[key]) {
        target = Scalar<T>(parent[key], key);
    }
}

void RequireMap(const YAML::Node& node, const std::string& key) {
    if (!node.IsMap()) {
        throw ConfigurationException("'" + key + "' must be a map");
    }
}

void RequireSequence(const YAML::Node& node, const std::string& key) {
    if (!node.IsSequence()) {
        throw ConfigurationException("'" + key + "' must be a sequence");
    }
}

Connectivity ParseConnectivity(int32_t value) {
    if (value == 4) return Connectivity::Four;
    if (value == 8) return Connectivity::Eight;
    throw ConfigurationException("connectivity must be 4 or 8, got " + std::to_string(value));
}

void ParseStainMatrix(const YAML::Node& node, Pipeline::AnalysisConfig& config) {
    RequireMap(node, "stain_matrix");

    if (node["rows"]) {
        const YAML::Node rows = node["rows"];
        RequireSequence(rows, "stain_matrix.rows");

        Color::StainMatrix matrix;
        for (size_t i = 0; i < rows.size(); ++i) {
            const YAML::Node row = rows[i];
            if (!row.IsSequence() || row.size() != 3) {
                throw ConfigurationException("stain_matrix.rows[" + std::to_string(i) +
                                             "] must have exactly 3 values");
            }
            std::array<double, 3> values{};
            for (size_t c = 0; c < 3; ++c) {
                values[c] = Scalar<double>(row[c], "stain_matrix.rows");
            }
            matrix.rows.push_back(values);
        }

        if (node["names"]) {
            matrix.names = Scalar<std::vector<std::string>>(node["names"], "stain_matrix.names");
        } else {
            for (size_t i = 0; i < matrix.rows.size(); ++i) {
                matrix.names.push_back("stain" + std::to_string(i));
            }
        }

        bool normalize = false;
        ReadIf(node, "normalize", normalize);
        config.stainMatrix = normalize ? matrix.Normalized() : matrix;
    }

    ReadIf(node, "max_optical_density", config.maxOpticalDensity);
}

void ParseEnhance(const YAML::Node& node, Filter::EnhanceParams& params) {
    RequireMap(node, "enhance");
    if (node["denoise"]) {
        params.denoise = Filter::ParseDenoiseMode(Scalar<std::string>(node["denoise"], "enhance.denoise"));
    }
    ReadIf(node, "radius", params.radius);
    if (node["contrast"]) {
        params.contrast = Filter::ParseContrastMode(Scalar<std::string>(node["contrast"], "enhance.contrast"));
    }
}

void ParseDetector(const YAML::Node& node, const std::string& key,
                   Segment::RegionDetectorParams& params, std::string& channel) {
    RequireMap(node, key);

    if (node["threshold"]) {
        std::string text = Scalar<std::string>(node["threshold"], key + ".threshold");
        if (text == "otsu") {
            params.useOtsu = true;
        } else {
            params.useOtsu = false;
            params.threshold = Scalar<int32_t>(node["threshold"], key + ".threshold");
        }
    }
    ReadIf(node, "min_region_px", params.minRegionPx);
    ReadIf(node, "max_region_px", params.maxRegionPx);
    ReadIf(node, "max_region_count", params.maxRegionCount);
    if (node["connectivity"]) {
        params.connectivity = ParseConnectivity(Scalar<int32_t>(node["connectivity"], key + ".connectivity"));
    }
    ReadIf(node, "channel", channel);
}

template<typename Band>
std::vector<Band> ParseBands(const YAML::Node& node, const std::string& key) {
    RequireSequence(node, key);

    std::vector<Band> bands;
    for (size_t i = 0; i < node.size(); ++i) {
        const YAML::Node entry = node[i];
        if (!entry.IsSequence() || entry.size() != 2) {
            throw ConfigurationException("'" + key + "' entries must be [lower_bound, label]");
        }
        Band band;
        band.lowerBound = Scalar<double>(entry[0], key);
        band.label = Scalar<std::string>(entry[1], key);
        bands.push_back(band);
    }
    return bands;
}

// =============================================================================
// Emitting helpers
// =============================================================================

void EmitDetector(YAML::Emitter& out, const Segment::RegionDetectorParams& params,
                  const std::string& channel) {
    out << YAML::BeginMap;
    out << YAML::Key << "channel" << YAML::Value << channel;
    if (params.useOtsu) {
        out << YAML::Key << "threshold" << YAML::Value << "otsu";
    } else {
        out << YAML::Key << "threshold" << YAML::Value << params.threshold;
    }
    out << YAML::Key << "min_region_px" << YAML::Value << params.minRegionPx;
    out << YAML::Key << "max_region_px" << YAML::Value << params.maxRegionPx;
    out << YAML::Key << "max_region_count" << YAML::Value << params.maxRegionCount;
    out << YAML::Key << "connectivity" << YAML::Value << static_cast<int32_t>(params.connectivity);
    out << YAML::EndMap;
}

template<typename Band>
void EmitBands(YAML::Emitter& out, const std::vector<Band>& bands) {
    out << YAML::BeginSeq;
    for (const auto& band : bands) {
        out << YAML::Flow << YAML::BeginSeq << band.lowerBound << band.label << YAML::EndSeq;
    }
    out << YAML::EndSeq;
}

} // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

Pipeline::AnalysisConfig ParseAnalysisConfig(const std::string& yamlText) {
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    } catch (const YAML::Exception& e) {
        throw ConfigurationException(std::string("malformed YAML: ") + e.what());
    }

    Pipeline::AnalysisConfig config = Pipeline::AnalysisConfig::Default();
    if (root.IsNull()) {
        return config;
    }
    RequireMap(root, "document root");

    if (root["stain_matrix"]) ParseStainMatrix(root["stain_matrix"], config);
    if (root["enhance"]) ParseEnhance(root["enhance"], config.enhance);
    if (root["nuclei"]) ParseDetector(root["nuclei"], "nuclei", config.nuclei, config.nucleiChannel);
    if (root["stroma"]) ParseDetector(root["stroma"], "stroma", config.stroma, config.stromaChannel);

    if (root["weights"]) {
        const YAML::Node weights = root["weights"];
        RequireMap(weights, "weights");
        config.weights.clear();
        for (const auto& item : weights) {
            Grading::WeightEntry entry;
            entry.name = Scalar<std::string>(item.first, "weights");
            entry.weight = Scalar<double>(item.second, "weights." + entry.name);
            config.weights.push_back(entry);
        }
    }
    ReadIf(root, "weight_epsilon", config.weightEpsilon);

    if (root["grade_bands"]) {
        config.gradeBands = ParseBands<Grading::GradeBand>(root["grade_bands"], "grade_bands");
    }
    if (root["interpretation_bands"]) {
        config.interpretationBands =
            ParseBands<Grading::InterpretationBand>(root["interpretation_bands"], "interpretation_bands");
    }

    return config;
}

Pipeline::AnalysisConfig LoadAnalysisConfig(const std::string& path) {
    // A directory opens as a stream but yields no bytes
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw IOException("config path '" + path + "' is not a readable file");
    }

    std::ifstream file(path);
    if (!file) {
        throw IOException("cannot open config file '" + path + "'");
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw IOException("error reading config file '" + path + "'");
    }
    return ParseAnalysisConfig(ss.str());
}

std::string EmitAnalysisConfig(const Pipeline::AnalysisConfig& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "stain_matrix" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "names" << YAML::Value << YAML::Flow << config.stainMatrix.names;
    out << YAML::Key << "rows" << YAML::Value << YAML::BeginSeq;
    for (const auto& row : config.stainMatrix.rows) {
        out << YAML::Flow << YAML::BeginSeq << row[0] << row[1] << row[2] << YAML::EndSeq;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "normalize" << YAML::Value << false;
    out << YAML::Key << "max_optical_density" << YAML::Value << config.maxOpticalDensity;
    out << YAML::EndMap;

    out << YAML::Key << "enhance" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "denoise" << YAML::Value << Filter::DenoiseModeName(config.enhance.denoise);
    out << YAML::Key << "radius" << YAML::Value << config.enhance.radius;
    out << YAML::Key << "contrast" << YAML::Value << Filter::ContrastModeName(config.enhance.contrast);
    out << YAML::EndMap;

    out << YAML::Key << "nuclei" << YAML::Value;
    EmitDetector(out, config.nuclei, config.nucleiChannel);
    out << YAML::Key << "stroma" << YAML::Value;
    EmitDetector(out, config.stroma, config.stromaChannel);

    out << YAML::Key << "weights" << YAML::Value << YAML::BeginMap;
    for (const auto& entry : config.weights) {
        out << YAML::Key << entry.name << YAML::Value << entry.weight;
    }
    out << YAML::EndMap;
    out << YAML::Key << "weight_epsilon" << YAML::Value << config.weightEpsilon;

    out << YAML::Key << "grade_bands" << YAML::Value;
    EmitBands(out, config.gradeBands);
    out << YAML::Key << "interpretation_bands" << YAML::Value;
    EmitBands(out, config.interpretationBands);

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

void SaveAnalysisConfig(const Pipeline::AnalysisConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        throw IOException("cannot open '" + path + "' for writing");
    }
    file << EmitAnalysisConfig(config);
    if (!file) {
        throw IOException("failed writing '" + path + "'");
    }
}

} // namespace Patho::Morph::Config
