/**
 * @file analyze_slide.cpp
 * @brief 示例：H&E 切片分析 / Example: H&E slide analysis
 *
 * Usage: pathomorph_analyze <image> [--config analysis.yaml] [--log-level info]
 *                           [--save-config out.yaml]
 */

#include <PathoMorph/PathoMorph.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

using namespace Patho::Morph;

namespace {

struct StbImageDeleter {
    void operator()(uint8_t* data) const { stbi_image_free(data); }
};

void PrintDetection(const char* name, const Pipeline::DetectionSummary& summary) {
    printf("   %-8s regions: %lld, threshold: %d, discarded: %lld, truncated: %lld%s\n",
           name, static_cast<long long>(summary.regionCount), summary.threshold,
           static_cast<long long>(summary.discardedCount),
           static_cast<long long>(summary.truncatedCount),
           summary.regionLimitReached ? " (region limit reached)" : "");
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    printf("=== PathoMorph %s Sample: Slide Analysis ===\n\n", GetVersion());

    if (argc < 2) {
        printf("Usage: %s <image> [--config file.yaml] [--log-level level] "
               "[--save-config file.yaml]\n", argv[0]);
        return 1;
    }

    std::string imagePath = argv[1];
    std::string configPath;
    std::string saveConfigPath;
    Platform::SetLogLevel(Platform::LogLevel::Info);

    for (int i = 2; i + 1 < argc; i += 2) {
        if (std::strcmp(argv[i], "--config") == 0) {
            configPath = argv[i + 1];
        } else if (std::strcmp(argv[i], "--log-level") == 0) {
            Platform::SetLogLevel(Platform::ParseLogLevel(argv[i + 1], Platform::LogLevel::Info));
        } else if (std::strcmp(argv[i], "--save-config") == 0) {
            saveConfigPath = argv[i + 1];
        } else {
            printf("Unknown option '%s'\n", argv[i]);
            return 1;
        }
    }

    try {
        // 1. 配置 / Configuration
        printf("1. Loading configuration...\n");
        Pipeline::AnalysisConfig config = configPath.empty()
            ? Pipeline::AnalysisConfig::Default()
            : Config::LoadAnalysisConfig(configPath);
        printf("   Source: %s\n", configPath.empty() ? "built-in defaults" : configPath.c_str());
        if (!saveConfigPath.empty()) {
            Config::SaveAnalysisConfig(config, saveConfigPath);
            printf("   Saved effective config to '%s'\n", saveConfigPath.c_str());
        }

        Pipeline::TissueAnalyzer analyzer(config);

        // 2. 加载图像 / Load image as RGBA
        printf("\n2. Loading '%s'...\n", imagePath.c_str());
        int w = 0;
        int h = 0;
        int channels = 0;
        std::unique_ptr<uint8_t, StbImageDeleter> pixels(
            stbi_load(imagePath.c_str(), &w, &h, &channels, PixelBuffer::BYTES_PER_PIXEL));
        if (!pixels) {
            printf("   Could not load image: %s\n", stbi_failure_reason());
            return 1;
        }
        printf("   Size: %dx%d, source channels: %d\n", w, h, channels);

        PixelBuffer buffer(pixels.get(), w, h,
                           static_cast<size_t>(w) * h * PixelBuffer::BYTES_PER_PIXEL);

        // 3. 分析 / Analyze
        printf("\n3. Running analysis...\n");
        Pipeline::AnalysisResult result = analyzer.Analyze(buffer);
        PrintDetection("nuclei", result.nuclei);
        PrintDetection("stroma", result.stroma);

        // 4. 各项评分 / Per-algorithm scores
        printf("\n4. Scores:\n");
        for (const auto& r : result.aggregate.results) {
            printf("   %-22s score %.3f  conf %.3f  weight %.2f  %-8s%s\n",
                   r.name.c_str(), r.score, r.confidence, r.weight,
                   r.interpretation.c_str(),
                   r.insufficientSamples ? "  [insufficient samples]" : "");
            for (const auto& feature : r.features.Entries()) {
                printf("      %-22s %.4f\n", feature.first.c_str(), feature.second);
            }
        }

        // 5. 分级 / Grade
        printf("\n5. Result:\n");
        printf("   Overall score:      %.3f\n", result.aggregate.overallScore);
        printf("   Overall confidence: %.3f\n", result.aggregate.overallConfidence);
        printf("   Grade:              %s (rank %d)\n", result.grade.label.c_str(), result.grade.rank);

        // 6. 耗时 / Timings
        printf("\n6. Timings (ms): deconvolve %.1f, enhance %.1f, detect %.1f, "
               "measure %.1f, score %.1f, total %.1f\n",
               result.timings.deconvolveMs, result.timings.enhanceMs, result.timings.detectMs,
               result.timings.measureMs, result.timings.scoreMs, result.timings.totalMs);
    } catch (const Exception& e) {
        printf("\nError: %s\n", e.what());
        return 1;
    }

    printf("\n=== Done ===\n");
    return 0;
}
