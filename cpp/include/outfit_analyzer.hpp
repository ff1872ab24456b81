#pragma once

#include "color_extractor.hpp"
#include "model_interfaces.hpp"
#include "outfit_types.hpp"
#include "scoring_engine.hpp"

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace Fitcast {

struct AnalyzerOptions {
    int colors_per_item = 2;
    bool debug_mode = false;
    Color::ExtractionConfig extraction;
    Scoring::ScoringWeights weights;
};

/**
 * @brief Detection -> per-item colors -> scoring -> feedback.
 *
 * Models are injected at construction. Only an unknown occasion, a missing
 * detector or an unreadable image abort an analysis; per-item and
 * per-strategy problems degrade locally.
 */
class OutfitAnalyzer {
public:
    OutfitAnalyzer(std::shared_ptr<IDetectorModel> detector,
                   std::shared_ptr<ISimilarityModel> similarity,
                   const AnalyzerOptions& options = AnalyzerOptions());

    AnalysisResult analyze(const std::string& imagePath, const std::string& occasion) const;

    /**
     * @brief Analyze an already decoded frame.
     *
     * @param imageBgr decoded image used for color extraction
     * @param imageRef path handed to the detector and similarity models
     * @param occasion occasion key
     */
    AnalysisResult analyze(const cv::Mat& imageBgr, const std::string& imageRef,
                           const std::string& occasion) const;

    bool isReady() const;

private:
    std::shared_ptr<IDetectorModel> detector_;
    AnalyzerOptions options_;
    Color::ColorExtractor extractor_;
    Scoring::ScoringEngine scoring_;

    std::vector<Detection> mapDetections(const std::vector<RawDetection>& raw) const;
    void extractColors(const cv::Mat& imageBgr, std::vector<Detection>& detections) const;
};

// Output document; scores rounded to one decimal, time to two
nlohmann::json toJson(const AnalysisResult& result);
nlohmann::json toJson(const Detection& detection);
nlohmann::json toJson(const ColorSample& color);

double roundTo(double value, int decimals);

} // namespace Fitcast
