#include "outfit_analyzer.hpp"
#include <opencv2/imgcodecs.hpp>
#include <chrono>
#include <cmath>
#include <iostream>
#include <set>

namespace Fitcast {

OutfitAnalyzer::OutfitAnalyzer(std::shared_ptr<IDetectorModel> detector,
                               std::shared_ptr<ISimilarityModel> similarity,
                               const AnalyzerOptions& options)
    : detector_(std::move(detector)),
      options_(options),
      extractor_(options.extraction),
      scoring_(std::move(similarity), options.weights) {
    extractor_.setDebugMode(options_.debug_mode);
    scoring_.setDebugMode(options_.debug_mode);
}

bool OutfitAnalyzer::isReady() const {
    return detector_ && detector_->isAvailable();
}

AnalysisResult OutfitAnalyzer::analyze(const std::string& imagePath, const std::string& occasion) const {
    // Occasion and detector are checked before touching the file
    parseOccasion(occasion);
    if (!isReady()) {
        throw ModelUnavailableError("Detector model not available");
    }

    cv::Mat image = cv::imread(imagePath, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw ImageLoadError(imagePath);
    }
    return analyze(image, imagePath, occasion);
}

AnalysisResult OutfitAnalyzer::analyze(const cv::Mat& imageBgr, const std::string& imageRef,
                                       const std::string& occasion) const {
    auto start = std::chrono::steady_clock::now();

    const Occasion parsed = parseOccasion(occasion);
    if (!isReady()) {
        throw ModelUnavailableError("Detector model not available");
    }

    std::clog << "Analyzing outfit for occasion: " << occasionKey(parsed) << std::endl;

    AnalysisResult result;
    result.occasion = parsed;
    result.occasionDescription = occasionDescription(parsed);

    std::vector<RawDetection> raw;
    try {
        raw = detector_->detect(imageRef);
    } catch (const cv::Exception& e) {
        throw AnalysisError(std::string("Detection failed: ") + e.what());
    } catch (const std::exception& e) {
        throw AnalysisError(std::string("Detection failed: ") + e.what());
    }

    result.detections = mapDetections(raw);
    std::clog << "Detected " << result.detections.size() << " clothing items" << std::endl;

    extractColors(imageBgr, result.detections);

    result.breakdown = scoring_.score(result.detections, parsed, imageRef);
    result.styleScore = scoring_.finalScore(result.breakdown);
    result.feedback = Scoring::feedbackFor(result.styleScore, parsed);

    result.totalItems = static_cast<int>(result.detections.size());
    result.uniqueColors = static_cast<int>(Scoring::colorNamesOf(result.detections).size());

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    result.analysisTimeSeconds = elapsed.count();

    std::clog << "Analysis complete in " << roundTo(result.analysisTimeSeconds, 2)
              << "s. Final score: " << roundTo(result.styleScore, 1) << "/10" << std::endl;
    return result;
}

std::vector<Detection> OutfitAnalyzer::mapDetections(const std::vector<RawDetection>& raw) const {
    std::vector<Detection> detections;
    detections.reserve(raw.size());

    for (const auto& r : raw) {
        ItemClass itemClass;
        if (!itemClassFromId(r.classId, itemClass)) {
            std::cerr << "Warning: dropping detection with unknown class id " << r.classId << std::endl;
            continue;
        }
        Detection detection;
        detection.itemClass = itemClass;
        detection.confidence = r.confidence;
        detection.bbox = r.bbox;
        detections.push_back(detection);
    }
    return detections;
}

void OutfitAnalyzer::extractColors(const cv::Mat& imageBgr, std::vector<Detection>& detections) const {
    for (size_t i = 0; i < detections.size(); ++i) {
        Detection& detection = detections[i];
        if (options_.debug_mode) {
            std::clog << "  Processing item " << (i + 1) << ": " << itemClassName(detection.itemClass) << std::endl;
        }

        detection.colors = extractor_.extract(imageBgr, detection.bbox, options_.colors_per_item);

        if (options_.debug_mode) {
            std::clog << "    Colors found:";
            for (const auto& color : detection.colors) {
                std::clog << " " << color.name;
            }
            std::clog << std::endl;
        }
    }
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

double roundTo(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

nlohmann::json toJson(const ColorSample& color) {
    nlohmann::json j;
    j["rgb"] = {color.rgb[0], color.rgb[1], color.rgb[2]};
    j["name"] = color.name;
    j["method"] = extractionMethodName(color.method);
    if (color.percentage) {
        j["percentage"] = roundTo(*color.percentage, 1);
    }
    return j;
}

nlohmann::json toJson(const Detection& detection) {
    nlohmann::json colors = nlohmann::json::array();
    for (const auto& color : detection.colors) {
        colors.push_back(toJson(color));
    }

    nlohmann::json j;
    j["class"] = itemClassName(detection.itemClass);
    j["confidence"] = detection.confidence;
    j["bbox"] = {detection.bbox.x1, detection.bbox.y1, detection.bbox.x2, detection.bbox.y2};
    j["colors"] = colors;
    return j;
}

nlohmann::json toJson(const AnalysisResult& result) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& detection : result.detections) {
        items.push_back(toJson(detection));
    }

    nlohmann::json j;
    j["style_score"] = roundTo(result.styleScore, 1);
    j["occasion"] = occasionKey(result.occasion);
    j["occasion_description"] = result.occasionDescription;
    j["detected_items"] = items;
    j["scoring_breakdown"] = {
        {"clip_contextual", roundTo(result.breakdown.contextual, 1)},
        {"color_harmony", roundTo(result.breakdown.colorHarmony, 1)},
        {"item_completeness", roundTo(result.breakdown.completeness, 1)},
        {"style_coherence", roundTo(result.breakdown.coherence, 1)}
    };
    j["contextual_feedback"] = result.feedback;
    j["total_items"] = result.totalItems;
    j["unique_colors"] = result.uniqueColors;
    j["analysis_time_seconds"] = roundTo(result.analysisTimeSeconds, 2);
    return j;
}

} // namespace Fitcast
