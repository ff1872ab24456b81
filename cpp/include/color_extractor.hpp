#ifndef COLOR_EXTRACTOR_HPP
#define COLOR_EXTRACTOR_HPP

#include "color_classifier.hpp"
#include "outfit_types.hpp"
#include "palette_quantizer.hpp"

#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Fitcast {
namespace Color {

struct ExtractionConfig {
    // Quantized palette
    int palette_size = 5;
    int palette_quality = 1;

    // Valid pixel mask for clustering
    int shadow_value = 30;            // V must be above this
    int highlight_value = 240;        // V must be below this
    int background_saturation = 15;   // bright pixels need S above this...
    int background_value = 180;       // ...unless V is below this
    int min_valid_pixels = 100;
    int pixels_per_cluster = 50;
    double min_cluster_percentage = 10.0;
    int kmeans_attempts = 10;
    int kmeans_max_iterations = 300;
    int random_seed = 42;

    // Simple fallback
    int saturation_sample_step = 4;
};

struct StrategyResult {
    bool success = false;
    std::vector<ColorSample> colors;
    std::string error;

    static StrategyResult ok(std::vector<ColorSample> colors);
    static StrategyResult failure(const std::string& error);
};

/**
 * @brief One independent way of naming the dominant colors of a crop.
 *
 * run() never throws: exceptions raised by the implementation are turned into
 * a failed StrategyResult so one strategy cannot abort the others.
 */
class ColorStrategy {
public:
    virtual ~ColorStrategy() = default;

    StrategyResult run(const cv::Mat& rgbCrop, int nColors) const;

    virtual ExtractionMethod getMethod() const = 0;
    virtual std::string getName() const = 0;

    // Fallback strategies only run when clustering produced nothing
    virtual bool isFallbackOnly() const { return false; }

protected:
    virtual StrategyResult doExtract(const cv::Mat& rgbCrop, int nColors) const = 0;

    ColorClassifier classifier_;
};

class ClusteringStrategy : public ColorStrategy {
public:
    explicit ClusteringStrategy(const ExtractionConfig& config) : config_(config) {}

    ExtractionMethod getMethod() const override { return ExtractionMethod::CLUSTERING; }
    std::string getName() const override { return "filtered k-means"; }

    // 8-bit mask of pixels that are neither shadow, highlight nor bright background
    cv::Mat createValidPixelMask(const cv::Mat& hsvCrop) const;

protected:
    StrategyResult doExtract(const cv::Mat& rgbCrop, int nColors) const override;

private:
    ExtractionConfig config_;
};

class PaletteStrategy : public ColorStrategy {
public:
    explicit PaletteStrategy(const ExtractionConfig& config)
        : quantizer_(config.palette_size, config.palette_quality) {}

    ExtractionMethod getMethod() const override { return ExtractionMethod::PALETTE; }
    std::string getName() const override { return "median-cut palette"; }

protected:
    StrategyResult doExtract(const cv::Mat& rgbCrop, int nColors) const override;

private:
    PaletteQuantizer quantizer_;
};

class SimpleStrategy : public ColorStrategy {
public:
    explicit SimpleStrategy(const ExtractionConfig& config) : config_(config) {}

    ExtractionMethod getMethod() const override { return ExtractionMethod::SIMPLE; }
    std::string getName() const override { return "mean and most saturated"; }
    bool isFallbackOnly() const override { return true; }

protected:
    StrategyResult doExtract(const cv::Mat& rgbCrop, int nColors) const override;

private:
    ExtractionConfig config_;
};

// Lower value wins when results from several strategies name the same color
int methodPriority(ExtractionMethod method);

// Priority/percentage ordering followed by name deduplication; "unknown" is dropped
std::vector<ColorSample> mergeColorResults(const std::vector<StrategyResult>& results);

// Fixed neutral colors returned when every strategy failed
std::vector<ColorSample> neutralFallbackColors();

class ColorExtractor {
public:
    explicit ColorExtractor(const ExtractionConfig& config = ExtractionConfig());
    explicit ColorExtractor(std::vector<std::unique_ptr<ColorStrategy>> strategies);

    /**
     * @brief Named dominant colors of one detected item.
     *
     * @param imageBgr full frame (BGR, BGRA or grayscale)
     * @param bbox item box, clamped to the frame
     * @param nColors maximum number of colors returned
     * @return ranked colors; empty for a degenerate box
     */
    std::vector<ColorSample> extract(const cv::Mat& imageBgr, const BoundingBox& bbox, int nColors) const;

    void setDebugMode(bool enabled) { debug_mode_ = enabled; }

private:
    std::vector<std::unique_ptr<ColorStrategy>> strategies_;
    bool debug_mode_ = false;

    cv::Mat toRgb(const cv::Mat& crop) const;
};

} // namespace Color
} // namespace Fitcast

#endif // COLOR_EXTRACTOR_HPP
