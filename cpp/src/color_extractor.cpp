#include "color_extractor.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

namespace Fitcast {
namespace Color {

namespace {

std::array<std::uint8_t, 3> toTriple(double r, double g, double b) {
    auto channel = [](double value) {
        return static_cast<std::uint8_t>(std::max(0.0, std::min(255.0, value)));
    };
    return {{channel(r), channel(g), channel(b)}};
}

} // namespace

StrategyResult StrategyResult::ok(std::vector<ColorSample> colors) {
    StrategyResult result;
    result.success = true;
    result.colors = std::move(colors);
    return result;
}

StrategyResult StrategyResult::failure(const std::string& error) {
    StrategyResult result;
    result.success = false;
    result.error = error;
    return result;
}

StrategyResult ColorStrategy::run(const cv::Mat& rgbCrop, int nColors) const {
    try {
        return doExtract(rgbCrop, nColors);
    } catch (const cv::Exception& e) {
        return StrategyResult::failure(getName() + " OpenCV error: " + e.what());
    } catch (const std::exception& e) {
        return StrategyResult::failure(getName() + " error: " + e.what());
    }
}

// ---------------------------------------------------------------------------
// Filtered k-means
// ---------------------------------------------------------------------------

cv::Mat ClusteringStrategy::createValidPixelMask(const cv::Mat& hsvCrop) const {
    std::vector<cv::Mat> channels;
    cv::split(hsvCrop, channels);
    const cv::Mat& s = channels[1];
    const cv::Mat& v = channels[2];

    cv::Mat notShadow = v > config_.shadow_value;
    cv::Mat notHighlight = v < config_.highlight_value;
    cv::Mat notBackground = (s > config_.background_saturation) | (v < config_.background_value);

    return notShadow & notHighlight & notBackground;
}

StrategyResult ClusteringStrategy::doExtract(const cv::Mat& rgbCrop, int nColors) const {
    cv::Mat hsv;
    cv::cvtColor(rgbCrop, hsv, cv::COLOR_RGB2HSV);

    cv::Mat mask = createValidPixelMask(hsv);
    const int validCount = cv::countNonZero(mask);
    if (validCount < config_.min_valid_pixels) {
        // Not enough garment pixels; let the fallback run
        return StrategyResult::ok({});
    }

    const int clusterCount = std::min(nColors, validCount / std::max(1, config_.pixels_per_cluster));
    if (clusterCount < 1) {
        return StrategyResult::ok({});
    }

    cv::Mat samples(validCount, 3, CV_32F);
    int row = 0;
    for (int y = 0; y < rgbCrop.rows; ++y) {
        const cv::Vec3b* px = rgbCrop.ptr<cv::Vec3b>(y);
        const uchar* valid = mask.ptr<uchar>(y);
        for (int x = 0; x < rgbCrop.cols; ++x) {
            if (!valid[x]) continue;
            float* out = samples.ptr<float>(row++);
            out[0] = px[x][0];
            out[1] = px[x][1];
            out[2] = px[x][2];
        }
    }

    // kmeans draws from the thread-local RNG; reseed for reproducible centroids
    cv::theRNG().state = static_cast<uint64>(config_.random_seed);

    cv::Mat labels, centers;
    cv::kmeans(samples, clusterCount, labels,
               cv::TermCriteria(cv::TermCriteria::EPS + cv::TermCriteria::COUNT,
                                config_.kmeans_max_iterations, 1e-4),
               config_.kmeans_attempts, cv::KMEANS_PP_CENTERS, centers);

    std::vector<int> counts(clusterCount, 0);
    for (int i = 0; i < labels.rows; ++i) {
        counts[labels.at<int>(i)]++;
    }

    std::vector<ColorSample> colors;
    for (int k = 0; k < clusterCount; ++k) {
        double percentage = 100.0 * counts[k] / validCount;
        if (percentage < config_.min_cluster_percentage) {
            continue;
        }

        const float* center = centers.ptr<float>(k);
        ColorSample sample;
        sample.rgb = toTriple(center[0], center[1], center[2]);
        sample.name = classifier_.classify(sample.rgb);
        sample.method = ExtractionMethod::CLUSTERING;
        sample.percentage = percentage;
        colors.push_back(sample);
    }

    std::stable_sort(colors.begin(), colors.end(), [](const ColorSample& a, const ColorSample& b) {
        return a.percentage.value_or(0.0) > b.percentage.value_or(0.0);
    });

    return StrategyResult::ok(std::move(colors));
}

// ---------------------------------------------------------------------------
// Median-cut palette
// ---------------------------------------------------------------------------

StrategyResult PaletteStrategy::doExtract(const cv::Mat& rgbCrop, int /*nColors*/) const {
    std::vector<PaletteSwatch> swatches = quantizer_.quantize(rgbCrop);

    int total = 0;
    for (const auto& swatch : swatches) {
        total += swatch.population;
    }

    std::vector<ColorSample> colors;
    for (const auto& swatch : swatches) {
        ColorSample sample;
        sample.rgb = {{swatch.rgb[0], swatch.rgb[1], swatch.rgb[2]}};
        sample.name = classifier_.classify(sample.rgb);
        sample.method = ExtractionMethod::PALETTE;
        if (total > 0) {
            sample.percentage = 100.0 * swatch.population / total;
        }
        colors.push_back(sample);
    }
    return StrategyResult::ok(std::move(colors));
}

// ---------------------------------------------------------------------------
// Mean color and most saturated pixel
// ---------------------------------------------------------------------------

StrategyResult SimpleStrategy::doExtract(const cv::Mat& rgbCrop, int /*nColors*/) const {
    std::vector<ColorSample> colors;

    cv::Scalar mean = cv::mean(rgbCrop);
    ColorSample average;
    average.rgb = toTriple(std::round(mean[0]), std::round(mean[1]), std::round(mean[2]));
    average.name = classifier_.classify(average.rgb);
    average.method = ExtractionMethod::SIMPLE;
    colors.push_back(average);

    cv::Mat hsv;
    cv::cvtColor(rgbCrop, hsv, cv::COLOR_RGB2HSV);

    const int step = std::max(1, config_.saturation_sample_step);
    int bestSaturation = -1;
    cv::Vec3b bestPixel;
    int index = 0;
    for (int y = 0; y < hsv.rows; ++y) {
        const cv::Vec3b* hsvRow = hsv.ptr<cv::Vec3b>(y);
        const cv::Vec3b* rgbRow = rgbCrop.ptr<cv::Vec3b>(y);
        for (int x = 0; x < hsv.cols; ++x, ++index) {
            if (index % step != 0) continue;
            if (hsvRow[x][1] > bestSaturation) {
                bestSaturation = hsvRow[x][1];
                bestPixel = rgbRow[x];
            }
        }
    }

    if (bestSaturation >= 0) {
        ColorSample saturated;
        saturated.rgb = {{bestPixel[0], bestPixel[1], bestPixel[2]}};
        saturated.name = classifier_.classify(saturated.rgb);
        saturated.method = ExtractionMethod::SIMPLE;
        colors.push_back(saturated);
    }

    return StrategyResult::ok(std::move(colors));
}

// ---------------------------------------------------------------------------
// Merge
// ---------------------------------------------------------------------------

int methodPriority(ExtractionMethod method) {
    switch (method) {
        case ExtractionMethod::CLUSTERING: return 0;
        case ExtractionMethod::PALETTE:    return 1;
        case ExtractionMethod::SIMPLE:     return 2;
        case ExtractionMethod::FALLBACK:   return 3;
    }
    return 4;
}

std::vector<ColorSample> mergeColorResults(const std::vector<StrategyResult>& results) {
    std::vector<ColorSample> all;
    for (const auto& result : results) {
        if (!result.success) continue;
        all.insert(all.end(), result.colors.begin(), result.colors.end());
    }

    std::stable_sort(all.begin(), all.end(), [](const ColorSample& a, const ColorSample& b) {
        int pa = methodPriority(a.method);
        int pb = methodPriority(b.method);
        if (pa != pb) return pa < pb;
        return a.percentage.value_or(0.0) > b.percentage.value_or(0.0);
    });

    std::set<std::string> seen;
    std::vector<ColorSample> merged;
    for (const auto& color : all) {
        if (color.name == "unknown" || color.name.empty()) continue;
        if (!seen.insert(color.name).second) continue;
        merged.push_back(color);
    }
    return merged;
}

std::vector<ColorSample> neutralFallbackColors() {
    ColorSample gray;
    gray.rgb = {{100, 100, 100}};
    gray.name = "gray";
    gray.method = ExtractionMethod::FALLBACK;

    ColorSample darkGray;
    darkGray.rgb = {{64, 64, 64}};
    darkGray.name = "dark_gray";
    darkGray.method = ExtractionMethod::FALLBACK;

    return {gray, darkGray};
}

// ---------------------------------------------------------------------------
// ColorExtractor
// ---------------------------------------------------------------------------

ColorExtractor::ColorExtractor(const ExtractionConfig& config) {
    strategies_.push_back(std::make_unique<ClusteringStrategy>(config));
    strategies_.push_back(std::make_unique<PaletteStrategy>(config));
    strategies_.push_back(std::make_unique<SimpleStrategy>(config));
}

ColorExtractor::ColorExtractor(std::vector<std::unique_ptr<ColorStrategy>> strategies)
    : strategies_(std::move(strategies)) {}

cv::Mat ColorExtractor::toRgb(const cv::Mat& crop) const {
    cv::Mat rgb;
    switch (crop.channels()) {
        case 1: cv::cvtColor(crop, rgb, cv::COLOR_GRAY2RGB); break;
        case 4: cv::cvtColor(crop, rgb, cv::COLOR_BGRA2RGB); break;
        default: cv::cvtColor(crop, rgb, cv::COLOR_BGR2RGB); break;
    }
    if (rgb.depth() != CV_8U) {
        rgb.convertTo(rgb, CV_8U);
    }
    return rgb;
}

std::vector<ColorSample> ColorExtractor::extract(const cv::Mat& imageBgr, const BoundingBox& bbox,
                                                 int nColors) const {
    if (imageBgr.empty() || nColors <= 0) {
        return {};
    }

    BoundingBox clamped;
    clamped.x1 = std::max(0, bbox.x1);
    clamped.y1 = std::max(0, bbox.y1);
    clamped.x2 = std::min(imageBgr.cols, bbox.x2);
    clamped.y2 = std::min(imageBgr.rows, bbox.y2);
    if (clamped.isDegenerate()) {
        return {};
    }

    cv::Rect roi(clamped.x1, clamped.y1, clamped.x2 - clamped.x1, clamped.y2 - clamped.y1);
    cv::Mat crop;
    try {
        crop = toRgb(imageBgr(roi));
    } catch (const cv::Exception& e) {
        std::cerr << "ColorExtractor: could not prepare crop: " << e.what() << std::endl;
        return neutralFallbackColors();
    }
    if (crop.empty()) {
        return {};
    }

    if (debug_mode_) {
        std::clog << "    Analyzing region: " << roi.width << "x" << roi.height << " pixels" << std::endl;
    }

    std::vector<StrategyResult> results;
    bool clusteringDelivered = false;
    bool anySucceeded = false;

    auto record = [&](const ColorStrategy& strategy, StrategyResult result) {
        if (!result.success) {
            std::cerr << "    " << strategy.getName() << " failed: " << result.error << std::endl;
        } else {
            anySucceeded = true;
            if (strategy.getMethod() == ExtractionMethod::CLUSTERING && !result.colors.empty()) {
                clusteringDelivered = true;
            }
        }
        results.push_back(std::move(result));
    };

    for (const auto& strategy : strategies_) {
        if (strategy->isFallbackOnly()) continue;
        record(*strategy, strategy->run(crop, nColors));
    }

    if (!clusteringDelivered) {
        for (const auto& strategy : strategies_) {
            if (!strategy->isFallbackOnly()) continue;
            record(*strategy, strategy->run(crop, nColors));
        }
    }

    std::vector<ColorSample> colors = anySucceeded ? mergeColorResults(results) : neutralFallbackColors();
    if (static_cast<int>(colors.size()) > nColors) {
        colors.resize(nColors);
    }
    return colors;
}

} // namespace Color
} // namespace Fitcast
