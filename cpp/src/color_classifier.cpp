#include "color_classifier.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace Fitcast {
namespace Color {

std::string ColorClassifier::classify(const std::array<std::uint8_t, 3>& rgb) const {
    HsvSample hsv = rgbToHsv(rgb);
    return classifyHsv(hsv.h, hsv.s, hsv.v);
}

HsvSample ColorClassifier::rgbToHsv(const std::array<std::uint8_t, 3>& rgb) {
    cv::Mat rgbMat(1, 1, CV_8UC3, cv::Scalar(rgb[0], rgb[1], rgb[2]));
    cv::Mat hsvMat;
    cv::cvtColor(rgbMat, hsvMat, cv::COLOR_RGB2HSV);
    const cv::Vec3b hsv = hsvMat.at<cv::Vec3b>(0, 0);
    return {hsv[0], hsv[1], hsv[2]};
}

std::string ColorClassifier::classifyHsv(int h, int s, int v) const {
    if (s < LOW_SATURATION) {
        return classifyGrayscale(v);
    }
    if (v < LOW_VALUE) {
        return classifyDark(h, s, v);
    }
    if (v > HIGH_VALUE && s < PASTEL_SATURATION) {
        return classifyLight(h, s, v);
    }
    return classifyByHue(h, s, v);
}

std::string ColorClassifier::classifyGrayscale(int v) const {
    if (v < 40) return "black";
    if (v < 80) return "dark_gray";
    if (v < 120) return "gray";
    if (v < 160) return "light_gray";
    if (v < 220) return "silver";
    return "white";
}

std::string ColorClassifier::classifyDark(int h, int s, int v) const {
    if (s < LOW_SATURATION) {
        return v < 30 ? "black" : "dark_gray";
    }

    if (isBlueHue(h)) return "navy";
    if (isGreenHue(h)) return "dark_green";
    if (isRedHue(h)) return "dark_red";
    return "dark_gray";
}

std::string ColorClassifier::classifyLight(int h, int s, int v) const {
    if (s < LOW_SATURATION) {
        return v > 230 ? "white" : "light_gray";
    }

    // Pastels
    if (isBlueHue(h)) return "light_blue";
    if (inBand(h, 145, 170)) return "pink";
    if (inBand(h, 25, 35)) return "cream";
    return "beige";
}

std::string ColorClassifier::classifyByHue(int h, int s, int v) const {
    if (isRedHue(h)) {
        return v > 150 ? "red" : "dark_red";
    }
    if (inBand(h, 10, 25)) {
        return "orange";
    }
    if (inBand(h, 25, 35)) {
        return s > 100 ? "yellow" : "cream";
    }
    if (isGreenHue(h)) {
        if (h < 50) return "yellow_green";
        if (h < 70) return "green";
        return "teal";
    }
    if (inBand(h, 85, 95)) {
        return "cyan";
    }
    if (isBlueHue(h)) {
        if (v < 100) return "navy";
        return h < 110 ? "blue" : "royal_blue";
    }
    if (inBand(h, 125, 145)) {
        return "purple";
    }
    // Remaining band is [145, 170)
    return v > 180 ? "pink" : "magenta";
}

const std::vector<std::string>& ColorClassifier::vocabulary() {
    static const std::vector<std::string> names = {
        "black", "dark_gray", "gray", "light_gray", "silver", "white",
        "navy", "dark_green", "dark_red",
        "light_blue", "pink", "cream", "beige",
        "red", "orange", "yellow", "yellow_green", "green", "teal", "cyan",
        "blue", "royal_blue", "purple", "magenta",
        "unknown"
    };
    return names;
}

bool ColorClassifier::isKnownName(const std::string& name) {
    const auto& names = vocabulary();
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace Color
} // namespace Fitcast
