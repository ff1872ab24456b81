#ifndef COLOR_CLASSIFIER_HPP
#define COLOR_CLASSIFIER_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Fitcast {
namespace Color {

// OpenCV 8-bit HSV sample: hue in [0, 180], saturation and value in [0, 255]
struct HsvSample {
    int h;
    int s;
    int v;
};

/**
 * @brief Maps a single color sample to a perceptual color name.
 *
 * Hue bands use the OpenCV half-hue scale. Every band treats its lower bound
 * as inclusive and its upper bound as exclusive; red wraps around 170..180
 * and 0..10.
 */
class ColorClassifier {
public:
    // Branch selection thresholds
    static constexpr int LOW_SATURATION = 30;
    static constexpr int LOW_VALUE = 40;
    static constexpr int HIGH_VALUE = 200;
    static constexpr int PASTEL_SATURATION = 80;

    std::string classify(const std::array<std::uint8_t, 3>& rgb) const;
    std::string classifyHsv(int h, int s, int v) const;

    static HsvSample rgbToHsv(const std::array<std::uint8_t, 3>& rgb);

    // Fixed output vocabulary, "unknown" included
    static const std::vector<std::string>& vocabulary();
    static bool isKnownName(const std::string& name);

private:
    std::string classifyGrayscale(int v) const;
    std::string classifyDark(int h, int s, int v) const;
    std::string classifyLight(int h, int s, int v) const;
    std::string classifyByHue(int h, int s, int v) const;

    static bool inBand(int h, int lower, int upper) { return h >= lower && h < upper; }
    static bool isRedHue(int h) { return h < 10 || h >= 170; }
    static bool isBlueHue(int h) { return inBand(h, 95, 125); }
    static bool isGreenHue(int h) { return inBand(h, 35, 85); }
};

} // namespace Color
} // namespace Fitcast

#endif // COLOR_CLASSIFIER_HPP
