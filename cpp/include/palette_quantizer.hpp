#ifndef PALETTE_QUANTIZER_HPP
#define PALETTE_QUANTIZER_HPP

#include <opencv2/core.hpp>
#include <vector>

namespace Fitcast {
namespace Color {

struct PaletteSwatch {
    cv::Vec3b rgb;
    int population;
};

/**
 * @brief Modified median cut quantization over a 5-bit-per-channel histogram.
 *
 * Boxes are split by population until 75% of the requested colors exist, then
 * by population times volume. Near-white pixels (all channels above 250) are
 * ignored, matching common palette extractors.
 */
class PaletteQuantizer {
public:
    explicit PaletteQuantizer(int colorCount = 5, int quality = 1);

    // rgbImage must be CV_8UC3 in RGB order. Swatches are sorted by population.
    std::vector<PaletteSwatch> quantize(const cv::Mat& rgbImage) const;

private:
    static constexpr int SIGBITS = 5;
    static constexpr int RSHIFT = 8 - SIGBITS;
    static constexpr int HIST_SIDE = 1 << SIGBITS;
    static constexpr int MAX_ITERATIONS = 1000;
    static constexpr double FRACT_BY_POPULATION = 0.75;

    struct VBox {
        int lo[3];
        int hi[3];
        int count;

        int volume() const {
            return (hi[0] - lo[0] + 1) * (hi[1] - lo[1] + 1) * (hi[2] - lo[2] + 1);
        }
        bool splittable() const {
            return count > 1 && (lo[0] != hi[0] || lo[1] != hi[1] || lo[2] != hi[2]);
        }
    };

    static int histIndex(int r, int g, int b) { return (r << (2 * SIGBITS)) + (g << SIGBITS) + b; }

    // Shrinks the box to its occupied bins and refreshes its count
    VBox fitBox(const std::vector<int>& histogram, const VBox& box) const;
    bool splitBox(const std::vector<int>& histogram, const VBox& box, VBox& first, VBox& second) const;
    void iterateSplits(const std::vector<int>& histogram, std::vector<VBox>& boxes,
                       size_t target, bool byVolume) const;
    cv::Vec3b boxAverage(const std::vector<int>& histogram, const VBox& box) const;

    int colorCount_;
    int quality_;
};

} // namespace Color
} // namespace Fitcast

#endif // PALETTE_QUANTIZER_HPP
