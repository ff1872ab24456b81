#include "palette_quantizer.hpp"
#include <algorithm>
#include <stdexcept>

namespace Fitcast {
namespace Color {

PaletteQuantizer::PaletteQuantizer(int colorCount, int quality)
    : colorCount_(std::max(1, colorCount)), quality_(std::max(1, quality)) {}

std::vector<PaletteSwatch> PaletteQuantizer::quantize(const cv::Mat& rgbImage) const {
    std::vector<PaletteSwatch> palette;
    if (rgbImage.empty()) {
        return palette;
    }
    if (rgbImage.type() != CV_8UC3) {
        throw std::invalid_argument("PaletteQuantizer expects an 8-bit 3-channel image");
    }

    // Build the quantized histogram from every quality-th pixel
    std::vector<int> histogram(HIST_SIDE * HIST_SIDE * HIST_SIDE, 0);
    int sampled = 0;
    int pixelIndex = 0;
    for (int y = 0; y < rgbImage.rows; ++y) {
        const cv::Vec3b* row = rgbImage.ptr<cv::Vec3b>(y);
        for (int x = 0; x < rgbImage.cols; ++x, ++pixelIndex) {
            if (pixelIndex % quality_ != 0) continue;
            const cv::Vec3b& px = row[x];
            if (px[0] > 250 && px[1] > 250 && px[2] > 250) continue;
            histogram[histIndex(px[0] >> RSHIFT, px[1] >> RSHIFT, px[2] >> RSHIFT)]++;
            ++sampled;
        }
    }

    if (sampled == 0) {
        return palette;
    }

    VBox initial{{0, 0, 0}, {HIST_SIDE - 1, HIST_SIDE - 1, HIST_SIDE - 1}, 0};
    std::vector<VBox> boxes{fitBox(histogram, initial)};

    const size_t target = static_cast<size_t>(colorCount_);
    size_t byPopulation = static_cast<size_t>(FRACT_BY_POPULATION * colorCount_);
    byPopulation = std::max<size_t>(1, byPopulation);

    iterateSplits(histogram, boxes, byPopulation, false);
    iterateSplits(histogram, boxes, target, true);

    for (const auto& box : boxes) {
        if (box.count > 0) {
            palette.push_back({boxAverage(histogram, box), box.count});
        }
    }

    std::stable_sort(palette.begin(), palette.end(),
        [](const PaletteSwatch& a, const PaletteSwatch& b) { return a.population > b.population; });

    if (palette.size() > target) {
        palette.resize(target);
    }
    return palette;
}

PaletteQuantizer::VBox PaletteQuantizer::fitBox(const std::vector<int>& histogram, const VBox& box) const {
    VBox fitted{{HIST_SIDE, HIST_SIDE, HIST_SIDE}, {-1, -1, -1}, 0};

    for (int r = box.lo[0]; r <= box.hi[0]; ++r) {
        for (int g = box.lo[1]; g <= box.hi[1]; ++g) {
            for (int b = box.lo[2]; b <= box.hi[2]; ++b) {
                int value = histogram[histIndex(r, g, b)];
                if (value == 0) continue;
                fitted.count += value;
                const int coords[3] = {r, g, b};
                for (int axis = 0; axis < 3; ++axis) {
                    fitted.lo[axis] = std::min(fitted.lo[axis], coords[axis]);
                    fitted.hi[axis] = std::max(fitted.hi[axis], coords[axis]);
                }
            }
        }
    }

    if (fitted.count == 0) {
        VBox empty = box;
        empty.count = 0;
        return empty;
    }
    return fitted;
}

bool PaletteQuantizer::splitBox(const std::vector<int>& histogram, const VBox& box,
                                VBox& first, VBox& second) const {
    if (!box.splittable()) {
        return false;
    }

    // Cut along the longest axis
    int axis = 0;
    for (int i = 1; i < 3; ++i) {
        if (box.hi[i] - box.lo[i] > box.hi[axis] - box.lo[axis]) {
            axis = i;
        }
    }

    const int lo = box.lo[axis];
    const int hi = box.hi[axis];
    std::vector<int> planeCounts(hi - lo + 1, 0);

    for (int r = box.lo[0]; r <= box.hi[0]; ++r) {
        for (int g = box.lo[1]; g <= box.hi[1]; ++g) {
            for (int b = box.lo[2]; b <= box.hi[2]; ++b) {
                const int coords[3] = {r, g, b};
                planeCounts[coords[axis] - lo] += histogram[histIndex(r, g, b)];
            }
        }
    }

    // Median plane; fitted boxes have occupied end planes so both halves are non-empty
    int cumulative = 0;
    int median = hi;
    for (int i = lo; i <= hi; ++i) {
        cumulative += planeCounts[i - lo];
        if (cumulative * 2 >= box.count) {
            median = i;
            break;
        }
    }
    const int cut = std::min(median, hi - 1);

    VBox left = box;
    VBox right = box;
    left.hi[axis] = cut;
    right.lo[axis] = cut + 1;

    first = fitBox(histogram, left);
    second = fitBox(histogram, right);
    return first.count > 0 && second.count > 0;
}

void PaletteQuantizer::iterateSplits(const std::vector<int>& histogram, std::vector<VBox>& boxes,
                                     size_t target, bool byVolume) const {
    auto priority = [byVolume](const VBox& box) {
        return byVolume ? static_cast<double>(box.count) * box.volume()
                        : static_cast<double>(box.count);
    };

    for (int iteration = 0; iteration < MAX_ITERATIONS && boxes.size() < target; ++iteration) {
        auto best = boxes.end();
        for (auto it = boxes.begin(); it != boxes.end(); ++it) {
            if (!it->splittable()) continue;
            if (best == boxes.end() || priority(*it) > priority(*best)) {
                best = it;
            }
        }
        if (best == boxes.end()) {
            break;
        }

        VBox first{}, second{};
        if (!splitBox(histogram, *best, first, second)) {
            break;
        }
        *best = first;
        boxes.push_back(second);
    }
}

cv::Vec3b PaletteQuantizer::boxAverage(const std::vector<int>& histogram, const VBox& box) const {
    const double mult = static_cast<double>(1 << RSHIFT);
    double total = 0.0;
    double sums[3] = {0.0, 0.0, 0.0};

    for (int r = box.lo[0]; r <= box.hi[0]; ++r) {
        for (int g = box.lo[1]; g <= box.hi[1]; ++g) {
            for (int b = box.lo[2]; b <= box.hi[2]; ++b) {
                int value = histogram[histIndex(r, g, b)];
                if (value == 0) continue;
                total += value;
                sums[0] += value * (r + 0.5) * mult;
                sums[1] += value * (g + 0.5) * mult;
                sums[2] += value * (b + 0.5) * mult;
            }
        }
    }

    if (total == 0.0) {
        return cv::Vec3b(
            cv::saturate_cast<uchar>(mult * (box.lo[0] + box.hi[0] + 1) / 2.0),
            cv::saturate_cast<uchar>(mult * (box.lo[1] + box.hi[1] + 1) / 2.0),
            cv::saturate_cast<uchar>(mult * (box.lo[2] + box.hi[2] + 1) / 2.0));
    }

    return cv::Vec3b(static_cast<uchar>(std::min(255.0, sums[0] / total)),
                     static_cast<uchar>(std::min(255.0, sums[1] / total)),
                     static_cast<uchar>(std::min(255.0, sums[2] / total)));
}

} // namespace Color
} // namespace Fitcast
