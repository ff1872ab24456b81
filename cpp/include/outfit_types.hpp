#ifndef OUTFIT_TYPES_HPP
#define OUTFIT_TYPES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Fitcast {

// Garment/accessory labels in detector class-id order
enum class ItemClass {
    SUNGLASS = 0,
    HAT,
    JACKET,
    SHIRT,
    PANTS,
    SHORTS,
    SKIRT,
    DRESS,
    BAG,
    SHOE
};

constexpr int ITEM_CLASS_COUNT = 10;

enum class Occasion {
    JOB_INTERVIEW,
    DATE_NIGHT,
    CASUAL_HANGOUT,
    WORK_MEETING,
    FORMAL_EVENT,
    BEACH_VACATION,
    NIGHT_OUT,
    BUSINESS_CASUAL
};

enum class ExtractionMethod {
    CLUSTERING,   // k-means over filtered pixels
    PALETTE,      // median-cut palette quantization
    SIMPLE,       // mean + most saturated pixel
    FALLBACK      // fixed neutral colors when every strategy failed
};

struct BoundingBox {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    bool isDegenerate() const { return x2 <= x1 || y2 <= y1; }
};

struct ColorSample {
    std::array<std::uint8_t, 3> rgb{{0, 0, 0}};
    std::string name;
    ExtractionMethod method = ExtractionMethod::SIMPLE;
    std::optional<double> percentage;
};

struct Detection {
    ItemClass itemClass = ItemClass::SHIRT;
    float confidence = 0.0f;
    BoundingBox bbox;
    std::vector<ColorSample> colors;
};

// Raw detector output before class-id validation
struct RawDetection {
    int classId = -1;
    float confidence = 0.0f;
    BoundingBox bbox;
};

struct ScoreBreakdown {
    double contextual = 0.0;
    double colorHarmony = 0.0;
    double completeness = 0.0;
    double coherence = 0.0;
};

struct AnalysisResult {
    Occasion occasion = Occasion::CASUAL_HANGOUT;
    std::string occasionDescription;
    std::vector<Detection> detections;
    ScoreBreakdown breakdown;
    double styleScore = 0.0;
    std::string feedback;
    int totalItems = 0;
    int uniqueColors = 0;
    double analysisTimeSeconds = 0.0;
};

// Error taxonomy surfaced to callers of the analyzer
class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidOccasionError : public AnalysisError {
public:
    explicit InvalidOccasionError(const std::string& occasion);

    const std::string& occasion() const { return occasion_; }

private:
    std::string occasion_;
};

class ModelUnavailableError : public AnalysisError {
public:
    explicit ModelUnavailableError(const std::string& message) : AnalysisError(message) {}
};

class ImageLoadError : public AnalysisError {
public:
    explicit ImageLoadError(const std::string& path)
        : AnalysisError("Could not load image from " + path) {}
};

// Label helpers
std::string itemClassName(ItemClass itemClass);
bool itemClassFromId(int classId, ItemClass& out);
const std::vector<ItemClass>& allItemClasses();

std::string occasionKey(Occasion occasion);
std::string occasionDescription(Occasion occasion);
bool tryParseOccasion(const std::string& key, Occasion& out);
Occasion parseOccasion(const std::string& key);  // throws InvalidOccasionError
const std::vector<Occasion>& allOccasions();

std::string extractionMethodName(ExtractionMethod method);

} // namespace Fitcast

#endif // OUTFIT_TYPES_HPP
