#pragma once

#include "model_interfaces.hpp"

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Fitcast {

struct DetectorConfig {
    int input_size = 640;
    float confidence_threshold = 0.25f;
    float nms_threshold = 0.45f;
};

/**
 * ONNX Runtime session shared by the model backends.
 * Without ONNX Runtime at build time every load fails and getLastError() says why.
 */
class OnnxSession {
public:
    OnnxSession();
    ~OnnxSession();

    bool load(const std::string& modelPath);
    bool isLoaded() const;

    // Single-input, single-output float inference
    std::vector<float> run(std::vector<float>& input, const std::vector<int64_t>& shape,
                           std::vector<int64_t>& outputShape);

    static bool isOnnxRuntimeAvailable();
    std::string getLastError() const { return lastError_; }

private:
    struct ModelInstance;
    std::unique_ptr<ModelInstance> impl_;
    std::string lastError_;
};

/**
 * YOLOv8 garment detector exported to ONNX.
 * Input 1x3xSxS RGB in [0,1], output 1x(4+C)xN with (cx, cy, w, h) then class scores.
 */
class OnnxDetector : public IDetectorModel {
public:
    explicit OnnxDetector(const DetectorConfig& config = DetectorConfig());

    bool loadModel(const std::string& modelPath);
    std::string getLastError() const { return lastError_; }

    std::vector<RawDetection> detect(const std::string& imagePath) override;
    std::vector<RawDetection> detect(const cv::Mat& imageBgr);
    bool isAvailable() const override;

    // Decodes a raw output tensor; exposed for offline evaluation
    std::vector<RawDetection> decodeOutput(const float* data, int rows, int anchors,
                                           const cv::Size& imageSize) const;

private:
    DetectorConfig config_;
    OnnxSession session_;
    std::string lastError_;
};

/**
 * CLIP image encoder plus precomputed prompt text embeddings.
 * The prompt file is a JSON object mapping prompt text to an embedding array.
 * Image embeddings are computed per call and never kept between calls.
 */
class OnnxSimilarityModel : public ISimilarityModel {
public:
    static constexpr int INPUT_SIZE = 224;

    OnnxSimilarityModel();

    bool loadModel(const std::string& modelPath, const std::string& promptEmbeddingsPath);
    bool loadPromptEmbeddings(const std::string& path);
    std::string getLastError() const { return lastError_; }

    double similarity(const std::string& imagePath, const std::string& prompt) override;
    std::vector<double> similarities(const std::string& imagePath,
                                     const std::vector<std::string>& prompts) override;
    bool isAvailable() const override;

    bool hasPrompt(const std::string& prompt) const { return promptEmbeddings_.count(prompt) > 0; }

    static double cosine(const std::vector<float>& a, const std::vector<float>& b);

    // Short side resize, center crop, CLIP mean/std, CHW layout
    static std::vector<float> preprocess(const cv::Mat& imageBgr);

private:
    OnnxSession session_;
    std::map<std::string, std::vector<float>> promptEmbeddings_;
    std::string lastError_;

    const std::vector<float>& promptEmbedding(const std::string& prompt) const;
    std::vector<float> encodeImage(const std::string& imagePath);
};

// Load status of the backends: "healthy" only when both are usable
nlohmann::json backendHealth(const IDetectorModel* detector, const ISimilarityModel* similarity);

} // namespace Fitcast
