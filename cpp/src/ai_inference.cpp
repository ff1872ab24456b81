#include "ai_inference.hpp"
#include <opencv2/dnn.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#ifdef HAVE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace Fitcast {

// ---------------------------------------------------------------------------
// OnnxSession
// ---------------------------------------------------------------------------

struct OnnxSession::ModelInstance {
#ifdef HAVE_ONNXRUNTIME
    std::unique_ptr<Ort::Env> env;
    std::unique_ptr<Ort::Session> session;
    Ort::MemoryInfo memoryInfo{nullptr};
    std::string inputName;
    std::string outputName;

    ModelInstance() : memoryInfo(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {
        env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "Fitcast");
    }
#endif
    bool loaded = false;
};

OnnxSession::OnnxSession() : impl_(std::make_unique<ModelInstance>()) {}

OnnxSession::~OnnxSession() = default;

bool OnnxSession::isOnnxRuntimeAvailable() {
#ifdef HAVE_ONNXRUNTIME
    return true;
#else
    return false;
#endif
}

bool OnnxSession::load(const std::string& modelPath) {
#ifdef HAVE_ONNXRUNTIME
    try {
        if (!std::filesystem::exists(modelPath)) {
            lastError_ = "Model file not found: " + modelPath;
            return false;
        }

        Ort::SessionOptions sessionOptions;
        sessionOptions.SetIntraOpNumThreads(1);
        sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        impl_->session = std::make_unique<Ort::Session>(*impl_->env, modelPath.c_str(), sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;
        impl_->inputName = impl_->session->GetInputNameAllocated(0, allocator).get();
        impl_->outputName = impl_->session->GetOutputNameAllocated(0, allocator).get();
        impl_->loaded = true;

        std::clog << "Loaded ONNX model: " << modelPath << std::endl;
        return true;
    }
    catch (const std::exception& e) {
        lastError_ = "Failed to load ONNX model: " + std::string(e.what());
        impl_->session.reset();
        impl_->loaded = false;
        return false;
    }
#else
    lastError_ = "ONNX Runtime not available; cannot load " + modelPath;
    return false;
#endif
}

bool OnnxSession::isLoaded() const {
    return impl_->loaded;
}

std::vector<float> OnnxSession::run(std::vector<float>& input, const std::vector<int64_t>& shape,
                                    std::vector<int64_t>& outputShape) {
#ifdef HAVE_ONNXRUNTIME
    if (!impl_->loaded) {
        throw std::runtime_error("ONNX model not loaded");
    }

    Ort::Value inputTensor = Ort::Value::CreateTensor<float>(
        impl_->memoryInfo,
        input.data(),
        input.size(),
        shape.data(),
        shape.size()
    );

    const char* inputNames[] = {impl_->inputName.c_str()};
    const char* outputNames[] = {impl_->outputName.c_str()};

    auto outputTensors = impl_->session->Run(
        Ort::RunOptions{nullptr},
        inputNames,
        &inputTensor,
        1,
        outputNames,
        1
    );

    if (outputTensors.empty() || !outputTensors[0].IsTensor()) {
        throw std::runtime_error("ONNX model produced no tensor output");
    }

    auto tensorInfo = outputTensors[0].GetTensorTypeAndShapeInfo();
    outputShape = tensorInfo.GetShape();
    const float* raw = outputTensors[0].GetTensorData<float>();
    return std::vector<float>(raw, raw + tensorInfo.GetElementCount());
#else
    (void)input;
    (void)shape;
    (void)outputShape;
    throw std::runtime_error("ONNX Runtime not available");
#endif
}

// ---------------------------------------------------------------------------
// OnnxDetector
// ---------------------------------------------------------------------------

OnnxDetector::OnnxDetector(const DetectorConfig& config) : config_(config) {}

bool OnnxDetector::loadModel(const std::string& modelPath) {
    if (!session_.load(modelPath)) {
        lastError_ = session_.getLastError();
        return false;
    }
    return true;
}

bool OnnxDetector::isAvailable() const {
    return session_.isLoaded();
}

std::vector<RawDetection> OnnxDetector::detect(const std::string& imagePath) {
    cv::Mat image = cv::imread(imagePath, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw std::runtime_error("Could not load image from " + imagePath);
    }
    return detect(image);
}

std::vector<RawDetection> OnnxDetector::detect(const cv::Mat& imageBgr) {
    const int size = config_.input_size;

    // NCHW float, RGB, scaled to [0,1]
    cv::Mat blob = cv::dnn::blobFromImage(imageBgr, 1.0 / 255.0, cv::Size(size, size),
                                          cv::Scalar(), true, false, CV_32F);
    std::vector<float> input(blob.ptr<float>(), blob.ptr<float>() + blob.total());
    std::vector<int64_t> shape = {1, 3, size, size};

    std::vector<int64_t> outputShape;
    std::vector<float> output = session_.run(input, shape, outputShape);

    if (outputShape.size() != 3 || outputShape[1] <= 4) {
        throw std::runtime_error("Unexpected detector output shape");
    }

    const int rows = static_cast<int>(outputShape[1]);
    const int anchors = static_cast<int>(outputShape[2]);
    return decodeOutput(output.data(), rows, anchors, imageBgr.size());
}

std::vector<RawDetection> OnnxDetector::decodeOutput(const float* data, int rows, int anchors,
                                                     const cv::Size& imageSize) const {
    const int numClasses = rows - 4;
    const float scaleX = static_cast<float>(imageSize.width) / config_.input_size;
    const float scaleY = static_cast<float>(imageSize.height) / config_.input_size;

    std::map<int, std::vector<cv::Rect>> boxesByClass;
    std::map<int, std::vector<float>> scoresByClass;

    for (int i = 0; i < anchors; ++i) {
        int bestClass = -1;
        float bestScore = 0.0f;
        for (int c = 0; c < numClasses; ++c) {
            float score = data[(4 + c) * anchors + i];
            if (score > bestScore) {
                bestScore = score;
                bestClass = c;
            }
        }
        if (bestClass < 0 || bestScore < config_.confidence_threshold) {
            continue;
        }

        const float cx = data[0 * anchors + i];
        const float cy = data[1 * anchors + i];
        const float w = data[2 * anchors + i];
        const float h = data[3 * anchors + i];

        int x1 = static_cast<int>((cx - w / 2.0f) * scaleX);
        int y1 = static_cast<int>((cy - h / 2.0f) * scaleY);
        int x2 = static_cast<int>((cx + w / 2.0f) * scaleX);
        int y2 = static_cast<int>((cy + h / 2.0f) * scaleY);

        boxesByClass[bestClass].emplace_back(x1, y1, x2 - x1, y2 - y1);
        scoresByClass[bestClass].push_back(bestScore);
    }

    std::vector<RawDetection> detections;
    for (const auto& [classId, boxes] : boxesByClass) {
        const auto& scores = scoresByClass[classId];
        std::vector<int> keep;
        cv::dnn::NMSBoxes(boxes, scores, config_.confidence_threshold, config_.nms_threshold, keep);

        for (int index : keep) {
            const cv::Rect& box = boxes[index];
            RawDetection detection;
            detection.classId = classId;
            detection.confidence = scores[index];
            detection.bbox = {box.x, box.y, box.x + box.width, box.y + box.height};
            detections.push_back(detection);
        }
    }

    std::sort(detections.begin(), detections.end(),
        [](const RawDetection& a, const RawDetection& b) { return a.confidence > b.confidence; });
    return detections;
}

// ---------------------------------------------------------------------------
// OnnxSimilarityModel
// ---------------------------------------------------------------------------

OnnxSimilarityModel::OnnxSimilarityModel() = default;

bool OnnxSimilarityModel::loadModel(const std::string& modelPath, const std::string& promptEmbeddingsPath) {
    if (!loadPromptEmbeddings(promptEmbeddingsPath)) {
        return false;
    }
    if (!session_.load(modelPath)) {
        lastError_ = session_.getLastError();
        return false;
    }
    return true;
}

bool OnnxSimilarityModel::loadPromptEmbeddings(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            lastError_ = "Failed to open prompt embeddings: " + path;
            return false;
        }

        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            lastError_ = "Prompt embeddings must be a JSON object: " + path;
            return false;
        }

        promptEmbeddings_.clear();
        for (const auto& [prompt, values] : j.items()) {
            promptEmbeddings_[prompt] = values.get<std::vector<float>>();
        }
        return true;
    }
    catch (const std::exception& e) {
        lastError_ = "Error loading prompt embeddings: " + std::string(e.what());
        return false;
    }
}

bool OnnxSimilarityModel::isAvailable() const {
    return session_.isLoaded() && !promptEmbeddings_.empty();
}

const std::vector<float>& OnnxSimilarityModel::promptEmbedding(const std::string& prompt) const {
    auto it = promptEmbeddings_.find(prompt);
    if (it == promptEmbeddings_.end()) {
        throw std::runtime_error("No embedding for prompt: " + prompt);
    }
    return it->second;
}

double OnnxSimilarityModel::similarity(const std::string& imagePath, const std::string& prompt) {
    const std::vector<float>& text = promptEmbedding(prompt);
    return cosine(encodeImage(imagePath), text);
}

std::vector<double> OnnxSimilarityModel::similarities(const std::string& imagePath,
                                                      const std::vector<std::string>& prompts) {
    // Unknown prompts fail before the encoder runs
    std::vector<const std::vector<float>*> texts;
    texts.reserve(prompts.size());
    for (const auto& prompt : prompts) {
        texts.push_back(&promptEmbedding(prompt));
    }
    if (texts.empty()) {
        return {};
    }

    const std::vector<float> image = encodeImage(imagePath);
    std::vector<double> scores;
    scores.reserve(texts.size());
    for (const auto* text : texts) {
        scores.push_back(cosine(image, *text));
    }
    return scores;
}

std::vector<float> OnnxSimilarityModel::encodeImage(const std::string& imagePath) {
    cv::Mat image = cv::imread(imagePath, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw std::runtime_error("Could not load image from " + imagePath);
    }

    std::vector<float> input = preprocess(image);
    std::vector<int64_t> shape = {1, 3, INPUT_SIZE, INPUT_SIZE};
    std::vector<int64_t> outputShape;
    return session_.run(input, shape, outputShape);
}

std::vector<float> OnnxSimilarityModel::preprocess(const cv::Mat& imageBgr) {
    static const float mean[3] = {0.48145466f, 0.4578275f, 0.40821073f};
    static const float stdev[3] = {0.26862954f, 0.26130258f, 0.27577711f};

    const double scale = static_cast<double>(INPUT_SIZE) / std::min(imageBgr.cols, imageBgr.rows);
    const int width = std::max(INPUT_SIZE, static_cast<int>(std::round(imageBgr.cols * scale)));
    const int height = std::max(INPUT_SIZE, static_cast<int>(std::round(imageBgr.rows * scale)));

    cv::Mat resized;
    cv::resize(imageBgr, resized, cv::Size(width, height), 0, 0, cv::INTER_CUBIC);

    cv::Rect center((width - INPUT_SIZE) / 2, (height - INPUT_SIZE) / 2, INPUT_SIZE, INPUT_SIZE);
    cv::Mat rgb;
    cv::cvtColor(resized(center), rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32FC3, 1.0 / 255.0);

    const int plane = INPUT_SIZE * INPUT_SIZE;
    std::vector<float> chw(3 * plane);
    for (int y = 0; y < INPUT_SIZE; ++y) {
        const cv::Vec3f* row = rgb.ptr<cv::Vec3f>(y);
        for (int x = 0; x < INPUT_SIZE; ++x) {
            for (int c = 0; c < 3; ++c) {
                chw[c * plane + y * INPUT_SIZE + x] = (row[x][c] - mean[c]) / stdev[c];
            }
        }
    }
    return chw;
}

double OnnxSimilarityModel::cosine(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        throw std::invalid_argument("Embedding dimensions do not match");
    }

    double dot = 0.0, normA = 0.0, normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA == 0.0 || normB == 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

// ---------------------------------------------------------------------------
// Health
// ---------------------------------------------------------------------------

nlohmann::json backendHealth(const IDetectorModel* detector, const ISimilarityModel* similarity) {
    const bool detectorReady = detector && detector->isAvailable();
    const bool similarityReady = similarity && similarity->isAvailable();

    nlohmann::json health;
    health["status"] = (detectorReady && similarityReady) ? "healthy" : "degraded";
    health["models"] = {
        {"detector", detectorReady},
        {"similarity", similarityReady},
        {"analyzer_ready", detectorReady}
    };
    health["onnxruntime"] = OnnxSession::isOnnxRuntimeAvailable();
    return health;
}

} // namespace Fitcast
