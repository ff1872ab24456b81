#pragma once

#include "model_interfaces.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace Fitcast {
namespace Testing {

class StubDetector : public IDetectorModel {
public:
    explicit StubDetector(std::vector<RawDetection> detections = {}, bool available = true)
        : detections_(std::move(detections)), available_(available) {}

    std::vector<RawDetection> detect(const std::string& imagePath) override {
        ++calls;
        lastImage = imagePath;
        if (throwOnDetect) {
            throw std::runtime_error("detector exploded");
        }
        return detections_;
    }

    bool isAvailable() const override { return available_; }

    int calls = 0;
    bool throwOnDetect = false;
    std::string lastImage;

private:
    std::vector<RawDetection> detections_;
    bool available_;
};

class StubSimilarity : public ISimilarityModel {
public:
    explicit StubSimilarity(double value = 0.0, bool available = true)
        : value_(value), available_(available) {}

    double similarity(const std::string& /*imagePath*/, const std::string& prompt) override {
        prompts.push_back(prompt);
        if (throwOnCall) {
            throw std::runtime_error("similarity backend failed");
        }
        return value_;
    }

    std::vector<double> similarities(const std::string& imagePath,
                                     const std::vector<std::string>& batch) override {
        ++batchCalls;
        return ISimilarityModel::similarities(imagePath, batch);
    }

    bool isAvailable() const override { return available_; }

    std::vector<std::string> prompts;
    int batchCalls = 0;
    bool throwOnCall = false;

private:
    double value_;
    bool available_;
};

class StubTextGenerator : public ITextGenerator {
public:
    explicit StubTextGenerator(std::string answer = "", bool available = true)
        : answer_(std::move(answer)), available_(available) {}

    std::string generate(const std::string& prompt) override {
        lastPrompt = prompt;
        if (throwOnCall) {
            throw std::runtime_error("generation failed");
        }
        return answer_;
    }

    bool isAvailable() const override { return available_; }

    std::string lastPrompt;
    bool throwOnCall = false;

private:
    std::string answer_;
    bool available_;
};

inline RawDetection makeRaw(int classId, float confidence, int x1, int y1, int x2, int y2) {
    RawDetection raw;
    raw.classId = classId;
    raw.confidence = confidence;
    raw.bbox = {x1, y1, x2, y2};
    return raw;
}

} // namespace Testing
} // namespace Fitcast
