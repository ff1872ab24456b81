#include <gtest/gtest.h>

#include "ai_inference.hpp"
#include "test_stubs.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace Fitcast;

namespace {

// Column-major YOLOv8 layout: value(row, anchor) = data[row * anchors + anchor]
std::vector<float> yoloOutput(int rows, int anchors) {
    return std::vector<float>(static_cast<size_t>(rows) * anchors, 0.0f);
}

void setAnchor(std::vector<float>& data, int anchors, int anchor,
               float cx, float cy, float w, float h, int classId, float score) {
    data[0 * anchors + anchor] = cx;
    data[1 * anchors + anchor] = cy;
    data[2 * anchors + anchor] = w;
    data[3 * anchors + anchor] = h;
    data[(4 + classId) * anchors + anchor] = score;
}

} // namespace

TEST(OnnxDetectorTest, DecodeRescalesAndSuppressesOverlaps) {
    const int rows = 14;
    const int anchors = 3;
    auto data = yoloOutput(rows, anchors);
    setAnchor(data, anchors, 0, 100, 100, 50, 40, 3, 0.9f);
    setAnchor(data, anchors, 1, 102, 100, 50, 40, 3, 0.6f);
    setAnchor(data, anchors, 2, 400, 400, 60, 60, 5, 0.1f);

    OnnxDetector detector;
    auto detections = detector.decodeOutput(data.data(), rows, anchors, cv::Size(1280, 640));

    ASSERT_EQ(detections.size(), 1u);
    EXPECT_EQ(detections[0].classId, 3);
    EXPECT_FLOAT_EQ(detections[0].confidence, 0.9f);
    EXPECT_EQ(detections[0].bbox.x1, 150);
    EXPECT_EQ(detections[0].bbox.y1, 80);
    EXPECT_EQ(detections[0].bbox.x2, 250);
    EXPECT_EQ(detections[0].bbox.y2, 120);
}

TEST(OnnxDetectorTest, DecodeKeepsOverlapsOfDifferentClasses) {
    const int rows = 14;
    const int anchors = 2;
    auto data = yoloOutput(rows, anchors);
    setAnchor(data, anchors, 0, 320, 320, 100, 100, 3, 0.5f);
    setAnchor(data, anchors, 1, 320, 320, 100, 100, 8, 0.7f);

    OnnxDetector detector;
    auto detections = detector.decodeOutput(data.data(), rows, anchors, cv::Size(640, 640));

    ASSERT_EQ(detections.size(), 2u);
    EXPECT_EQ(detections[0].classId, 8);
    EXPECT_EQ(detections[1].classId, 3);
}

TEST(OnnxDetectorTest, MissingModelIsUnavailable) {
    OnnxDetector detector;
    EXPECT_FALSE(detector.loadModel("/nonexistent/detector.onnx"));
    EXPECT_FALSE(detector.getLastError().empty());
    EXPECT_FALSE(detector.isAvailable());
}

TEST(OnnxSimilarityModelTest, CosineSimilarity) {
    EXPECT_DOUBLE_EQ(OnnxSimilarityModel::cosine({1, 0}, {1, 0}), 1.0);
    EXPECT_DOUBLE_EQ(OnnxSimilarityModel::cosine({1, 0}, {0, 1}), 0.0);
    EXPECT_NEAR(OnnxSimilarityModel::cosine({1, 2, 3}, {-1, -2, -3}), -1.0, 1e-12);
    EXPECT_DOUBLE_EQ(OnnxSimilarityModel::cosine({0, 0}, {1, 1}), 0.0);
    EXPECT_THROW(OnnxSimilarityModel::cosine({1, 2}, {1, 2, 3}), std::invalid_argument);
}

TEST(OnnxSimilarityModelTest, PreprocessProducesClipTensor) {
    cv::Mat image(200, 300, CV_8UC3, cv::Scalar(0, 0, 255));
    auto tensor = OnnxSimilarityModel::preprocess(image);

    const size_t plane = OnnxSimilarityModel::INPUT_SIZE * OnnxSimilarityModel::INPUT_SIZE;
    ASSERT_EQ(tensor.size(), 3 * plane);
    // Red channel first after BGR to RGB
    EXPECT_NEAR(tensor[0], (1.0f - 0.48145466f) / 0.26862954f, 1e-3);
    EXPECT_NEAR(tensor[plane], (0.0f - 0.4578275f) / 0.26130258f, 1e-3);
}

TEST(OnnxSimilarityModelTest, PromptEmbeddingsFromJson) {
    const std::string path = ::testing::TempDir() + "fitcast_prompts.json";
    {
        std::ofstream out(path);
        out << R"({"a formal outfit": [0.1, 0.2, 0.3], "a casual outfit": [0.3, 0.2, 0.1]})";
    }

    OnnxSimilarityModel model;
    ASSERT_TRUE(model.loadPromptEmbeddings(path));
    EXPECT_TRUE(model.hasPrompt("a formal outfit"));
    EXPECT_FALSE(model.hasPrompt("a beach outfit"));

    // Prompts alone are not enough without the image encoder
    EXPECT_FALSE(model.isAvailable());
    EXPECT_THROW(model.similarity("outfit.jpg", "a beach outfit"), std::runtime_error);
    EXPECT_THROW(model.similarities("outfit.jpg", {"a formal outfit", "a beach outfit"}), std::runtime_error);
    EXPECT_TRUE(model.similarities("outfit.jpg", {}).empty());
    std::remove(path.c_str());
}

TEST(OnnxSimilarityModelTest, MalformedPromptFileFails) {
    const std::string path = ::testing::TempDir() + "fitcast_bad_prompts.json";
    {
        std::ofstream out(path);
        out << R"(["not", "an", "object"])";
    }

    OnnxSimilarityModel model;
    EXPECT_FALSE(model.loadPromptEmbeddings(path));
    EXPECT_FALSE(model.getLastError().empty());
    EXPECT_FALSE(model.loadModel("/nonexistent/clip.onnx", "/nonexistent/prompts.json"));
    std::remove(path.c_str());
}

TEST(BackendHealthTest, HealthyOnlyWhenBothBackendsAreUsable) {
    Testing::StubDetector detector;
    Testing::StubSimilarity similarity(0.5);

    auto health = backendHealth(&detector, &similarity);
    EXPECT_EQ(health["status"], "healthy");
    EXPECT_TRUE(health["models"]["detector"].get<bool>());
    EXPECT_TRUE(health["models"]["similarity"].get<bool>());
    EXPECT_EQ(health["onnxruntime"].get<bool>(), OnnxSession::isOnnxRuntimeAvailable());
}

TEST(BackendHealthTest, DegradedWhenABackendIsMissing) {
    Testing::StubDetector detector;
    Testing::StubSimilarity offline(0.5, false);

    auto health = backendHealth(&detector, &offline);
    EXPECT_EQ(health["status"], "degraded");
    EXPECT_TRUE(health["models"]["analyzer_ready"].get<bool>());
    EXPECT_FALSE(health["models"]["similarity"].get<bool>());

    auto empty = backendHealth(nullptr, nullptr);
    EXPECT_EQ(empty["status"], "degraded");
    EXPECT_FALSE(empty["models"]["detector"].get<bool>());
}

TEST(BackendHealthTest, UnloadedOnnxBackendsAreDegraded) {
    OnnxDetector detector;
    OnnxSimilarityModel similarity;
    EXPECT_FALSE(detector.loadModel("/nonexistent/detector.onnx"));

    auto health = backendHealth(&detector, &similarity);
    EXPECT_EQ(health["status"], "degraded");
    EXPECT_FALSE(health["models"]["detector"].get<bool>());
}
