#include <gtest/gtest.h>

#include "outfit_analyzer.hpp"
#include "test_stubs.hpp"

using namespace Fitcast;
using Fitcast::Testing::StubDetector;
using Fitcast::Testing::StubSimilarity;
using Fitcast::Testing::makeRaw;

namespace {

// White shirt over navy pants, BGR
cv::Mat shirtAndPantsFrame() {
    cv::Mat frame(200, 200, CV_8UC3, cv::Scalar(255, 255, 255));
    frame(cv::Rect(0, 100, 200, 100)).setTo(cv::Scalar(80, 0, 0));
    return frame;
}

std::shared_ptr<StubDetector> shirtAndPantsDetector() {
    return std::make_shared<StubDetector>(std::vector<RawDetection>{
        makeRaw(3, 0.9f, 0, 0, 200, 100),
        makeRaw(4, 0.85f, 0, 100, 200, 200),
    });
}

} // namespace

TEST(OutfitAnalyzerTest, WorkMeetingEndToEnd) {
    auto detector = shirtAndPantsDetector();
    OutfitAnalyzer analyzer(detector, std::make_shared<StubSimilarity>(0.6));

    AnalysisResult result = analyzer.analyze(shirtAndPantsFrame(), "outfit.jpg", "work_meeting");

    ASSERT_EQ(result.detections.size(), 2u);
    EXPECT_EQ(result.detections[0].itemClass, ItemClass::SHIRT);
    EXPECT_EQ(result.detections[1].itemClass, ItemClass::PANTS);
    ASSERT_FALSE(result.detections[0].colors.empty());
    ASSERT_FALSE(result.detections[1].colors.empty());
    EXPECT_EQ(result.detections[0].colors[0].name, "white");
    EXPECT_EQ(result.detections[1].colors[0].name, "navy");

    EXPECT_NEAR(result.breakdown.contextual, 8.0, 1e-9);
    EXPECT_DOUBLE_EQ(result.breakdown.colorHarmony, 8.0);
    EXPECT_DOUBLE_EQ(result.breakdown.completeness, 7.0);
    EXPECT_DOUBLE_EQ(result.breakdown.coherence, 7.0);
    EXPECT_NEAR(result.styleScore, 7.8, 1e-9);

    EXPECT_EQ(result.feedback, "Good outfit for business work meeting. Well coordinated overall.");
    EXPECT_EQ(result.totalItems, 2);
    EXPECT_EQ(result.uniqueColors, 2);
    EXPECT_EQ(result.occasionDescription, "business work meeting");
    EXPECT_EQ(detector->lastImage, "outfit.jpg");
}

TEST(OutfitAnalyzerTest, JsonDocumentRoundsScores) {
    OutfitAnalyzer analyzer(shirtAndPantsDetector(), std::make_shared<StubSimilarity>(0.6));
    auto j = toJson(analyzer.analyze(shirtAndPantsFrame(), "outfit.jpg", "work_meeting"));

    EXPECT_DOUBLE_EQ(j["style_score"].get<double>(), 7.8);
    EXPECT_EQ(j["occasion"], "work_meeting");
    EXPECT_EQ(j["occasion_description"], "business work meeting");
    EXPECT_DOUBLE_EQ(j["scoring_breakdown"]["clip_contextual"].get<double>(), 8.0);
    EXPECT_DOUBLE_EQ(j["scoring_breakdown"]["color_harmony"].get<double>(), 8.0);
    EXPECT_DOUBLE_EQ(j["scoring_breakdown"]["item_completeness"].get<double>(), 7.0);
    EXPECT_DOUBLE_EQ(j["scoring_breakdown"]["style_coherence"].get<double>(), 7.0);
    EXPECT_EQ(j["total_items"], 2);
    EXPECT_EQ(j["unique_colors"], 2);

    const auto& shirt = j["detected_items"][0];
    EXPECT_EQ(shirt["class"], "shirt");
    EXPECT_EQ(shirt["bbox"], nlohmann::json({0, 0, 200, 100}));
    EXPECT_EQ(shirt["colors"][0]["name"], "white");
    EXPECT_TRUE(shirt["colors"][0].contains("method"));
    EXPECT_TRUE(j.contains("analysis_time_seconds"));
}

TEST(OutfitAnalyzerTest, RepeatedAnalysisIsIdentical) {
    OutfitAnalyzer analyzer(shirtAndPantsDetector(), std::make_shared<StubSimilarity>(0.6));
    cv::Mat frame = shirtAndPantsFrame();

    auto first = toJson(analyzer.analyze(frame, "outfit.jpg", "work_meeting"));
    auto second = toJson(analyzer.analyze(frame, "outfit.jpg", "work_meeting"));
    first.erase("analysis_time_seconds");
    second.erase("analysis_time_seconds");
    EXPECT_EQ(first, second);
}

TEST(OutfitAnalyzerTest, InvalidOccasionIsRejectedFirst) {
    auto detector = std::make_shared<StubDetector>(std::vector<RawDetection>{}, false);
    OutfitAnalyzer analyzer(detector, nullptr);

    EXPECT_THROW(analyzer.analyze(shirtAndPantsFrame(), "x.jpg", "prom"), InvalidOccasionError);
    EXPECT_THROW(analyzer.analyze("/nonexistent/x.jpg", "prom"), InvalidOccasionError);
    EXPECT_EQ(detector->calls, 0);
}

TEST(OutfitAnalyzerTest, InvalidOccasionMessageListsKeys) {
    try {
        parseOccasion("prom");
        FAIL() << "expected InvalidOccasionError";
    } catch (const InvalidOccasionError& e) {
        EXPECT_EQ(e.occasion(), "prom");
        EXPECT_NE(std::string(e.what()).find("job_interview"), std::string::npos);
    }
}

TEST(OutfitAnalyzerTest, MissingDetectorIsFatal) {
    OutfitAnalyzer noDetector(nullptr, std::make_shared<StubSimilarity>(0.6));
    EXPECT_THROW(noDetector.analyze(shirtAndPantsFrame(), "x.jpg", "date_night"), ModelUnavailableError);

    OutfitAnalyzer unavailable(std::make_shared<StubDetector>(std::vector<RawDetection>{}, false), nullptr);
    EXPECT_FALSE(unavailable.isReady());
    EXPECT_THROW(unavailable.analyze(shirtAndPantsFrame(), "x.jpg", "date_night"), ModelUnavailableError);
}

TEST(OutfitAnalyzerTest, UnreadableImageIsReported) {
    OutfitAnalyzer analyzer(shirtAndPantsDetector(), nullptr);
    EXPECT_THROW(analyzer.analyze("/nonexistent/outfit.jpg", "date_night"), ImageLoadError);
}

TEST(OutfitAnalyzerTest, DetectorFailureBecomesAnalysisError) {
    auto detector = shirtAndPantsDetector();
    detector->throwOnDetect = true;
    OutfitAnalyzer analyzer(detector, nullptr);
    EXPECT_THROW(analyzer.analyze(shirtAndPantsFrame(), "x.jpg", "date_night"), AnalysisError);
}

TEST(OutfitAnalyzerTest, MissingSimilarityUsesNeutralContextualScore) {
    OutfitAnalyzer analyzer(shirtAndPantsDetector(), nullptr);
    AnalysisResult result = analyzer.analyze(shirtAndPantsFrame(), "x.jpg", "work_meeting");
    EXPECT_DOUBLE_EQ(result.breakdown.contextual, 6.0);
    // 0.6*6 + 0.2*8 + 0.1*7 + 0.1*7
    EXPECT_NEAR(result.styleScore, 6.6, 1e-9);
}

TEST(OutfitAnalyzerTest, UnknownClassIdsAreDropped) {
    auto detector = std::make_shared<StubDetector>(std::vector<RawDetection>{
        makeRaw(42, 0.9f, 0, 0, 100, 100),
        makeRaw(-1, 0.9f, 0, 0, 100, 100),
        makeRaw(9, 0.7f, 0, 100, 200, 200),
    });
    OutfitAnalyzer analyzer(detector, nullptr);

    AnalysisResult result = analyzer.analyze(shirtAndPantsFrame(), "x.jpg", "casual_hangout");
    ASSERT_EQ(result.totalItems, 1);
    EXPECT_EQ(result.detections[0].itemClass, ItemClass::SHOE);
}

TEST(OutfitAnalyzerTest, DegenerateBoxKeepsItemWithoutColors) {
    auto detector = std::make_shared<StubDetector>(std::vector<RawDetection>{
        makeRaw(1, 0.8f, 50, 50, 50, 90),
    });
    OutfitAnalyzer analyzer(detector, nullptr);

    AnalysisResult result = analyzer.analyze(shirtAndPantsFrame(), "x.jpg", "night_out");
    ASSERT_EQ(result.detections.size(), 1u);
    EXPECT_TRUE(result.detections[0].colors.empty());
    EXPECT_EQ(result.uniqueColors, 0);
    EXPECT_DOUBLE_EQ(result.breakdown.colorHarmony, 5.0);
}

TEST(OutfitAnalyzerTest, NoDetectionsStillScores) {
    OutfitAnalyzer analyzer(std::make_shared<StubDetector>(), nullptr);
    AnalysisResult result = analyzer.analyze(shirtAndPantsFrame(), "x.jpg", "beach_vacation");
    EXPECT_EQ(result.totalItems, 0);
    EXPECT_DOUBLE_EQ(result.breakdown.completeness, 5.0);
    EXPECT_DOUBLE_EQ(result.breakdown.coherence, 7.0);
}

TEST(OutfitAnalyzerTest, ColorsPerItemIsHonored) {
    AnalyzerOptions options;
    options.colors_per_item = 1;
    auto detector = std::make_shared<StubDetector>(std::vector<RawDetection>{
        makeRaw(7, 0.9f, 0, 0, 200, 200),
    });
    OutfitAnalyzer analyzer(detector, nullptr, options);

    AnalysisResult result = analyzer.analyze(shirtAndPantsFrame(), "x.jpg", "formal_event");
    ASSERT_EQ(result.detections.size(), 1u);
    EXPECT_LE(result.detections[0].colors.size(), 1u);
}

TEST(RoundToTest, RoundsToRequestedDecimals) {
    EXPECT_DOUBLE_EQ(roundTo(7.86, 1), 7.9);
    EXPECT_DOUBLE_EQ(roundTo(7.8000000001, 1), 7.8);
    EXPECT_DOUBLE_EQ(roundTo(1.234, 2), 1.23);
}
