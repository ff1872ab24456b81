#include <gtest/gtest.h>

#include "config_manager.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using Fitcast::ConfigManager;
using json = nlohmann::json;

TEST(ConfigManagerTest, EmptyConfigUsesDefaults) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromJson(json::object()));

    EXPECT_EQ(config.getDetectorConfig().input_size, 640);
    EXPECT_FLOAT_EQ(config.getDetectorConfig().confidence_threshold, 0.25f);
    EXPECT_FLOAT_EQ(config.getDetectorConfig().nms_threshold, 0.45f);
    EXPECT_EQ(config.getAnalysisConfig().colors_per_item, 2);
    EXPECT_EQ(config.getExtractionConfig().min_valid_pixels, 100);
    EXPECT_DOUBLE_EQ(config.getExtractionConfig().min_cluster_percentage, 10.0);
    EXPECT_FALSE(config.isDebugMode());
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_TRUE(config.validateConfig());
}

TEST(ConfigManagerTest, ReadsSections) {
    json j = {
        {"models", {{"detector_path", "/models/det.onnx"}, {"similarity_path", "/models/clip.onnx"}}},
        {"detector", {{"input_size", 320}, {"confidence_threshold", 0.4}}},
        {"extraction", {{"palette_size", 8}, {"random_seed", 7}}},
        {"analysis", {{"colors_per_item", 3}}},
        {"debug_mode", true},
        {"log_level", "DEBUG"}
    };

    ConfigManager config;
    ASSERT_TRUE(config.loadFromJson(j));
    EXPECT_EQ(config.getModelPaths().detector_path, "/models/det.onnx");
    EXPECT_EQ(config.getModelPaths().similarity_path, "/models/clip.onnx");
    EXPECT_EQ(config.getDetectorConfig().input_size, 320);
    EXPECT_FLOAT_EQ(config.getDetectorConfig().confidence_threshold, 0.4f);
    EXPECT_EQ(config.getExtractionConfig().palette_size, 8);
    EXPECT_EQ(config.getExtractionConfig().random_seed, 7);
    EXPECT_EQ(config.getExtractionConfig().kmeans_attempts, 10);
    EXPECT_EQ(config.getAnalysisConfig().colors_per_item, 3);
    EXPECT_TRUE(config.isDebugMode());
    EXPECT_TRUE(config.validateConfig());
}

TEST(ConfigManagerTest, ReportsInvalidValues) {
    json j = {
        {"detector", {{"input_size", 100}, {"nms_threshold", 1.5}}},
        {"analysis", {{"colors_per_item", 0}}},
        {"log_level", "LOUD"}
    };

    ConfigManager config;
    ASSERT_TRUE(config.loadFromJson(j));
    auto errors = config.getValidationErrors();
    EXPECT_EQ(errors.size(), 4u);
    EXPECT_FALSE(config.validateConfig());
}

TEST(ConfigManagerTest, WrongValueTypeFailsToLoad) {
    ConfigManager config;
    EXPECT_FALSE(config.loadFromJson({{"detector", {{"input_size", "large"}}}}));
    EXPECT_FALSE(config.isLoaded());
    EXPECT_FALSE(config.loadFromJson(json::array()));
}

TEST(ConfigManagerTest, LoadsFromFileAndReloads) {
    const std::string path = ::testing::TempDir() + "fitcast_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"analysis": {"colors_per_item": 4}})";
    }

    ConfigManager config;
    ASSERT_TRUE(config.loadConfig(path));
    EXPECT_EQ(config.getAnalysisConfig().colors_per_item, 4);

    {
        std::ofstream out(path);
        out << R"({"analysis": {"colors_per_item": 1}})";
    }
    ASSERT_TRUE(config.reloadConfig());
    EXPECT_EQ(config.getAnalysisConfig().colors_per_item, 1);
    std::remove(path.c_str());
}

TEST(ConfigManagerTest, MissingOrMalformedFileFails) {
    ConfigManager config;
    EXPECT_FALSE(config.loadConfig("/nonexistent/fitcast.json"));
    EXPECT_FALSE(config.reloadConfig());

    const std::string path = ::testing::TempDir() + "fitcast_bad_config.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_FALSE(config.loadConfig(path));
    std::remove(path.c_str());
}

TEST(ConfigManagerTest, EnvironmentOverridesModelPaths) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromJson({{"models", {{"detector_path", "/from/config.onnx"}}}}));

    setenv("DETECTOR_MODEL_PATH", "/from/env.onnx", 1);
    config.applyEnvironmentOverrides();
    unsetenv("DETECTOR_MODEL_PATH");

    EXPECT_EQ(config.getModelPaths().detector_path, "/from/env.onnx");
}
