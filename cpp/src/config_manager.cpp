#include "config_manager.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace Fitcast {

namespace {

const nlohmann::json& section(const nlohmann::json& root, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

void override_from_env(const char* key, std::string& target) {
    const char* v = std::getenv(key);
    if (v && *v) {
        target = v;
    }
}

} // namespace

ConfigManager::ConfigManager() : config_json(nlohmann::json::object()), is_loaded(false) {}

ConfigManager::~ConfigManager() {}

bool ConfigManager::loadConfig(const std::string& config_path) {
    config_file_path = config_path;

    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            std::cerr << "Failed to open config file: " << config_path << std::endl;
            return false;
        }

        nlohmann::json loaded;
        config_file >> loaded;
        config_file.close();

        if (!loadFromJson(loaded)) {
            return false;
        }

        std::clog << "Configuration loaded successfully from: " << config_path << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::loadFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        std::cerr << "Configuration root must be a JSON object" << std::endl;
        return false;
    }

    try {
        config_json = json;
        parseConfig();
        is_loaded = true;
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Invalid configuration value: " << e.what() << std::endl;
        is_loaded = false;
        return false;
    }
}

bool ConfigManager::reloadConfig() {
    if (config_file_path.empty()) {
        std::cerr << "No config file path set for reload" << std::endl;
        return false;
    }
    return loadConfig(config_file_path);
}

void ConfigManager::parseConfig() {
    parseModelPaths();
    parseDetectorConfig();
    parseExtractionConfig();
    parseAnalysisConfig();
}

void ConfigManager::parseModelPaths() {
    const auto& models = section(config_json, "models");
    model_paths.detector_path = models.value("detector_path", "models/fashion_yolov8.onnx");
    model_paths.similarity_path = models.value("similarity_path", "models/clip_image_encoder.onnx");
    model_paths.prompt_embeddings_path = models.value("prompt_embeddings_path", "models/prompt_embeddings.json");
}

void ConfigManager::parseDetectorConfig() {
    const auto& detector = section(config_json, "detector");
    detector_config.input_size = detector.value("input_size", 640);
    detector_config.confidence_threshold = detector.value("confidence_threshold", 0.25f);
    detector_config.nms_threshold = detector.value("nms_threshold", 0.45f);
}

void ConfigManager::parseExtractionConfig() {
    const auto& extraction = section(config_json, "extraction");
    Color::ExtractionConfig defaults;

    extraction_config.palette_size = extraction.value("palette_size", defaults.palette_size);
    extraction_config.palette_quality = extraction.value("palette_quality", defaults.palette_quality);
    extraction_config.shadow_value = extraction.value("shadow_value", defaults.shadow_value);
    extraction_config.highlight_value = extraction.value("highlight_value", defaults.highlight_value);
    extraction_config.background_saturation = extraction.value("background_saturation", defaults.background_saturation);
    extraction_config.background_value = extraction.value("background_value", defaults.background_value);
    extraction_config.min_valid_pixels = extraction.value("min_valid_pixels", defaults.min_valid_pixels);
    extraction_config.pixels_per_cluster = extraction.value("pixels_per_cluster", defaults.pixels_per_cluster);
    extraction_config.min_cluster_percentage = extraction.value("min_cluster_percentage", defaults.min_cluster_percentage);
    extraction_config.kmeans_attempts = extraction.value("kmeans_attempts", defaults.kmeans_attempts);
    extraction_config.kmeans_max_iterations = extraction.value("kmeans_max_iterations", defaults.kmeans_max_iterations);
    extraction_config.random_seed = extraction.value("random_seed", defaults.random_seed);
    extraction_config.saturation_sample_step = extraction.value("saturation_sample_step", defaults.saturation_sample_step);
}

void ConfigManager::parseAnalysisConfig() {
    const auto& analysis = section(config_json, "analysis");
    analysis_config.colors_per_item = analysis.value("colors_per_item", 2);
}

void ConfigManager::applyEnvironmentOverrides() {
    override_from_env("DETECTOR_MODEL_PATH", model_paths.detector_path);
    override_from_env("SIMILARITY_MODEL_PATH", model_paths.similarity_path);
    override_from_env("PROMPT_EMBEDDINGS_PATH", model_paths.prompt_embeddings_path);
}

const ModelPaths& ConfigManager::getModelPaths() const {
    return model_paths;
}

const DetectorConfig& ConfigManager::getDetectorConfig() const {
    return detector_config;
}

const Color::ExtractionConfig& ConfigManager::getExtractionConfig() const {
    return extraction_config;
}

const AnalysisConfig& ConfigManager::getAnalysisConfig() const {
    return analysis_config;
}

bool ConfigManager::isDebugMode() const {
    return config_json.value("debug_mode", false);
}

std::string ConfigManager::getLogLevel() const {
    return config_json.value("log_level", "INFO");
}

bool ConfigManager::validateConfig() const {
    return getValidationErrors().empty();
}

std::vector<std::string> ConfigManager::getValidationErrors() const {
    std::vector<std::string> errors;

    if (model_paths.detector_path.empty()) {
        errors.push_back("No detector model path configured");
    }

    // Detector
    if (detector_config.input_size <= 0 || detector_config.input_size % 32 != 0) {
        errors.push_back("detector.input_size must be a positive multiple of 32");
    }
    if (detector_config.confidence_threshold < 0.0f || detector_config.confidence_threshold > 1.0f) {
        errors.push_back("detector.confidence_threshold must be within [0, 1]");
    }
    if (detector_config.nms_threshold < 0.0f || detector_config.nms_threshold > 1.0f) {
        errors.push_back("detector.nms_threshold must be within [0, 1]");
    }

    // Extraction
    const auto& ex = extraction_config;
    if (ex.palette_size < 1) {
        errors.push_back("extraction.palette_size must be at least 1");
    }
    if (ex.palette_quality < 1) {
        errors.push_back("extraction.palette_quality must be at least 1");
    }
    if (ex.shadow_value < 0 || ex.highlight_value > 255 || ex.shadow_value >= ex.highlight_value) {
        errors.push_back("extraction.shadow_value must be below extraction.highlight_value within [0, 255]");
    }
    if (ex.pixels_per_cluster < 1) {
        errors.push_back("extraction.pixels_per_cluster must be at least 1");
    }
    if (ex.min_cluster_percentage < 0.0 || ex.min_cluster_percentage > 100.0) {
        errors.push_back("extraction.min_cluster_percentage must be within [0, 100]");
    }
    if (ex.kmeans_attempts < 1 || ex.kmeans_max_iterations < 1) {
        errors.push_back("extraction k-means attempts and iterations must be at least 1");
    }

    // Analysis
    if (analysis_config.colors_per_item < 1) {
        errors.push_back("analysis.colors_per_item must be at least 1");
    }

    const std::string level = getLogLevel();
    if (level != "DEBUG" && level != "INFO" && level != "WARNING" && level != "ERROR") {
        errors.push_back("Unknown log_level '" + level + "'");
    }

    return errors;
}

} // namespace Fitcast
