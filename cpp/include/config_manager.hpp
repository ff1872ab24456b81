#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "ai_inference.hpp"
#include "color_extractor.hpp"

namespace Fitcast {

struct ModelPaths {
    std::string detector_path;
    std::string similarity_path;
    std::string prompt_embeddings_path;
};

struct AnalysisConfig {
    int colors_per_item = 2;
};

class ConfigManager {
private:
    nlohmann::json config_json;
    std::string config_file_path;

    // Cached configurations
    ModelPaths model_paths;
    DetectorConfig detector_config;
    Color::ExtractionConfig extraction_config;
    AnalysisConfig analysis_config;

    bool is_loaded;

public:
    ConfigManager();
    ~ConfigManager();

    // Configuration loading and validation
    bool loadConfig(const std::string& config_path);
    bool loadFromJson(const nlohmann::json& json);
    bool reloadConfig();
    bool validateConfig() const;
    std::vector<std::string> getValidationErrors() const;
    bool isLoaded() const { return is_loaded; }

    // Environment overrides for model locations
    void applyEnvironmentOverrides();

    // Configuration access
    const ModelPaths& getModelPaths() const;
    const DetectorConfig& getDetectorConfig() const;
    const Color::ExtractionConfig& getExtractionConfig() const;
    const AnalysisConfig& getAnalysisConfig() const;

    // Utility methods
    bool isDebugMode() const;
    std::string getLogLevel() const;

private:
    void parseConfig();
    void parseModelPaths();
    void parseDetectorConfig();
    void parseExtractionConfig();
    void parseAnalysisConfig();
};

} // namespace Fitcast

#endif // CONFIG_MANAGER_HPP
