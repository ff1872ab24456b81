#include <opencv2/core.hpp>
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

#include "ai_inference.hpp"
#include "config_manager.hpp"
#include "outfit_analyzer.hpp"
#include "suggestion_generator.hpp"

using json = nlohmann::json;
using namespace Fitcast;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_ANALYSIS = 2;

std::string getenv_str(const char* key, const char* def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : std::string(def);
}

void print_usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " <image> <occasion> [--suggest [--preferences <json>]]\n"
              << "  " << program << " --occasions\n"
              << "  " << program << " --classes\n"
              << "  " << program << " --tips <occasion> [item ...]\n"
              << "  " << program << " --health\n";
}

int list_occasions() {
    json occasions = json::object();
    for (const auto& occasion : allOccasions()) {
        occasions[occasionKey(occasion)] = occasionDescription(occasion);
    }
    std::cout << json{{"occasions", occasions}}.dump(2) << std::endl;
    return EXIT_OK;
}

int list_classes() {
    json classes = json::array();
    for (const auto& itemClass : allItemClasses()) {
        classes.push_back(itemClassName(itemClass));
    }
    std::cout << json{{"classes", classes}, {"total_classes", classes.size()}}.dump(2) << std::endl;
    return EXIT_OK;
}

int print_tips(const std::string& occasionArg, const std::vector<std::string>& itemArgs) {
    Occasion occasion = parseOccasion(occasionArg);

    std::vector<ItemClass> items;
    for (const auto& name : itemArgs) {
        bool found = false;
        for (const auto& itemClass : allItemClasses()) {
            if (itemClassName(itemClass) == name) {
                items.push_back(itemClass);
                found = true;
            }
        }
        if (!found) {
            std::cerr << "Ignoring unknown item '" << name << "'" << std::endl;
        }
    }

    std::cout << SuggestionGenerator::quickTipsJson(occasion, items).dump(2) << std::endl;
    return EXIT_OK;
}

bool load_configuration(ConfigManager& config) {
    std::string config_path = getenv_str("CONFIG_PATH", "config/fitcast.json");

    if (!config.loadConfig(config_path)) {
        std::clog << "Using default configuration..." << std::endl;
        if (!config.loadFromJson(json::object())) {
            return false;
        }
    }
    config.applyEnvironmentOverrides();
    return true;
}

bool load_valid_configuration(ConfigManager& config) {
    if (!load_configuration(config) || !config.validateConfig()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.getValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return false;
    }
    if (config.isDebugMode()) {
        std::clog << "Debug mode enabled" << std::endl;
    }
    return true;
}

struct Backends {
    std::shared_ptr<OnnxDetector> detector;
    std::shared_ptr<OnnxSimilarityModel> similarity;
};

Backends load_backends(const ConfigManager& config) {
    const auto& paths = config.getModelPaths();
    Backends backends;

    backends.detector = std::make_shared<OnnxDetector>(config.getDetectorConfig());
    if (!backends.detector->loadModel(paths.detector_path)) {
        std::cerr << "Detector unavailable: " << backends.detector->getLastError() << std::endl;
    }

    backends.similarity = std::make_shared<OnnxSimilarityModel>();
    if (!backends.similarity->loadModel(paths.similarity_path, paths.prompt_embeddings_path)) {
        std::cerr << "Similarity model unavailable: " << backends.similarity->getLastError() << std::endl;
    }
    return backends;
}

int run_health() {
    ConfigManager config;
    if (!load_valid_configuration(config)) {
        return EXIT_USAGE;
    }

    Backends backends = load_backends(config);
    json health = backendHealth(backends.detector.get(), backends.similarity.get());
    std::cout << health.dump(2) << std::endl;
    return health["status"] == "healthy" ? EXIT_OK : EXIT_ANALYSIS;
}

int run_analysis(const std::string& imagePath, const std::string& occasion, bool suggest,
                 const UserPreferences& preferences) {
    ConfigManager config;
    if (!load_valid_configuration(config)) {
        return EXIT_USAGE;
    }

    // Reject bad occasions before loading any model
    parseOccasion(occasion);

    Backends backends = load_backends(config);

    AnalyzerOptions options;
    options.colors_per_item = config.getAnalysisConfig().colors_per_item;
    options.debug_mode = config.isDebugMode();
    options.extraction = config.getExtractionConfig();

    OutfitAnalyzer analyzer(backends.detector, backends.similarity, options);
    AnalysisResult result = analyzer.analyze(imagePath, occasion);

    json out = toJson(result);
    if (suggest) {
        // No remote text generator is wired; the generator answers from its rule set
        SuggestionGenerator generator;
        Suggestions suggestions = generator.generate(result, preferences);
        for (auto& [key, value] : toJson(suggestions).items()) {
            out[key] = value;
        }
        if (!preferences.empty()) {
            out["user_preferences"] = toJson(preferences);
        }
    }

    std::cout << out.dump(2) << std::endl;
    return EXIT_OK;
}

// <image> <occasion> [--suggest [--preferences <json>]]
bool parse_analysis_args(const std::vector<std::string>& args, bool& suggest, UserPreferences& preferences) {
    suggest = false;
    for (size_t i = 2; i < args.size(); ++i) {
        if (args[i] == "--suggest") {
            suggest = true;
        } else if (args[i] == "--preferences" && i + 1 < args.size()) {
            try {
                preferences = UserPreferences::fromJson(json::parse(args[++i]));
            } catch (const json::exception& e) {
                std::cerr << "Invalid --preferences JSON: " << e.what() << std::endl;
                return false;
            }
        } else {
            return false;
        }
    }
    if (!preferences.empty() && !suggest) {
        std::cerr << "--preferences requires --suggest" << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        if (args[0] == "--occasions") {
            return list_occasions();
        }
        if (args[0] == "--classes") {
            return list_classes();
        }
        if (args[0] == "--tips") {
            if (args.size() < 2) {
                print_usage(argv[0]);
                return EXIT_USAGE;
            }
            return print_tips(args[1], std::vector<std::string>(args.begin() + 2, args.end()));
        }

        if (args[0] == "--health") {
            return run_health();
        }

        bool suggest = false;
        UserPreferences preferences;
        if (args.size() < 2 || !parse_analysis_args(args, suggest, preferences)) {
            print_usage(argv[0]);
            return EXIT_USAGE;
        }
        return run_analysis(args[0], args[1], suggest, preferences);

    } catch (const InvalidOccasionError& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const AnalysisError& e) {
        std::cerr << "Analysis failed: " << e.what() << std::endl;
        return EXIT_ANALYSIS;
    } catch (const cv::Exception& e) {
        std::cerr << "OpenCV error: " << e.what() << std::endl;
        return EXIT_ANALYSIS;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_ANALYSIS;
    }
}
