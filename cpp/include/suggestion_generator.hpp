#ifndef SUGGESTION_GENERATOR_HPP
#define SUGGESTION_GENERATOR_HPP

#include "model_interfaces.hpp"
#include "outfit_types.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Fitcast {

struct UserPreferences {
    std::string style_preference;
    std::string budget;
    std::vector<std::string> avoid_items;
    std::vector<std::string> favorite_colors;

    bool empty() const {
        return style_preference.empty() && budget.empty() && avoid_items.empty() && favorite_colors.empty();
    }

    static UserPreferences fromJson(const nlohmann::json& j);
};

struct Suggestions {
    std::string whats_working;
    std::string areas_for_improvement;
    std::vector<std::string> specific_suggestions;
    std::string occasion_tips;
    std::string shopping_suggestions;
    std::string raw_response;
    bool ai_generated = false;
    double generation_time_seconds = 0.0;
};

nlohmann::json toJson(const Suggestions& suggestions);
nlohmann::json toJson(const UserPreferences& preferences);

/**
 * @brief Stylist advice for an analyzed outfit.
 *
 * Asks the text generator first and falls back to fixed, score-banded advice
 * when it is missing, fails or returns nothing.
 */
class SuggestionGenerator {
public:
    explicit SuggestionGenerator(std::shared_ptr<ITextGenerator> generator = nullptr);

    Suggestions generate(const AnalysisResult& result,
                         const UserPreferences& preferences = UserPreferences()) const;

    std::string buildPrompt(const AnalysisResult& result, const UserPreferences& preferences) const;
    Suggestions parseResponse(const std::string& text) const;
    Suggestions fallbackSuggestions(const AnalysisResult& result) const;

    // At most MAX_QUICK_TIPS
    static std::vector<std::string> quickTips(Occasion occasion, const std::vector<ItemClass>& items);

    static constexpr size_t MAX_QUICK_TIPS = 5;

    // {occasion, occasion_description, detected_items, tips}
    static nlohmann::json quickTipsJson(Occasion occasion, const std::vector<ItemClass>& items);

private:
    std::shared_ptr<ITextGenerator> generator_;
};

} // namespace Fitcast

#endif // SUGGESTION_GENERATOR_HPP
