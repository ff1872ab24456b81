#include "suggestion_generator.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Fitcast {

namespace {

enum class Section { NONE, WORKING, IMPROVEMENT, SUGGESTIONS, OCCASION_TIPS, SHOPPING };

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += separator;
        out += parts[i];
    }
    return out;
}

std::string formatFixed(double value, int decimals) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    return ss.str();
}

void appendText(std::string& target, const std::string& line) {
    if (!target.empty()) target += ' ';
    target += line;
}

bool isProfessional(Occasion occasion) {
    return occasion == Occasion::JOB_INTERVIEW || occasion == Occasion::WORK_MEETING ||
           occasion == Occasion::BUSINESS_CASUAL;
}

bool isSocial(Occasion occasion) {
    return occasion == Occasion::DATE_NIGHT || occasion == Occasion::NIGHT_OUT;
}

bool isCasual(Occasion occasion) {
    return occasion == Occasion::BEACH_VACATION || occasion == Occasion::CASUAL_HANGOUT;
}

} // namespace

UserPreferences UserPreferences::fromJson(const nlohmann::json& j) {
    UserPreferences prefs;
    if (!j.is_object()) {
        return prefs;
    }
    prefs.style_preference = j.value("style_preference", "");
    prefs.budget = j.value("budget", "");
    prefs.avoid_items = j.value("avoid_items", std::vector<std::string>());
    prefs.favorite_colors = j.value("favorite_colors", std::vector<std::string>());
    return prefs;
}

nlohmann::json toJson(const Suggestions& s) {
    nlohmann::json j;
    j["whats_working"] = s.whats_working;
    j["areas_for_improvement"] = s.areas_for_improvement;
    j["specific_suggestions"] = s.specific_suggestions;
    j["occasion_tips"] = s.occasion_tips;
    j["shopping_suggestions"] = s.shopping_suggestions;
    j["ai_suggestions_available"] = s.ai_generated;
    j["fallback_used"] = !s.ai_generated;
    if (s.ai_generated) {
        j["raw_llm_response"] = s.raw_response;
        j["suggestion_generation_time"] = std::round(s.generation_time_seconds * 100.0) / 100.0;
    }
    return j;
}

nlohmann::json toJson(const UserPreferences& prefs) {
    nlohmann::json j = nlohmann::json::object();
    if (!prefs.style_preference.empty()) j["style_preference"] = prefs.style_preference;
    if (!prefs.budget.empty()) j["budget"] = prefs.budget;
    if (!prefs.avoid_items.empty()) j["avoid_items"] = prefs.avoid_items;
    if (!prefs.favorite_colors.empty()) j["favorite_colors"] = prefs.favorite_colors;
    return j;
}

SuggestionGenerator::SuggestionGenerator(std::shared_ptr<ITextGenerator> generator)
    : generator_(std::move(generator)) {}

Suggestions SuggestionGenerator::generate(const AnalysisResult& result, const UserPreferences& preferences) const {
    std::clog << "Generating outfit suggestions..." << std::endl;
    auto start = std::chrono::steady_clock::now();

    if (!generator_ || !generator_->isAvailable()) {
        std::clog << "Text generator not available, using fallback suggestions" << std::endl;
        return fallbackSuggestions(result);
    }

    try {
        std::string text = generator_->generate(buildPrompt(result, preferences));
        if (trim(text).empty()) {
            std::cerr << "Empty response from text generator, using fallback" << std::endl;
            return fallbackSuggestions(result);
        }

        Suggestions suggestions = parseResponse(text);
        suggestions.generation_time_seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        return suggestions;
    } catch (const std::exception& e) {
        std::cerr << "Error generating suggestions: " << e.what() << std::endl;
        return fallbackSuggestions(result);
    }
}

std::string SuggestionGenerator::buildPrompt(const AnalysisResult& result, const UserPreferences& preferences) const {
    std::ostringstream items;
    if (result.detections.empty()) {
        items << "No items detected";
    }
    for (const auto& detection : result.detections) {
        std::vector<std::string> names;
        for (const auto& color : detection.colors) {
            names.push_back(color.name);
        }
        items << "\n  - " << itemClassName(detection.itemClass) << " in "
              << (names.empty() ? std::string("neutral") : join(names, ", "))
              << " colors (confidence: " << formatFixed(detection.confidence, 2) << ")";
    }

    std::string preferencesText;
    if (!preferences.empty()) {
        std::vector<std::string> prefs;
        if (!preferences.style_preference.empty()) prefs.push_back("Style preference: " + preferences.style_preference);
        if (!preferences.budget.empty()) prefs.push_back("Budget: " + preferences.budget);
        if (!preferences.avoid_items.empty()) prefs.push_back("Items to avoid: " + join(preferences.avoid_items, ", "));
        if (!preferences.favorite_colors.empty()) prefs.push_back("Favorite colors: " + join(preferences.favorite_colors, ", "));
        preferencesText = "\n\nUSER PREFERENCES:\n" + join(prefs, "\n");
    }

    const std::string occasion = result.occasionDescription;
    const ScoreBreakdown& b = result.breakdown;

    std::ostringstream prompt;
    prompt << "You are a professional fashion stylist with expertise in creating stylish, contextually "
              "appropriate outfits. Analyze this outfit and provide specific, actionable fashion advice.\n\n"
           << "OUTFIT ANALYSIS:\n"
           << "- Occasion: " << occasion << "\n"
           << "- Overall Style Score: " << formatFixed(result.styleScore, 1) << "/10\n"
           << "- Current Assessment: " << result.feedback << "\n\n"
           << "DETECTED CLOTHING ITEMS:" << items.str() << "\n\n"
           << "DETAILED SCORING BREAKDOWN:\n"
           << "- Contextual Appropriateness: " << formatFixed(b.contextual, 1) << "/10\n"
           << "- Color Harmony: " << formatFixed(b.colorHarmony, 1) << "/10\n"
           << "- Item Completeness: " << formatFixed(b.completeness, 1) << "/10\n"
           << "- Style Coherence: " << formatFixed(b.coherence, 1) << "/10" << preferencesText << "\n\n"
           << "PROVIDE FASHION ADVICE IN THIS EXACT FORMAT:\n\n"
           << "**WHAT'S WORKING:**\n"
           << "[Identify 1-2 positive aspects of this outfit - be specific about colors, item combinations, "
              "or appropriateness for the occasion]\n\n"
           << "**AREAS FOR IMPROVEMENT:**\n"
           << "[If score < 8, point out 2-3 specific issues. If score >= 8, mention minor tweaks or styling alternatives]\n\n"
           << "**SPECIFIC SUGGESTIONS:**\n"
           << "[Give 3-4 actionable recommendations such as:]\n"
           << "- Add specific accessories (name exact items like \"black leather belt\" or \"silver watch\")\n"
           << "- Change specific clothing pieces (\"swap sneakers for dress shoes\")\n"
           << "- Adjust colors or patterns (\"add a pop of color with a scarf\")\n"
           << "- Consider different styling (\"tuck in the shirt\" or \"roll up sleeves\")\n"
           << "- Layer appropriately (\"add a blazer\" or \"remove the jacket\")\n\n"
           << "**OCCASION-SPECIFIC TIPS:**\n"
           << "[2-3 tips specifically tailored for " << occasion << ", considering dress codes and appropriateness]\n\n"
           << "**SHOPPING SUGGESTIONS:**\n"
           << "[If needed, suggest 1-2 versatile pieces that would improve this and future outfits]\n\n"
           << "Keep all suggestions practical, specific, and achievable. Focus on improvements that would have "
              "the biggest impact on the overall look while respecting the occasion's requirements.";
    return prompt.str();
}

Suggestions SuggestionGenerator::parseResponse(const std::string& text) const {
    Suggestions suggestions;
    suggestions.raw_response = text;
    suggestions.ai_generated = true;

    Section current = Section::NONE;
    std::istringstream lines(text);
    std::string raw;

    while (std::getline(lines, raw)) {
        const std::string line = trim(raw);
        const std::string upper = toUpper(line);

        if (upper.find("**WHAT'S WORKING:**") != std::string::npos) { current = Section::WORKING; continue; }
        if (upper.find("**AREAS FOR IMPROVEMENT:**") != std::string::npos) { current = Section::IMPROVEMENT; continue; }
        if (upper.find("**SPECIFIC SUGGESTIONS:**") != std::string::npos) { current = Section::SUGGESTIONS; continue; }
        if (upper.find("**OCCASION-SPECIFIC TIPS:**") != std::string::npos) { current = Section::OCCASION_TIPS; continue; }
        if (upper.find("**SHOPPING SUGGESTIONS:**") != std::string::npos) { current = Section::SHOPPING; continue; }

        if (line.empty() || current == Section::NONE || startsWith(line, "**")) {
            continue;
        }

        switch (current) {
            case Section::SUGGESTIONS:
                if (startsWith(line, "- ") || startsWith(line, "* ")) {
                    suggestions.specific_suggestions.push_back(trim(line.substr(2)));
                } else if (startsWith(line, "\xE2\x80\xA2 ")) {
                    suggestions.specific_suggestions.push_back(trim(line.substr(4)));
                } else if (!startsWith(line, "[")) {
                    suggestions.specific_suggestions.push_back(line);
                }
                break;
            case Section::WORKING:       appendText(suggestions.whats_working, line); break;
            case Section::IMPROVEMENT:   appendText(suggestions.areas_for_improvement, line); break;
            case Section::OCCASION_TIPS: appendText(suggestions.occasion_tips, line); break;
            case Section::SHOPPING:      appendText(suggestions.shopping_suggestions, line); break;
            case Section::NONE:          break;
        }
    }

    return suggestions;
}

Suggestions SuggestionGenerator::fallbackSuggestions(const AnalysisResult& result) const {
    Suggestions s;
    s.ai_generated = false;

    if (result.styleScore >= 8.0) {
        s.whats_working = "Your outfit shows excellent coordination and is well-suited for the occasion.";
        s.areas_for_improvement = "This is already a strong look. Minor adjustments could add extra polish.";
        s.specific_suggestions = {
            "Consider adding a statement accessory to personalize the look",
            "Experiment with different shoe styles for variety",
            "Try layering pieces for added visual interest"
        };
    } else if (result.styleScore >= 6.0) {
        s.whats_working = "The basic outfit structure works well for this occasion.";
        s.areas_for_improvement = "Some elements could be refined for better overall impact.";
        s.specific_suggestions = {
            "Focus on improving color coordination between pieces",
            "Consider adding complementary accessories",
            "Pay attention to fit and proportions of garments",
            "Ensure all pieces match the formality level required"
        };
    } else {
        s.whats_working = "There are elements that provide a good foundation to build upon.";
        s.areas_for_improvement = "Several aspects could be adjusted for better appropriateness and style.";
        s.specific_suggestions = {
            "Reconsider the color palette for better harmony",
            "Add more occasion-appropriate pieces",
            "Focus on creating better coordination between items",
            "Consider the formality requirements of the occasion"
        };
    }

    const Occasion occasion = result.occasion;
    if (isProfessional(occasion)) {
        s.occasion_tips = "For professional settings, prioritize conservative colors, proper fit, and polished accessories.";
    } else if (isSocial(occasion)) {
        s.occasion_tips = "For social occasions, you can be more expressive with colors and accessories while maintaining good taste.";
    } else if (isCasual(occasion)) {
        s.occasion_tips = "For casual settings, comfort and appropriateness for activities are key, with room for personal expression.";
    } else {
        s.occasion_tips = "For " + occasionKey(occasion) + ", focus on appropriate formality levels and practical considerations.";
    }

    s.shopping_suggestions = "Consider investing in versatile pieces that can work across multiple occasions.";
    return s;
}

std::vector<std::string> SuggestionGenerator::quickTips(Occasion occasion, const std::vector<ItemClass>& items) {
    std::vector<std::string> tips;

    switch (occasion) {
        case Occasion::JOB_INTERVIEW:
        case Occasion::WORK_MEETING:
            tips = {
                "Ensure all pieces are wrinkle-free and well-fitted",
                "Stick to conservative color palette",
                "Keep accessories minimal and professional"
            };
            break;
        case Occasion::DATE_NIGHT:
            tips = {
                "Add one statement piece to create visual interest",
                "Consider the venue when choosing formality level",
                "Don't forget grooming details - they matter"
            };
            break;
        case Occasion::BEACH_VACATION:
            tips = {
                "Choose breathable fabrics for comfort",
                "Don't forget sun protection accessories",
                "Opt for easy-to-clean materials"
            };
            break;
        default:
            break;
    }

    auto contains = [&items](ItemClass item) {
        return std::find(items.begin(), items.end(), item) != items.end();
    };
    if (contains(ItemClass::JACKET)) tips.push_back("Ensure jacket fits properly at shoulders and sleeves");
    if (contains(ItemClass::SHOE)) tips.push_back("Make sure shoes are clean and appropriate for walking");
    if (contains(ItemClass::BAG)) tips.push_back("Choose bag size appropriate for the occasion needs");

    if (tips.size() > MAX_QUICK_TIPS) {
        tips.resize(MAX_QUICK_TIPS);
    }
    return tips;
}

nlohmann::json SuggestionGenerator::quickTipsJson(Occasion occasion, const std::vector<ItemClass>& items) {
    nlohmann::json names = nlohmann::json::array();
    for (const auto& item : items) {
        names.push_back(itemClassName(item));
    }

    nlohmann::json j;
    j["occasion"] = occasionKey(occasion);
    j["occasion_description"] = occasionDescription(occasion);
    j["detected_items"] = names;
    j["tips"] = quickTips(occasion, items);
    return j;
}

} // namespace Fitcast
