#include "scoring_engine.hpp"
#include <algorithm>
#include <iostream>

namespace Fitcast {
namespace Scoring {

namespace {

const ColorNameSet NEUTRAL_COLORS = {"black", "white", "gray", "dark_gray", "light_gray", "beige"};
const ColorNameSet WARM_COLORS = {"red", "orange", "yellow", "pink"};
const ColorNameSet COOL_COLORS = {"blue", "green", "purple", "teal", "navy"};

const ItemSet FORMAL_ITEMS = {ItemClass::JACKET, ItemClass::SHIRT};
const ItemSet CASUAL_ITEMS = {ItemClass::SHORTS, ItemClass::SUNGLASS};

bool has(const ItemSet& items, ItemClass item) {
    return items.count(item) > 0;
}

bool hasAny(const ItemSet& items, const ItemSet& wanted) {
    return std::any_of(wanted.begin(), wanted.end(),
                       [&items](ItemClass item) { return has(items, item); });
}

size_t countIn(const ColorNameSet& colors, const ColorNameSet& group) {
    return std::count_if(colors.begin(), colors.end(),
                         [&group](const std::string& name) { return group.count(name) > 0; });
}

enum class OccasionGroup { PROFESSIONAL, FORMAL, BEACH, GENERAL };

OccasionGroup completenessGroup(Occasion occasion) {
    switch (occasion) {
        case Occasion::JOB_INTERVIEW:
        case Occasion::WORK_MEETING:
        case Occasion::BUSINESS_CASUAL:
            return OccasionGroup::PROFESSIONAL;
        case Occasion::FORMAL_EVENT:
            return OccasionGroup::FORMAL;
        case Occasion::BEACH_VACATION:
            return OccasionGroup::BEACH;
        default:
            return OccasionGroup::GENERAL;
    }
}

bool isStrictOccasion(Occasion occasion) {
    return occasion == Occasion::JOB_INTERVIEW ||
           occasion == Occasion::WORK_MEETING ||
           occasion == Occasion::FORMAL_EVENT;
}

bool isRelaxedOccasion(Occasion occasion) {
    return occasion == Occasion::BEACH_VACATION || occasion == Occasion::CASUAL_HANGOUT;
}

} // namespace

double clampScore(double score) {
    return std::min(std::max(score, MIN_SCORE), MAX_SCORE);
}

bool hasClashingColors(const ColorNameSet& distinctColors) {
    return countIn(distinctColors, WARM_COLORS) > 1 && countIn(distinctColors, COOL_COLORS) > 1;
}

const std::vector<ScoreRule<ColorNameSet>>& colorHarmonyRules() {
    static const std::vector<ScoreRule<ColorNameSet>> rules = {
        {"more than four colors", [](const ColorNameSet& c) { return c.size() > 4; }, -2.0},
        {"four colors", [](const ColorNameSet& c) { return c.size() == 4; }, -1.0},
        {"neutral anchor", [](const ColorNameSet& c) { return countIn(c, NEUTRAL_COLORS) > 0; }, 1.0},
        {"warm/cool clash", [](const ColorNameSet& c) { return hasClashingColors(c); }, -1.5}
    };
    return rules;
}

std::vector<ScoreRule<ItemFacts>> completenessRules(Occasion occasion) {
    switch (completenessGroup(occasion)) {
        case OccasionGroup::PROFESSIONAL:
            return {
                {"shirt with pants or skirt", [](const ItemFacts& f) {
                    return has(f.classes, ItemClass::SHIRT) && (has(f.classes, ItemClass::PANTS) || has(f.classes, ItemClass::SKIRT));
                }, 2.0},
                {"jacket", [](const ItemFacts& f) { return has(f.classes, ItemClass::JACKET); }, 1.0},
                {"shoes", [](const ItemFacts& f) { return has(f.classes, ItemClass::SHOE); }, 1.0},
                {"shorts", [](const ItemFacts& f) { return has(f.classes, ItemClass::SHORTS); }, -2.0}
            };
        case OccasionGroup::FORMAL:
            return {
                {"dress or shirt with pants", [](const ItemFacts& f) {
                    return has(f.classes, ItemClass::DRESS) || (has(f.classes, ItemClass::SHIRT) && has(f.classes, ItemClass::PANTS));
                }, 2.0},
                {"shoes", [](const ItemFacts& f) { return has(f.classes, ItemClass::SHOE); }, 1.0},
                {"shorts or sunglasses", [](const ItemFacts& f) {
                    return has(f.classes, ItemClass::SHORTS) || has(f.classes, ItemClass::SUNGLASS);
                }, -1.0}
            };
        case OccasionGroup::BEACH:
            return {
                {"shorts, skirt or dress", [](const ItemFacts& f) {
                    return has(f.classes, ItemClass::SHORTS) || has(f.classes, ItemClass::SKIRT) || has(f.classes, ItemClass::DRESS);
                }, 1.0},
                {"sunglasses", [](const ItemFacts& f) { return has(f.classes, ItemClass::SUNGLASS); }, 1.0},
                {"jacket", [](const ItemFacts& f) { return has(f.classes, ItemClass::JACKET); }, -1.0}
            };
        case OccasionGroup::GENERAL:
            break;
    }
    return {
        {"two or more items", [](const ItemFacts& f) { return f.itemCount >= 2; }, 1.0},
        {"shoes", [](const ItemFacts& f) { return has(f.classes, ItemClass::SHOE); }, 0.5}
    };
}

std::vector<ScoreRule<ItemSet>> coherenceRules(Occasion occasion) {
    if (isStrictOccasion(occasion)) {
        return {
            {"mixed formality", [](const ItemSet& i) {
                return hasAny(i, CASUAL_ITEMS) && hasAny(i, FORMAL_ITEMS);
            }, -2.0},
            {"too casual", [](const ItemSet& i) {
                return hasAny(i, CASUAL_ITEMS) && !hasAny(i, FORMAL_ITEMS);
            }, -3.0}
        };
    }
    if (isRelaxedOccasion(occasion)) {
        return {
            {"overdressed", [](const ItemSet& i) {
                return hasAny(i, FORMAL_ITEMS) && !hasAny(i, CASUAL_ITEMS);
            }, -1.0}
        };
    }
    return {};
}

double colorHarmonyScore(const ColorNameSet& distinctColors) {
    if (distinctColors.empty()) {
        return NO_COLOR_HARMONY;
    }
    return applyRules(7.0, colorHarmonyRules(), distinctColors);
}

double completenessScore(const ItemFacts& items, Occasion occasion) {
    return applyRules(5.0, completenessRules(occasion), items);
}

double coherenceScore(const ItemSet& items, Occasion occasion) {
    return applyRules(7.0, coherenceRules(occasion), items);
}

std::vector<std::string> contextualPrompts(Occasion occasion) {
    const std::string context = occasionDescription(occasion);
    return {
        "professional outfit suitable for " + context,
        "appropriate and stylish attire for " + context,
        "well-dressed and coordinated for " + context,
        "fashionable look perfect for " + context
    };
}

double similarityToScore(double similarity) {
    return clampScore((similarity + 1.0) / 2.0 * 10.0);
}

double weightedScore(const ScoreBreakdown& breakdown, const ScoringWeights& weights) {
    double total = weights.contextual * clampScore(breakdown.contextual) +
                   weights.color_harmony * clampScore(breakdown.colorHarmony) +
                   weights.completeness * clampScore(breakdown.completeness) +
                   weights.coherence * clampScore(breakdown.coherence);
    return clampScore(total);
}

std::string feedbackFor(double finalScore, Occasion occasion) {
    const std::string name = occasionDescription(occasion);
    if (finalScore >= 8.0) {
        return "Excellent choice for " + name + "! Very well put together.";
    }
    if (finalScore >= 6.0) {
        return "Good outfit for " + name + ". Well coordinated overall.";
    }
    if (finalScore >= 4.0) {
        return "Decent look for " + name + ", but could use some improvements.";
    }
    return "This outfit may not be the best choice for " + name + ".";
}

ItemSet itemsOf(const std::vector<Detection>& detections) {
    ItemSet items;
    for (const auto& detection : detections) {
        items.insert(detection.itemClass);
    }
    return items;
}

ItemFacts itemFactsOf(const std::vector<Detection>& detections) {
    ItemFacts facts;
    facts.classes = itemsOf(detections);
    facts.itemCount = detections.size();
    return facts;
}

ColorNameSet colorNamesOf(const std::vector<Detection>& detections) {
    ColorNameSet names;
    for (const auto& detection : detections) {
        for (const auto& color : detection.colors) {
            names.insert(color.name);
        }
    }
    return names;
}

// ---------------------------------------------------------------------------
// ScoringEngine
// ---------------------------------------------------------------------------

ScoringEngine::ScoringEngine(std::shared_ptr<ISimilarityModel> similarity, const ScoringWeights& weights)
    : similarity_(std::move(similarity)), weights_(weights) {}

double ScoringEngine::contextualScore(const std::string& imageRef, Occasion occasion) const {
    if (!similarity_ || !similarity_->isAvailable()) {
        std::cerr << "Warning: similarity model not available, using fallback contextual score" << std::endl;
        return CONTEXTUAL_FALLBACK;
    }

    try {
        const auto scores = similarity_->similarities(imageRef, contextualPrompts(occasion));
        if (scores.empty()) {
            std::cerr << "Warning: similarity model returned no scores, using fallback contextual score" << std::endl;
            return CONTEXTUAL_FALLBACK;
        }
        return similarityToScore(*std::max_element(scores.begin(), scores.end()));
    } catch (const std::exception& e) {
        std::cerr << "Error in contextual scoring: " << e.what() << std::endl;
        return CONTEXTUAL_FALLBACK;
    }
}

ScoreBreakdown ScoringEngine::score(const std::vector<Detection>& detections, Occasion occasion,
                                    const std::string& imageRef) const {
    const ItemFacts items = itemFactsOf(detections);

    ScoreBreakdown breakdown;
    breakdown.contextual = contextualScore(imageRef, occasion);
    breakdown.colorHarmony = colorHarmonyScore(colorNamesOf(detections));
    breakdown.completeness = completenessScore(items, occasion);
    breakdown.coherence = coherenceScore(items.classes, occasion);

    if (debug_mode_) {
        std::clog << "  Contextual: " << breakdown.contextual << "/10" << std::endl;
        std::clog << "  Color harmony: " << breakdown.colorHarmony << "/10" << std::endl;
        std::clog << "  Completeness: " << breakdown.completeness << "/10" << std::endl;
        std::clog << "  Coherence: " << breakdown.coherence << "/10" << std::endl;
    }
    return breakdown;
}

double ScoringEngine::finalScore(const ScoreBreakdown& breakdown) const {
    return weightedScore(breakdown, weights_);
}

} // namespace Scoring
} // namespace Fitcast
