#ifndef SCORING_ENGINE_HPP
#define SCORING_ENGINE_HPP

#include "model_interfaces.hpp"
#include "outfit_types.hpp"

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace Fitcast {
namespace Scoring {

constexpr double MIN_SCORE = 0.0;
constexpr double MAX_SCORE = 10.0;
constexpr double CONTEXTUAL_FALLBACK = 6.0;
constexpr double NO_COLOR_HARMONY = 5.0;

struct ScoringWeights {
    double contextual = 0.6;
    double color_harmony = 0.2;
    double completeness = 0.1;
    double coherence = 0.1;
};

using ItemSet = std::set<ItemClass>;
using ColorNameSet = std::set<std::string>;

// Completeness looks at both the distinct classes and the raw detection count
struct ItemFacts {
    ItemSet classes;
    size_t itemCount = 0;
};

// One additive adjustment; a rule list is folded over a start value then clamped once
template <typename Facts>
struct ScoreRule {
    std::string label;
    std::function<bool(const Facts&)> applies;
    double delta;
};

double clampScore(double score);

template <typename Facts>
double applyRules(double start, const std::vector<ScoreRule<Facts>>& rules, const Facts& facts) {
    double score = start;
    for (const auto& rule : rules) {
        if (rule.applies(facts)) {
            score += rule.delta;
        }
    }
    return clampScore(score);
}

// Rule tables
const std::vector<ScoreRule<ColorNameSet>>& colorHarmonyRules();
std::vector<ScoreRule<ItemFacts>> completenessRules(Occasion occasion);
std::vector<ScoreRule<ItemSet>> coherenceRules(Occasion occasion);

// Sub-scores over plain facts
double colorHarmonyScore(const ColorNameSet& distinctColors);
double completenessScore(const ItemFacts& items, Occasion occasion);
double coherenceScore(const ItemSet& items, Occasion occasion);
bool hasClashingColors(const ColorNameSet& distinctColors);

std::vector<std::string> contextualPrompts(Occasion occasion);
double similarityToScore(double similarity);

double weightedScore(const ScoreBreakdown& breakdown, const ScoringWeights& weights);
std::string feedbackFor(double finalScore, Occasion occasion);

ItemSet itemsOf(const std::vector<Detection>& detections);
ItemFacts itemFactsOf(const std::vector<Detection>& detections);
ColorNameSet colorNamesOf(const std::vector<Detection>& detections);

/**
 * @brief Computes the four outfit sub-scores and the weighted style score.
 *
 * Only the contextual sub-score touches a model. A missing, unavailable or
 * failing similarity model yields CONTEXTUAL_FALLBACK instead of an error.
 */
class ScoringEngine {
public:
    explicit ScoringEngine(std::shared_ptr<ISimilarityModel> similarity = nullptr,
                           const ScoringWeights& weights = ScoringWeights());

    double contextualScore(const std::string& imageRef, Occasion occasion) const;

    ScoreBreakdown score(const std::vector<Detection>& detections, Occasion occasion,
                         const std::string& imageRef) const;

    double finalScore(const ScoreBreakdown& breakdown) const;

    const ScoringWeights& weights() const { return weights_; }
    void setDebugMode(bool enabled) { debug_mode_ = enabled; }

private:
    std::shared_ptr<ISimilarityModel> similarity_;
    ScoringWeights weights_;
    bool debug_mode_ = false;
};

} // namespace Scoring
} // namespace Fitcast

#endif // SCORING_ENGINE_HPP
