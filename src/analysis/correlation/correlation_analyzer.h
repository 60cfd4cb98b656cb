#pragma once

/// @file correlation_analyzer.h
/// @brief Delayed-reaction correlation between tagged exposures and skin intensity
///
/// For every candidate tag (a food, a product, a general trigger) the
/// analyzer asks whether the days following an exposure tend to be worse
/// than that candidate's own control days: nearby days on which the
/// candidate was not logged.

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "analysis/daily_aggregator.h"
#include "analysis/engine_config.h"
#include "model/observation.h"

namespace flaresignal::correlation {

/// @brief Overall reaction pattern of a candidate
enum class CorrelationPattern {
    kOftenWorse,
    kOftenBetter,
    kMixed,
    kNoPattern,
    kInsufficientData
};

/// @brief How much the pattern can be trusted
enum class CorrelationConfidence {
    kLow,
    kMedium,
    kHigh
};

/// @brief Outcome of a single exposure
enum class ExposureOutcome {
    kWorse,
    kBetter,
    kNeutral
};

std::string_view PatternToString(CorrelationPattern pattern);
std::string_view PatternLabel(CorrelationPattern pattern);
std::string_view ConfidenceToString(CorrelationConfidence confidence);
std::string_view ConfidenceLabel(CorrelationConfidence confidence);

/// @brief Selects which tags are candidates and how they are named
struct TagCategory {
    std::string name;

    /// Tag prefix such as "food:"; empty selects tags with no category prefix
    std::string prefix;
};

/// @brief "food:<name>" tags
TagCategory FoodCategory();

/// @brief "product:<name>" tags
TagCategory ProductCategory();

/// @brief Unprefixed trigger tags ("stress", "heat_sweat")
TagCategory TriggerCategory();

/// @brief Candidate name of a tag within a category
///
/// The prefix must match case-sensitively at the start of the tag ("Food:x"
/// is not a food tag). The remainder is trimmed and lower-cased. Returns
/// std::nullopt when the tag belongs to another category or the name is empty.
std::optional<std::string> ExtractCandidateName(std::string_view tag,
                                                const TagCategory& category);

/// @brief Capitalize each space-separated word ("oat milk" -> "Oat Milk")
std::string DisplayName(std::string_view name);

/// @brief Correlation result for one candidate
struct CorrelationResult {
    std::string name;          ///< Normalized (lower-case) candidate name
    std::string display_name;

    size_t total_exposure_days = 0;
    size_t worse_days = 0;
    size_t better_days = 0;
    size_t neutral_days = 0;
    size_t analyzable_exposures = 0;

    CorrelationPattern pattern = CorrelationPattern::kInsufficientData;
    double consistency = 0.0;  ///< Share of the majority outcome, 0 - 1
    CorrelationConfidence confidence = CorrelationConfidence::kLow;

    double ranking_score = 0.0;
};

/// @brief Classify post-exposure intensity against the local baseline
ExposureOutcome ClassifyExposure(double post_value, double local_baseline,
                                 const analysis::CorrelationConfig& config = {});

/// @brief Pattern over analyzable exposures; kInsufficientData when analyzable is 0
CorrelationPattern ClassifyPattern(size_t worse, size_t better, size_t analyzable,
                                   const analysis::CorrelationConfig& config = {});

/// @brief max(worse, better, neutral) / analyzable, 0 when nothing was analyzable
double ComputeConsistency(size_t worse, size_t better, size_t neutral, size_t analyzable);

/// @brief Confidence band from exposure count and consistency
CorrelationConfidence ComputeConfidence(size_t exposure_count, double consistency,
                                        const analysis::CorrelationConfig& config = {});

/// @brief Ranking weight: often_worse 1.0, mixed 0.5, often_better 0.3,
/// no_pattern 0.2, insufficient_data 0
double PatternWeight(CorrelationPattern pattern);

/// @brief patternWeight * consistency * ln(total_exposure_days + 1)
double RankingScore(const CorrelationResult& result);

/// @brief Per-candidate exposure correlation for one tag category
///
/// Example:
/// @code
///   CorrelationAnalyzer foods(FoodCategory());
///   for (const auto& result : foods.Analyze(observations)) {
///       if (result.pattern == CorrelationPattern::kOftenWorse) {
///           Suggest(result.display_name, ConfidenceLabel(result.confidence));
///       }
///   }
/// @endcode
class CorrelationAnalyzer {
public:
    explicit CorrelationAnalyzer(TagCategory category,
                                 analysis::CorrelationConfig config = {});

    /// @brief Rank every candidate of the category
    ///
    /// @param observations History in any order
    /// @param as_of End of the analysis period; defaults to the latest
    ///        observation date. Only used when config.period_days is set.
    /// @return Results sorted by ranking score, insufficient_data last
    std::vector<CorrelationResult> Analyze(const std::vector<Observation>& observations,
                                           std::optional<Date> as_of = std::nullopt) const;

    const TagCategory& GetCategory() const { return category_; }
    const analysis::CorrelationConfig& GetConfig() const { return config_; }

private:
    using TagsByDate = std::map<Date, std::set<std::string>>;

    std::vector<Observation> FilterPeriod(const std::vector<Observation>& observations,
                                          std::optional<Date> as_of) const;

    TagsByDate BuildTagsByDate(const std::vector<Observation>& observations) const;

    CorrelationResult AnalyzeCandidate(const std::string& name,
                                       const std::set<Date>& exposure_dates,
                                       const analysis::DailySeries& intensity,
                                       const TagsByDate& tags_by_date) const;

    TagCategory category_;
    analysis::CorrelationConfig config_;
};

/// @brief Sort results by ranking score
///
/// insufficient_data sorts last; ties fall back to exposure count
/// (descending) and then name.
void RankResults(std::vector<CorrelationResult>& results);

}  // namespace flaresignal::correlation
