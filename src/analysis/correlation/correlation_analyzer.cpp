/// @file correlation_analyzer.cpp
/// @brief Trigger/product correlation implementation

#include "analysis/correlation/correlation_analyzer.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

#include "analysis/baseline.h"
#include "common/logging.h"

namespace flaresignal::correlation {

std::string_view PatternToString(CorrelationPattern pattern) {
    switch (pattern) {
        case CorrelationPattern::kOftenWorse:
            return "often_worse";
        case CorrelationPattern::kOftenBetter:
            return "often_better";
        case CorrelationPattern::kMixed:
            return "mixed";
        case CorrelationPattern::kNoPattern:
            return "no_pattern";
        case CorrelationPattern::kInsufficientData:
            return "insufficient_data";
    }
    return "insufficient_data";
}

std::string_view PatternLabel(CorrelationPattern pattern) {
    switch (pattern) {
        case CorrelationPattern::kOftenWorse:
            return "often followed by worse symptoms";
        case CorrelationPattern::kOftenBetter:
            return "often followed by improvement";
        case CorrelationPattern::kMixed:
            return "mixed reactions observed";
        case CorrelationPattern::kNoPattern:
            return "no clear pattern detected";
        case CorrelationPattern::kInsufficientData:
            return "not enough data yet";
    }
    return "not enough data yet";
}

std::string_view ConfidenceToString(CorrelationConfidence confidence) {
    switch (confidence) {
        case CorrelationConfidence::kLow:
            return "low";
        case CorrelationConfidence::kMedium:
            return "medium";
        case CorrelationConfidence::kHigh:
            return "high";
    }
    return "low";
}

std::string_view ConfidenceLabel(CorrelationConfidence confidence) {
    switch (confidence) {
        case CorrelationConfidence::kLow:
            return "Preliminary";
        case CorrelationConfidence::kMedium:
            return "Moderate confidence";
        case CorrelationConfidence::kHigh:
            return "High confidence";
    }
    return "Preliminary";
}

TagCategory FoodCategory() {
    return TagCategory{"food", "food:"};
}

TagCategory ProductCategory() {
    return TagCategory{"product", "product:"};
}

TagCategory TriggerCategory() {
    return TagCategory{"trigger", ""};
}

std::optional<std::string> ExtractCandidateName(std::string_view tag,
                                                const TagCategory& category) {
    std::string_view rest = tag;

    if (category.prefix.empty()) {
        // General triggers carry no "category:" prefix
        if (rest.find(':') != std::string_view::npos) {
            return std::nullopt;
        }
    } else {
        // Prefixes are lower-case markers written by the logger; matching is exact
        if (!absl::StartsWith(absl::string_view(rest.data(), rest.size()), category.prefix)) {
            return std::nullopt;
        }
        rest.remove_prefix(category.prefix.size());
    }

    std::string name = absl::AsciiStrToLower(absl::StripAsciiWhitespace(absl::string_view(rest.data(), rest.size())));
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

std::string DisplayName(std::string_view name) {
    std::vector<std::string> words = absl::StrSplit(absl::string_view(name.data(), name.size()), ' ');
    for (auto& word : words) {
        if (!word.empty()) {
            word[0] = absl::ascii_toupper(static_cast<unsigned char>(word[0]));
        }
    }
    return absl::StrJoin(words, " ");
}

ExposureOutcome ClassifyExposure(double post_value, double local_baseline,
                                 const analysis::CorrelationConfig& config) {
    const double delta = post_value - local_baseline;
    if (delta >= config.worse_delta) {
        return ExposureOutcome::kWorse;
    }
    if (delta <= config.better_delta) {
        return ExposureOutcome::kBetter;
    }
    return ExposureOutcome::kNeutral;
}

CorrelationPattern ClassifyPattern(size_t worse, size_t better, size_t analyzable,
                                   const analysis::CorrelationConfig& config) {
    if (analyzable == 0) {
        return CorrelationPattern::kInsufficientData;
    }

    const double worse_ratio = static_cast<double>(worse) / static_cast<double>(analyzable);
    const double better_ratio = static_cast<double>(better) / static_cast<double>(analyzable);

    if (worse_ratio >= config.dominant_ratio) {
        return CorrelationPattern::kOftenWorse;
    }
    if (better_ratio >= config.dominant_ratio) {
        return CorrelationPattern::kOftenBetter;
    }
    if (worse_ratio + better_ratio >= config.mixed_ratio) {
        return CorrelationPattern::kMixed;
    }
    return CorrelationPattern::kNoPattern;
}

double ComputeConsistency(size_t worse, size_t better, size_t neutral, size_t analyzable) {
    if (analyzable == 0) {
        return 0.0;
    }
    const size_t majority = std::max({worse, better, neutral});
    return static_cast<double>(majority) / static_cast<double>(analyzable);
}

CorrelationConfidence ComputeConfidence(size_t exposure_count, double consistency,
                                        const analysis::CorrelationConfig& config) {
    if (exposure_count <= config.low_confidence_max_count) {
        return CorrelationConfidence::kLow;
    }

    const bool consistent = consistency >= config.confidence_consistency;
    if (exposure_count <= config.medium_confidence_max_count) {
        return consistent ? CorrelationConfidence::kMedium : CorrelationConfidence::kLow;
    }
    return consistent ? CorrelationConfidence::kHigh : CorrelationConfidence::kMedium;
}

double PatternWeight(CorrelationPattern pattern) {
    switch (pattern) {
        case CorrelationPattern::kOftenWorse:
            return 1.0;
        case CorrelationPattern::kMixed:
            return 0.5;
        case CorrelationPattern::kOftenBetter:
            return 0.3;
        case CorrelationPattern::kNoPattern:
            return 0.2;
        case CorrelationPattern::kInsufficientData:
            return 0.0;
    }
    return 0.0;
}

double RankingScore(const CorrelationResult& result) {
    return PatternWeight(result.pattern) * result.consistency *
           std::log(static_cast<double>(result.total_exposure_days) + 1.0);
}

void RankResults(std::vector<CorrelationResult>& results) {
    std::sort(results.begin(), results.end(),
        [](const CorrelationResult& a, const CorrelationResult& b) {
            const bool a_insufficient = a.pattern == CorrelationPattern::kInsufficientData;
            const bool b_insufficient = b.pattern == CorrelationPattern::kInsufficientData;
            if (a_insufficient != b_insufficient) {
                return b_insufficient;
            }
            if (a.ranking_score != b.ranking_score) {
                return a.ranking_score > b.ranking_score;
            }
            if (a.total_exposure_days != b.total_exposure_days) {
                return a.total_exposure_days > b.total_exposure_days;
            }
            return a.name < b.name;
        });
}

CorrelationAnalyzer::CorrelationAnalyzer(TagCategory category,
                                         analysis::CorrelationConfig config)
    : category_(std::move(category)),
      config_(std::move(config)) {}

std::vector<CorrelationResult> CorrelationAnalyzer::Analyze(
    const std::vector<Observation>& observations,
    std::optional<Date> as_of) const {
    const std::vector<Observation> in_period = FilterPeriod(observations, as_of);
    if (in_period.empty()) {
        return {};
    }

    const analysis::DailySeries intensity = analysis::BuildDailyIntensity(in_period);
    const TagsByDate tags_by_date = BuildTagsByDate(in_period);

    // Candidate -> distinct exposure dates, ordered by name for determinism
    std::map<std::string, std::set<Date>> exposures;
    for (const auto& [date, names] : tags_by_date) {
        for (const auto& name : names) {
            exposures[name].insert(date);
        }
    }

    std::vector<CorrelationResult> results;
    results.reserve(exposures.size());
    for (const auto& [name, dates] : exposures) {
        results.push_back(AnalyzeCandidate(name, dates, intensity, tags_by_date));
    }

    RankResults(results);

    FLARESIGNAL_LOG_DEBUG("Correlation analysis ({}): {} observations, {} candidates",
                          category_.name, in_period.size(), results.size());
    return results;
}

std::vector<Observation> CorrelationAnalyzer::FilterPeriod(
    const std::vector<Observation>& observations,
    std::optional<Date> as_of) const {
    if (!config_.period_days.has_value() || observations.empty()) {
        return observations;
    }

    Date end = as_of.value_or(ObservationDate(observations.front()));
    if (!as_of.has_value()) {
        for (const auto& observation : observations) {
            end = std::max(end, ObservationDate(observation));
        }
    }
    const Date start = end - *config_.period_days;

    std::vector<Observation> filtered;
    for (const auto& observation : observations) {
        const Date date = ObservationDate(observation);
        if (start <= date && date <= end) {
            filtered.push_back(observation);
        }
    }
    return filtered;
}

CorrelationAnalyzer::TagsByDate CorrelationAnalyzer::BuildTagsByDate(
    const std::vector<Observation>& observations) const {
    TagsByDate tags_by_date;
    for (const auto& observation : observations) {
        for (const auto& tag : observation.tags) {
            if (auto name = ExtractCandidateName(tag, category_)) {
                tags_by_date[ObservationDate(observation)].insert(std::move(*name));
            }
        }
    }
    return tags_by_date;
}

CorrelationResult CorrelationAnalyzer::AnalyzeCandidate(
    const std::string& name,
    const std::set<Date>& exposure_dates,
    const analysis::DailySeries& intensity,
    const TagsByDate& tags_by_date) const {
    CorrelationResult result;
    result.name = name;
    result.display_name = DisplayName(name);
    result.total_exposure_days = exposure_dates.size();

    if (exposure_dates.size() < config_.min_exposures) {
        FLARESIGNAL_LOG_TRACE("'{}' has {} exposures, below minimum {}",
                              name, exposure_dates.size(), config_.min_exposures);
        return result;
    }

    auto has_candidate = [&tags_by_date, &name](Date date) {
        auto it = tags_by_date.find(date);
        return it != tags_by_date.end() && it->second.count(name) > 0;
    };

    // Exposures inside an earlier exposure's reaction window are the same trial
    std::set<Date> merged;
    for (const Date exposure : exposure_dates) {
        if (merged.count(exposure) > 0) {
            continue;
        }
        for (int offset = 1; offset <= config_.reaction_window_days; ++offset) {
            if (exposure_dates.count(exposure + offset) > 0) {
                merged.insert(exposure + offset);
            }
        }

        const auto post_value = analysis::MeanOverDays(
            intensity, exposure + 1, exposure + config_.reaction_window_days);
        if (!post_value.has_value()) {
            continue;
        }

        const auto local_baseline = analysis::LocalBaseline(
            intensity, exposure, config_.local_baseline_window_days, has_candidate);
        if (!local_baseline.has_value()) {
            continue;
        }

        ++result.analyzable_exposures;
        switch (ClassifyExposure(*post_value, *local_baseline, config_)) {
            case ExposureOutcome::kWorse:
                ++result.worse_days;
                break;
            case ExposureOutcome::kBetter:
                ++result.better_days;
                break;
            case ExposureOutcome::kNeutral:
                ++result.neutral_days;
                break;
        }
    }

    result.pattern = result.analyzable_exposures >= config_.min_exposures
        ? ClassifyPattern(result.worse_days, result.better_days,
                          result.analyzable_exposures, config_)
        : CorrelationPattern::kInsufficientData;
    result.consistency = ComputeConsistency(result.worse_days, result.better_days,
                                            result.neutral_days, result.analyzable_exposures);
    result.confidence = ComputeConfidence(result.total_exposure_days, result.consistency,
                                          config_);
    result.ranking_score = RankingScore(result);
    return result;
}

}  // namespace flaresignal::correlation
