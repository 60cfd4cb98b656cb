#pragma once

/// @file engine_config.h
/// @brief Tunable constants for the flare and correlation analyzers

#include <cstddef>
#include <optional>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"

namespace flaresignal::analysis {

/// @brief Configuration for flare detection
struct FlareDetectorConfig {
    /// Trailing window (calendar days, ending the day before) for the baseline
    int baseline_window_days = 14;

    /// Severity units above baseline that a day must reach to count as elevated
    double threshold_margin = 0.5;

    /// Minimum run of consecutive elevated days promoted to an episode
    size_t min_episode_days = 3;

    /// Daily-burden counts at which confidence becomes provisional / mature
    size_t provisional_min_days = 7;
    size_t mature_min_days = 14;

    /// Days after an episode end during which a falling score reads "resolving"
    int resolving_window_days = 3;

    /// Scale maxima used to normalize skin intensity onto the symptom range
    double skin_intensity_max = 5.0;
    double symptom_severity_max = 3.0;

    /// Share of the symptom mean in the per-observation score (rest is skin)
    double symptom_blend_weight = 0.5;
};

/// @brief Configuration for trigger/product correlation analysis
struct CorrelationConfig {
    /// Minimum exposures (and analyzable exposures) for a pattern
    size_t min_exposures = 3;

    /// Reaction window examined after an exposure: D+1 .. D+reaction_window_days
    int reaction_window_days = 3;

    /// Local baseline window: D-N .. D+N, excluding D
    int local_baseline_window_days = 7;

    /// Intensity deltas classifying a single exposure
    double worse_delta = 0.5;
    double better_delta = -0.5;

    /// Outcome ratio at which worse/better dominates
    double dominant_ratio = 0.6;

    /// Combined worse+better ratio below which there is no pattern
    double mixed_ratio = 0.5;

    /// Exposure counts bounding the low and medium confidence bands
    size_t low_confidence_max_count = 4;
    size_t medium_confidence_max_count = 7;

    /// Consistency needed to lift confidence one band
    double confidence_consistency = 0.6;

    /// Restrict analysis to the last N days before the latest observation
    std::optional<int> period_days;
};

/// @brief Check flare settings for internal consistency
absl::Status Validate(const FlareDetectorConfig& config);

/// @brief Check correlation settings for internal consistency
absl::Status Validate(const CorrelationConfig& config);

/// @brief Read "flare.*" keys over the defaults and validate
absl::StatusOr<FlareDetectorConfig> LoadFlareDetectorConfig(const Config& config);

/// @brief Read "correlation.*" keys over the defaults and validate
absl::StatusOr<CorrelationConfig> LoadCorrelationConfig(const Config& config);

}  // namespace flaresignal::analysis
