#pragma once

/// @file flare_detector.h
/// @brief Flare episode detection and per-day flare state classification
///
/// Turns a day-level severity series into flare episodes and a state label
/// for every logged day. Each day is compared with its own trailing
/// baseline, so the threshold moves with the user's recent history instead
/// of being one global value.

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "analysis/baseline.h"
#include "analysis/daily_aggregator.h"
#include "analysis/engine_config.h"
#include "model/observation.h"

namespace flaresignal::flare {

/// @brief Flare state of a single day
enum class FlareState {
    kStable,       ///< Nothing notable, or not enough data to say
    kPreFlare,     ///< Elevated and rising, but not yet a full episode
    kActiveFlare,  ///< Inside a flare episode
    kPeakFlare,    ///< The worst day of its episode
    kResolving     ///< Shortly after an episode, falling
};

/// @brief Machine name: "stable", "pre_flare", "active_flare", "peak_flare", "resolving_flare"
std::string_view FlareStateToString(FlareState state);

/// @brief Display label: "Stable", "Pre-flare", "Active flare", "Peak flare", "Resolving"
std::string_view FlareStateLabel(FlareState state);

/// @brief A run of consecutive elevated days
struct FlareEpisode {
    Date start_date;

    /// Last elevated day; std::nullopt while the run reaches the latest date
    std::optional<Date> end_date;

    Date peak_date;
    size_t duration_days = 0;
    double peak_score = 0.0;
    bool is_active = false;
};

/// @brief Baseline and threshold in force for one day
struct DayThreshold {
    std::optional<double> baseline;

    /// Absent while the day is confidence-gated or has no baseline
    std::optional<double> threshold;
};

/// @brief Classification of one logged day
struct DailyFlareState {
    Date date;
    double score = 0.0;
    std::optional<double> baseline;
    std::optional<double> threshold;
    FlareState state = FlareState::kStable;
    bool in_episode = false;
};

/// @brief Complete flare analysis of a history
struct FlareAnalysis {
    std::vector<analysis::DailyBurden> daily_burdens;

    /// Baseline and threshold of the most recent day
    std::optional<double> baseline;
    analysis::BaselineConfidence confidence = analysis::BaselineConfidence::kEarly;
    std::optional<double> threshold;

    std::vector<FlareEpisode> episodes;
    std::vector<DailyFlareState> daily_states;

    FlareState current_state = FlareState::kStable;
    bool is_active_flare = false;
    std::optional<size_t> current_flare_duration_days;
};

/// @brief Per-day baselines and thresholds
///
/// A day whose accumulated entry count (itself included) is still in the
/// early tier gets no threshold.
std::vector<DayThreshold> ComputeDayThresholds(
    const std::vector<analysis::DailyBurden>& burdens,
    const analysis::FlareDetectorConfig& config = {});

/// @brief Find runs of at least config.min_episode_days consecutive elevated days
///
/// A day is elevated when it has a threshold and score >= threshold.
/// Consecutive means adjacent calendar dates; a missing date ends the run.
/// The peak is the highest score in the run, earliest date on ties.
std::vector<FlareEpisode> DetectEpisodes(const std::vector<analysis::DailyBurden>& burdens,
                                         const std::vector<DayThreshold>& thresholds,
                                         const analysis::FlareDetectorConfig& config = {});

/// @brief Label every day given its threshold and the detected episodes
std::vector<DailyFlareState> ClassifyDays(const std::vector<analysis::DailyBurden>& burdens,
                                          const std::vector<DayThreshold>& thresholds,
                                          const std::vector<FlareEpisode>& episodes,
                                          const analysis::FlareDetectorConfig& config = {});

/// @brief Flare detection over an observation history
///
/// Stateless apart from its configuration: every call recomputes the full
/// analysis from the supplied history, so one detector may be shared across
/// threads.
///
/// Example:
/// @code
///   FlareDetector detector;
///   FlareAnalysis analysis = detector.Analyze(observations);
///   if (analysis.is_active_flare) {
///       ShowBadge(FlareStateLabel(analysis.current_state),
///                 *analysis.current_flare_duration_days);
///   }
/// @endcode
class FlareDetector {
public:
    explicit FlareDetector(analysis::FlareDetectorConfig config = {});

    /// @brief Analyze raw observations in any order
    FlareAnalysis Analyze(const std::vector<Observation>& observations) const;

    /// @brief Analyze an already aggregated series
    /// @param burdens Daily burdens, one per date; sorted internally
    FlareAnalysis AnalyzeBurdens(std::vector<analysis::DailyBurden> burdens) const;

    const analysis::FlareDetectorConfig& GetConfig() const { return config_; }

private:
    analysis::FlareDetectorConfig config_;
};

}  // namespace flaresignal::flare
