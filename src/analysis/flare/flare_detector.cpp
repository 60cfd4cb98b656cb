/// @file flare_detector.cpp
/// @brief Flare episode detection implementation

#include "analysis/flare/flare_detector.h"

#include <algorithm>
#include <utility>

#include "common/logging.h"

namespace flaresignal::flare {

namespace {

bool IsElevated(const analysis::DailyBurden& burden, const DayThreshold& threshold) {
    return threshold.threshold.has_value() && burden.score >= *threshold.threshold;
}

bool FollowsDirectly(const std::vector<analysis::DailyBurden>& burdens, size_t index) {
    return index > 0 && burdens[index].date == burdens[index - 1].date + 1;
}

// Open run of elevated days while scanning.
struct Run {
    size_t start = 0;
    size_t length = 0;
    size_t peak = 0;
};

FlareEpisode MakeEpisode(const std::vector<analysis::DailyBurden>& burdens,
                         const Run& run,
                         bool open) {
    FlareEpisode episode;
    episode.start_date = burdens[run.start].date;
    if (!open) {
        episode.end_date = burdens[run.start + run.length - 1].date;
    }
    episode.peak_date = burdens[run.peak].date;
    episode.peak_score = burdens[run.peak].score;
    episode.duration_days = run.length;
    episode.is_active = open;
    return episode;
}

}  // namespace

std::string_view FlareStateToString(FlareState state) {
    switch (state) {
        case FlareState::kStable:
            return "stable";
        case FlareState::kPreFlare:
            return "pre_flare";
        case FlareState::kActiveFlare:
            return "active_flare";
        case FlareState::kPeakFlare:
            return "peak_flare";
        case FlareState::kResolving:
            return "resolving_flare";
    }
    return "stable";
}

std::string_view FlareStateLabel(FlareState state) {
    switch (state) {
        case FlareState::kStable:
            return "Stable";
        case FlareState::kPreFlare:
            return "Pre-flare";
        case FlareState::kActiveFlare:
            return "Active flare";
        case FlareState::kPeakFlare:
            return "Peak flare";
        case FlareState::kResolving:
            return "Resolving";
    }
    return "Stable";
}

std::vector<DayThreshold> ComputeDayThresholds(
    const std::vector<analysis::DailyBurden>& burdens,
    const analysis::FlareDetectorConfig& config) {
    std::vector<DayThreshold> thresholds(burdens.size());

    for (size_t i = 0; i < burdens.size(); ++i) {
        thresholds[i].baseline =
            analysis::TrailingBaseline(burdens, i, config.baseline_window_days);

        const bool gated =
            analysis::ConfidenceForDayCount(i + 1, config) == analysis::BaselineConfidence::kEarly;
        if (!gated && thresholds[i].baseline.has_value()) {
            thresholds[i].threshold = *thresholds[i].baseline + config.threshold_margin;
        }
    }
    return thresholds;
}

std::vector<FlareEpisode> DetectEpisodes(const std::vector<analysis::DailyBurden>& burdens,
                                         const std::vector<DayThreshold>& thresholds,
                                         const analysis::FlareDetectorConfig& config) {
    std::vector<FlareEpisode> episodes;
    std::optional<Run> run;

    auto close_run = [&]() {
        if (run.has_value() && run->length >= config.min_episode_days) {
            episodes.push_back(MakeEpisode(burdens, *run, false));
            FLARESIGNAL_LOG_TRACE("Closed flare episode {} .. {} ({} days)",
                                  FormatDate(episodes.back().start_date),
                                  FormatDate(*episodes.back().end_date), run->length);
        }
        run.reset();
    };

    const size_t count = std::min(burdens.size(), thresholds.size());
    for (size_t i = 0; i < count; ++i) {
        if (!IsElevated(burdens[i], thresholds[i])) {
            close_run();
            continue;
        }

        if (run.has_value() && !FollowsDirectly(burdens, i)) {
            close_run();
        }

        if (!run.has_value()) {
            run = Run{i, 1, i};
            continue;
        }

        ++run->length;
        if (burdens[i].score > burdens[run->peak].score) {
            run->peak = i;
        }
    }

    if (run.has_value() && run->length >= config.min_episode_days) {
        episodes.push_back(MakeEpisode(burdens, *run, true));
        FLARESIGNAL_LOG_TRACE("Open flare episode since {} ({} days)",
                              FormatDate(episodes.back().start_date), run->length);
    }
    return episodes;
}

std::vector<DailyFlareState> ClassifyDays(const std::vector<analysis::DailyBurden>& burdens,
                                          const std::vector<DayThreshold>& thresholds,
                                          const std::vector<FlareEpisode>& episodes,
                                          const analysis::FlareDetectorConfig& config) {
    std::vector<DailyFlareState> states;
    states.reserve(burdens.size());

    // Episodes are consecutive-date runs, so a date range identifies members.
    auto episode_for = [&episodes, &burdens](Date date) -> const FlareEpisode* {
        for (const auto& episode : episodes) {
            const Date last = episode.end_date.value_or(burdens.back().date);
            if (episode.start_date <= date && date <= last) {
                return &episode;
            }
        }
        return nullptr;
    };

    auto recently_ended = [&episodes, &config](Date date) {
        for (const auto& episode : episodes) {
            if (!episode.end_date.has_value()) {
                continue;
            }
            const auto days_since_end = date - *episode.end_date;
            if (days_since_end >= 1 && days_since_end <= config.resolving_window_days) {
                return true;
            }
        }
        return false;
    };

    for (size_t i = 0; i < burdens.size(); ++i) {
        const analysis::DailyBurden& burden = burdens[i];
        const DayThreshold threshold = i < thresholds.size() ? thresholds[i] : DayThreshold{};

        DailyFlareState state;
        state.date = burden.date;
        state.score = burden.score;
        state.baseline = threshold.baseline;
        state.threshold = threshold.threshold;

        const auto tier = analysis::ConfidenceForDayCount(i + 1, config);
        if (tier == analysis::BaselineConfidence::kEarly) {
            states.push_back(state);
            continue;
        }

        if (const FlareEpisode* episode = episode_for(burden.date)) {
            state.in_episode = true;
            state.state = episode->peak_date == burden.date ? FlareState::kPeakFlare
                                                            : FlareState::kActiveFlare;
            states.push_back(state);
            continue;
        }

        const bool has_prior = i > 0;
        if (has_prior && IsElevated(burden, threshold) &&
            burden.score > burdens[i - 1].score) {
            state.state = FlareState::kPreFlare;
        } else if (has_prior && burden.score < burdens[i - 1].score &&
                   recently_ended(burden.date)) {
            state.state = FlareState::kResolving;
        }
        states.push_back(state);
    }
    return states;
}

FlareDetector::FlareDetector(analysis::FlareDetectorConfig config)
    : config_(std::move(config)) {}

FlareAnalysis FlareDetector::Analyze(const std::vector<Observation>& observations) const {
    return AnalyzeBurdens(analysis::AggregateDailyBurdens(observations, config_));
}

FlareAnalysis FlareDetector::AnalyzeBurdens(std::vector<analysis::DailyBurden> burdens) const {
    std::stable_sort(burdens.begin(), burdens.end(),
        [](const analysis::DailyBurden& a, const analysis::DailyBurden& b) {
            return a.date < b.date;
        });

    FlareAnalysis result;
    result.confidence = analysis::ConfidenceForDayCount(burdens.size(), config_);

    if (burdens.empty()) {
        return result;
    }

    const auto thresholds = ComputeDayThresholds(burdens, config_);
    result.episodes = DetectEpisodes(burdens, thresholds, config_);
    result.daily_states = ClassifyDays(burdens, thresholds, result.episodes, config_);

    result.baseline = thresholds.back().baseline;
    result.threshold = thresholds.back().threshold;
    result.current_state = result.daily_states.back().state;

    for (const auto& episode : result.episodes) {
        if (episode.is_active) {
            result.is_active_flare = true;
            result.current_flare_duration_days = episode.duration_days;
        }
    }

    result.daily_burdens = std::move(burdens);

    FLARESIGNAL_LOG_DEBUG("Flare analysis: {} days, confidence={}, episodes={}, current={}",
                          result.daily_burdens.size(),
                          analysis::BaselineConfidenceToString(result.confidence),
                          result.episodes.size(),
                          FlareStateToString(result.current_state));
    return result;
}

}  // namespace flaresignal::flare
