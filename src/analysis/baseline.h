#pragma once

/// @file baseline.h
/// @brief Baseline estimation and data-volume confidence gating

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "analysis/daily_aggregator.h"
#include "analysis/engine_config.h"

namespace flaresignal::analysis {

/// @brief Trust level derived from how much history exists
enum class BaselineConfidence {
    kEarly,        ///< Too little data; no flare conclusions
    kProvisional,  ///< Enough for thresholds, still thin
    kMature        ///< Full history window available
};

/// @brief "early", "provisional" or "mature"
std::string_view BaselineConfidenceToString(BaselineConfidence confidence);

/// @brief Confidence tier for a number of daily-burden entries
BaselineConfidence ConfidenceForDayCount(size_t day_count,
                                         const FlareDetectorConfig& config = {});

/// @brief Mean score over the window_days calendar days before burdens[index]
///
/// Only burdens dated in [date - window_days, date - 1] contribute; missing
/// dates are skipped rather than counted as zero. burdens[index] itself and
/// everything after it are never read. Returns std::nullopt when no prior
/// day falls inside the window.
///
/// @param burdens Daily burdens in ascending date order
/// @param index Position of the day being evaluated
/// @param window_days Trailing window length in calendar days
std::optional<double> TrailingBaseline(const std::vector<DailyBurden>& burdens,
                                       size_t index,
                                       int window_days);

/// @brief Mean of the series over [center - window_days, center + window_days]
///
/// The center date is always excluded, as is any date for which
/// is_excluded returns true. Returns std::nullopt if nothing remains.
std::optional<double> LocalBaseline(const DailySeries& series,
                                    Date center,
                                    int window_days,
                                    const std::function<bool(Date)>& is_excluded);

/// @brief Mean of the series values dated within [first, last]
std::optional<double> MeanOverDays(const DailySeries& series, Date first, Date last);

}  // namespace flaresignal::analysis
