#pragma once

/// @file daily_aggregator.h
/// @brief Collapses same-day observations into one daily severity score

#include <cstddef>
#include <map>
#include <vector>

#include "analysis/engine_config.h"
#include "model/observation.h"

namespace flaresignal::analysis {

/// @brief Aggregate severity for one calendar date
struct DailyBurden {
    Date date;

    /// Mean per-observation severity on the 0-3 symptom scale
    double score = 0.0;

    /// Highest skin intensity (0-5) seen that date, for display
    double max_skin_intensity = 0.0;

    /// Highest per-observation sum of symptom severities, for display
    double max_symptom_total = 0.0;

    size_t observation_count = 0;
};

/// @brief Date-indexed scalar series
using DailySeries = std::map<Date, double>;

/// @brief Severity of a single observation on the 0-3 scale
///
/// Without symptoms this is the skin intensity rescaled from 0-5 onto 0-3.
/// With symptoms it blends the mean symptom severity with that rescaled
/// skin intensity, weighted by config.symptom_blend_weight.
double ObservationSeverity(const Observation& observation,
                           const FlareDetectorConfig& config = {});

/// @brief Group observations by date and average their severities
///
/// Same-day severities are summed in ascending value order, so any
/// permutation of the input gives bit-identical scores. Returns one entry
/// per distinct date, in ascending date order.
std::vector<DailyBurden> AggregateDailyBurdens(const std::vector<Observation>& observations,
                                               const FlareDetectorConfig& config = {});

/// @brief Mean raw skin intensity (0-5) per date, independent of input order
DailySeries BuildDailyIntensity(const std::vector<Observation>& observations);

}  // namespace flaresignal::analysis
