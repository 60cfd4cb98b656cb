#pragma once

/// @file serialization.h
/// @brief JSON conversion at the engine boundary
///
/// Observations arrive from the caller as JSON records; analysis results
/// leave as JSON for downstream consumers (badges, exports). Keys are
/// snake_case, dates are ISO "YYYY-MM-DD" and absent optionals are null.

#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "analysis/correlation/correlation_analyzer.h"
#include "analysis/flare/flare_detector.h"
#include "model/observation.h"

namespace flaresignal::analysis {

nlohmann::json ToJson(const flare::FlareAnalysis& analysis);
nlohmann::json ToJson(const correlation::CorrelationResult& result);
nlohmann::json ToJson(const std::vector<correlation::CorrelationResult>& results);

/// @brief Parse one observation record
///
/// Required: "timestamp" and one of "skin_intensity" / "skin_feeling".
/// Optional: "id", "symptoms" ([{"name", "severity"}]), "pain",
/// "sleep_quality", "mood", "tags".
absl::StatusOr<Observation> ObservationFromJson(const nlohmann::json& json);

/// @brief Parse an array of observation records, failing on the first bad one
absl::StatusOr<std::vector<Observation>> ObservationsFromJson(const nlohmann::json& json);

}  // namespace flaresignal::analysis
