#pragma once

/// @file observation.h
/// @brief Self-reported health observation records and calendar dates
///
/// All dates and timestamps are timezone-naive local calendar values.
/// Day arithmetic goes through absl::CivilDay so that no daylight-saving
/// or timezone conversion can shift a record onto another date.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/time/civil_time.h>

namespace flaresignal {

/// @brief Local calendar date
using Date = absl::CivilDay;

/// @brief Local wall-clock timestamp (no zone)
using Timestamp = absl::CivilSecond;

/// @brief Parse an ISO "YYYY-MM-DD" date
absl::StatusOr<Date> ParseDate(std::string_view text);

/// @brief Parse "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM[:SS]"
///
/// A trailing fractional-seconds part and zone designator ("Z", "+02:00")
/// are accepted and ignored: the wall-clock fields are kept as written.
absl::StatusOr<Timestamp> ParseTimestamp(std::string_view text);

/// @brief Format a date as "YYYY-MM-DD"
std::string FormatDate(Date date);

/// @brief Format a timestamp as "YYYY-MM-DDTHH:MM:SS"
std::string FormatTimestamp(Timestamp timestamp);

/// @brief A single symptom reported in an observation
struct SymptomEntry {
    std::string name;
    double severity = 0.0;  ///< 0 (none) - 3 (severe)
};

/// @brief One check-in as supplied by the caller
struct Observation {
    std::string id;
    Timestamp timestamp;

    std::vector<SymptomEntry> symptoms;

    /// Skin condition, 0 (clear) - 5 (worst)
    std::optional<double> skin_intensity;

    /// Inverse scale, 1 (bad) - 5 (good); used when skin_intensity is absent
    double skin_feeling = 5.0;

    std::optional<double> pain;           ///< 0 - 10
    std::optional<double> sleep_quality;  ///< 1 - 5
    std::optional<double> mood;           ///< 1 - 5

    /// Free-text tags, optionally category-prefixed ("food:milk", "product:cream")
    std::vector<std::string> tags;
};

/// @brief Calendar date an observation belongs to
inline Date ObservationDate(const Observation& observation) {
    return Date(observation.timestamp);
}

/// @brief Skin intensity on the 0-5 scale: skin_intensity, else 5 - skin_feeling
double SkinIntensity(const Observation& observation);

/// @brief Choose which observation list feeds the engine
///
/// The demo list replaces the real one wholesale when use_demo is set;
/// records are never mixed.
const std::vector<Observation>& SelectObservationSource(
    const std::vector<Observation>& real,
    const std::vector<Observation>& demo,
    bool use_demo);

}  // namespace flaresignal
