#include "analysis/engine_config.h"

#include <cstdint>
#include <limits>
#include <string_view>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace flaresignal::analysis {

namespace {

bool IsRatio(double value) {
    return value > 0.0 && value <= 1.0;
}

absl::StatusOr<size_t> GetCount(const Config& config, std::string_view key, size_t fallback) {
    const int64_t value = config.GetInt(key, static_cast<int64_t>(fallback));
    if (value < 0) {
        return MakeError(ErrorCode::kValidationError, absl::StrCat(absl::string_view(key.data(), key.size()), " must not be negative"));
    }
    return static_cast<size_t>(value);
}

absl::StatusOr<int> GetDays(const Config& config, std::string_view key, int fallback) {
    const int64_t value = config.GetInt(key, fallback);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return MakeError(ErrorCode::kValidationError,
                         absl::StrCat(absl::string_view(key.data(), key.size()), " is out of range: ", value));
    }
    return static_cast<int>(value);
}

}  // namespace

absl::Status Validate(const FlareDetectorConfig& config) {
    if (config.baseline_window_days <= 0) {
        return MakeError(ErrorCode::kValidationError,
                         "flare.baseline_window_days must be positive");
    }
    if (config.threshold_margin < 0.0) {
        return MakeError(ErrorCode::kValidationError,
                         "flare.threshold_margin must not be negative");
    }
    if (config.min_episode_days == 0) {
        return MakeError(ErrorCode::kValidationError,
                         "flare.min_episode_days must be positive");
    }
    if (config.provisional_min_days > config.mature_min_days) {
        return MakeError(ErrorCode::kValidationError,
                         absl::StrCat("flare.provisional_min_days (", config.provisional_min_days,
                                      ") exceeds flare.mature_min_days (",
                                      config.mature_min_days, ")"));
    }
    if (config.resolving_window_days < 0) {
        return MakeError(ErrorCode::kValidationError,
                         "flare.resolving_window_days must not be negative");
    }
    if (config.skin_intensity_max <= 0.0 || config.symptom_severity_max <= 0.0) {
        return MakeError(ErrorCode::kValidationError, "flare scale maxima must be positive");
    }
    if (config.symptom_blend_weight < 0.0 || config.symptom_blend_weight > 1.0) {
        return MakeError(ErrorCode::kValidationError,
                         "flare.symptom_blend_weight must be within [0, 1]");
    }
    return absl::OkStatus();
}

absl::Status Validate(const CorrelationConfig& config) {
    if (config.min_exposures == 0) {
        return MakeError(ErrorCode::kValidationError,
                         "correlation.min_exposures must be positive");
    }
    if (config.reaction_window_days <= 0 || config.local_baseline_window_days <= 0) {
        return MakeError(ErrorCode::kValidationError,
                         "correlation windows must be positive");
    }
    if (config.worse_delta <= 0.0) {
        return MakeError(ErrorCode::kValidationError,
                         "correlation.worse_delta must be positive");
    }
    if (config.better_delta >= 0.0) {
        return MakeError(ErrorCode::kValidationError,
                         "correlation.better_delta must be negative");
    }
    if (!IsRatio(config.dominant_ratio) || !IsRatio(config.mixed_ratio) ||
        !IsRatio(config.confidence_consistency)) {
        return MakeError(ErrorCode::kValidationError,
                         "correlation ratios must be within (0, 1]");
    }
    if (config.low_confidence_max_count > config.medium_confidence_max_count) {
        return MakeError(ErrorCode::kValidationError,
                         "correlation confidence bands overlap");
    }
    if (config.period_days.has_value() && *config.period_days <= 0) {
        return MakeError(ErrorCode::kValidationError,
                         "correlation.period_days must be positive");
    }
    return absl::OkStatus();
}

absl::StatusOr<FlareDetectorConfig> LoadFlareDetectorConfig(const Config& config) {
    FlareDetectorConfig flare;

    FLARESIGNAL_ASSIGN_OR_RETURN(
        flare.baseline_window_days,
        GetDays(config, "flare.baseline_window_days", flare.baseline_window_days));
    flare.threshold_margin = config.GetDouble("flare.threshold_margin", flare.threshold_margin);
    FLARESIGNAL_ASSIGN_OR_RETURN(
        flare.min_episode_days,
        GetCount(config, "flare.min_episode_days", flare.min_episode_days));
    FLARESIGNAL_ASSIGN_OR_RETURN(
        flare.provisional_min_days,
        GetCount(config, "flare.provisional_min_days", flare.provisional_min_days));
    FLARESIGNAL_ASSIGN_OR_RETURN(
        flare.mature_min_days,
        GetCount(config, "flare.mature_min_days", flare.mature_min_days));
    FLARESIGNAL_ASSIGN_OR_RETURN(
        flare.resolving_window_days,
        GetDays(config, "flare.resolving_window_days", flare.resolving_window_days));
    flare.skin_intensity_max = config.GetDouble("flare.skin_intensity_max",
                                                flare.skin_intensity_max);
    flare.symptom_severity_max = config.GetDouble("flare.symptom_severity_max",
                                                  flare.symptom_severity_max);
    flare.symptom_blend_weight = config.GetDouble("flare.symptom_blend_weight",
                                                  flare.symptom_blend_weight);

    FLARESIGNAL_RETURN_IF_ERROR(Validate(flare));
    return flare;
}

absl::StatusOr<CorrelationConfig> LoadCorrelationConfig(const Config& config) {
    CorrelationConfig correlation;

    FLARESIGNAL_ASSIGN_OR_RETURN(
        correlation.min_exposures,
        GetCount(config, "correlation.min_exposures", correlation.min_exposures));
    FLARESIGNAL_ASSIGN_OR_RETURN(
        correlation.reaction_window_days,
        GetDays(config, "correlation.reaction_window_days", correlation.reaction_window_days));
    FLARESIGNAL_ASSIGN_OR_RETURN(
        correlation.local_baseline_window_days,
        GetDays(config, "correlation.local_baseline_window_days",
                correlation.local_baseline_window_days));
    correlation.worse_delta = config.GetDouble("correlation.worse_delta",
                                               correlation.worse_delta);
    correlation.better_delta = config.GetDouble("correlation.better_delta",
                                                correlation.better_delta);
    correlation.dominant_ratio = config.GetDouble("correlation.dominant_ratio",
                                                  correlation.dominant_ratio);
    correlation.mixed_ratio = config.GetDouble("correlation.mixed_ratio",
                                               correlation.mixed_ratio);
    FLARESIGNAL_ASSIGN_OR_RETURN(
        correlation.low_confidence_max_count,
        GetCount(config, "correlation.low_confidence_max_count",
                 correlation.low_confidence_max_count));
    FLARESIGNAL_ASSIGN_OR_RETURN(
        correlation.medium_confidence_max_count,
        GetCount(config, "correlation.medium_confidence_max_count",
                 correlation.medium_confidence_max_count));
    correlation.confidence_consistency = config.GetDouble(
        "correlation.confidence_consistency", correlation.confidence_consistency);
    if (config.HasKey("correlation.period_days")) {
        FLARESIGNAL_ASSIGN_OR_RETURN(correlation.period_days,
                                     GetDays(config, "correlation.period_days", 0));
    }

    FLARESIGNAL_RETURN_IF_ERROR(Validate(correlation));
    return correlation;
}

}  // namespace flaresignal::analysis
