#include "analysis/serialization.h"

#include <optional>
#include <string>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace flaresignal::analysis {

namespace {

template <typename T>
nlohmann::json OptionalToJson(const std::optional<T>& value) {
    if (!value.has_value()) {
        return nullptr;
    }
    return *value;
}

nlohmann::json DateToJson(const std::optional<Date>& date) {
    if (!date.has_value()) {
        return nullptr;
    }
    return FormatDate(*date);
}

absl::StatusOr<std::optional<double>> OptionalNumber(const nlohmann::json& json,
                                                     const char* key) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::optional<double>();
    }
    if (!it->is_number()) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("Field '", key, "' must be a number"));
    }
    return std::optional<double>(it->get<double>());
}

}  // namespace

nlohmann::json ToJson(const flare::FlareAnalysis& analysis) {
    nlohmann::json burdens = nlohmann::json::array();
    for (const auto& burden : analysis.daily_burdens) {
        burdens.push_back({
            {"date", FormatDate(burden.date)},
            {"score", burden.score},
            {"max_skin_intensity", burden.max_skin_intensity},
            {"max_symptom_total", burden.max_symptom_total},
            {"observation_count", burden.observation_count},
        });
    }

    nlohmann::json episodes = nlohmann::json::array();
    for (const auto& episode : analysis.episodes) {
        episodes.push_back({
            {"start_date", FormatDate(episode.start_date)},
            {"end_date", DateToJson(episode.end_date)},
            {"peak_date", FormatDate(episode.peak_date)},
            {"duration_days", episode.duration_days},
            {"peak_score", episode.peak_score},
            {"is_active", episode.is_active},
        });
    }

    nlohmann::json states = nlohmann::json::array();
    for (const auto& state : analysis.daily_states) {
        states.push_back({
            {"date", FormatDate(state.date)},
            {"score", state.score},
            {"baseline", OptionalToJson(state.baseline)},
            {"threshold", OptionalToJson(state.threshold)},
            {"state", std::string(flare::FlareStateToString(state.state))},
            {"in_episode", state.in_episode},
        });
    }

    return {
        {"daily_burdens", burdens},
        {"baseline", OptionalToJson(analysis.baseline)},
        {"confidence", std::string(BaselineConfidenceToString(analysis.confidence))},
        {"threshold", OptionalToJson(analysis.threshold)},
        {"episodes", episodes},
        {"daily_states", states},
        {"current_state", std::string(flare::FlareStateToString(analysis.current_state))},
        {"is_active_flare", analysis.is_active_flare},
        {"current_flare_duration_days", OptionalToJson(analysis.current_flare_duration_days)},
    };
}

nlohmann::json ToJson(const correlation::CorrelationResult& result) {
    return {
        {"name", result.name},
        {"display_name", result.display_name},
        {"total_exposure_days", result.total_exposure_days},
        {"worse_days", result.worse_days},
        {"better_days", result.better_days},
        {"neutral_days", result.neutral_days},
        {"analyzable_exposures", result.analyzable_exposures},
        {"pattern", std::string(correlation::PatternToString(result.pattern))},
        {"consistency", result.consistency},
        {"confidence", std::string(correlation::ConfidenceToString(result.confidence))},
        {"ranking_score", result.ranking_score},
    };
}

nlohmann::json ToJson(const std::vector<correlation::CorrelationResult>& results) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& result : results) {
        array.push_back(ToJson(result));
    }
    return array;
}

absl::StatusOr<Observation> ObservationFromJson(const nlohmann::json& json) {
    FLARESIGNAL_CHECK_OR_RETURN(
        json.is_object(),
        MakeError(ErrorCode::kParseError, "Observation must be a JSON object"));

    Observation observation;

    if (auto it = json.find("id"); it != json.end() && !it->is_null()) {
        if (!it->is_string()) {
            return MakeError(ErrorCode::kParseError, "Field 'id' must be a string");
        }
        observation.id = it->get<std::string>();
    }

    auto timestamp = json.find("timestamp");
    if (timestamp == json.end() || !timestamp->is_string()) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("Observation '", observation.id,
                                      "' is missing a string 'timestamp'"));
    }
    FLARESIGNAL_ASSIGN_OR_RETURN(observation.timestamp,
                                 ParseTimestamp(timestamp->get<std::string>()));

    FLARESIGNAL_ASSIGN_OR_RETURN(observation.skin_intensity,
                                 OptionalNumber(json, "skin_intensity"));
    FLARESIGNAL_ASSIGN_OR_RETURN(auto skin_feeling, OptionalNumber(json, "skin_feeling"));
    if (!observation.skin_intensity.has_value() && !skin_feeling.has_value()) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("Observation '", observation.id,
                                      "' needs 'skin_intensity' or 'skin_feeling'"));
    }
    if (skin_feeling.has_value()) {
        observation.skin_feeling = *skin_feeling;
    }

    FLARESIGNAL_ASSIGN_OR_RETURN(observation.pain, OptionalNumber(json, "pain"));
    FLARESIGNAL_ASSIGN_OR_RETURN(observation.sleep_quality,
                                 OptionalNumber(json, "sleep_quality"));
    FLARESIGNAL_ASSIGN_OR_RETURN(observation.mood, OptionalNumber(json, "mood"));

    if (auto it = json.find("symptoms"); it != json.end() && !it->is_null()) {
        if (!it->is_array()) {
            return MakeError(ErrorCode::kParseError, "Field 'symptoms' must be an array");
        }
        for (const auto& entry : *it) {
            if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string() ||
                !entry.contains("severity") || !entry["severity"].is_number()) {
                return MakeError(ErrorCode::kParseError,
                                 "Symptom entries need a string 'name' and numeric 'severity'");
            }
            observation.symptoms.push_back(SymptomEntry{
                entry["name"].get<std::string>(),
                entry["severity"].get<double>(),
            });
        }
    }

    if (auto it = json.find("tags"); it != json.end() && !it->is_null()) {
        if (!it->is_array()) {
            return MakeError(ErrorCode::kParseError, "Field 'tags' must be an array");
        }
        for (const auto& tag : *it) {
            if (!tag.is_string()) {
                return MakeError(ErrorCode::kParseError, "Tags must be strings");
            }
            observation.tags.push_back(tag.get<std::string>());
        }
    }

    return observation;
}

absl::StatusOr<std::vector<Observation>> ObservationsFromJson(const nlohmann::json& json) {
    FLARESIGNAL_CHECK_OR_RETURN(
        json.is_array(),
        MakeError(ErrorCode::kParseError, "Observations must be a JSON array"));

    std::vector<Observation> observations;
    observations.reserve(json.size());
    for (size_t i = 0; i < json.size(); ++i) {
        auto observation = ObservationFromJson(json[i]);
        if (!observation.ok()) {
            return AnnotateStatus(observation.status(), absl::StrCat("Record ", i));
        }
        observations.push_back(std::move(*observation));
    }
    return observations;
}

}  // namespace flaresignal::analysis
