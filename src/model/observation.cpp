#include "model/observation.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/string_view.h>

#include "common/error.h"

namespace flaresignal {

namespace {

constexpr double kSkinFeelingInverse = 5.0;

// Strips ".123", "Z" and "+hh:mm"/"-hh:mm" suffixes after the seconds field.
std::string_view StripZoneAndFraction(std::string_view text) {
    const size_t time_sep = text.find('T');
    if (time_sep == std::string_view::npos) {
        return text;
    }
    const size_t suffix = text.find_first_of(".Z+-", time_sep);
    if (suffix == std::string_view::npos) {
        return text;
    }
    return text.substr(0, suffix);
}

}  // namespace

absl::StatusOr<Date> ParseDate(std::string_view text) {
    Date date;
    if (text.size() != 10 || !absl::ParseCivilTime(absl::string_view(text.data(), text.size()), &date)) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("Invalid date '", absl::string_view(text.data(), text.size()), "', expected YYYY-MM-DD"));
    }
    return date;
}

absl::StatusOr<Timestamp> ParseTimestamp(std::string_view text) {
    const std::string_view trimmed = StripZoneAndFraction(text);

    if (trimmed.size() == 10) {
        auto date = ParseDate(trimmed);
        if (!date.ok()) {
            return date.status();
        }
        return Timestamp(*date);
    }

    Timestamp second;
    if (absl::ParseCivilTime(absl::string_view(trimmed.data(), trimmed.size()), &second)) {
        return second;
    }
    absl::CivilMinute minute;
    if (absl::ParseCivilTime(absl::string_view(trimmed.data(), trimmed.size()), &minute)) {
        return Timestamp(minute);
    }
    return MakeError(ErrorCode::kParseError,
                     absl::StrCat("Invalid timestamp '", absl::string_view(text.data(), text.size()),
                                  "', expected YYYY-MM-DD[THH:MM[:SS]]"));
}

std::string FormatDate(Date date) {
    return absl::StrFormat("%04d-%02d-%02d", date.year(), date.month(), date.day());
}

std::string FormatTimestamp(Timestamp timestamp) {
    return absl::StrFormat("%04d-%02d-%02dT%02d:%02d:%02d",
                           timestamp.year(), timestamp.month(), timestamp.day(),
                           timestamp.hour(), timestamp.minute(), timestamp.second());
}

double SkinIntensity(const Observation& observation) {
    if (observation.skin_intensity.has_value()) {
        return *observation.skin_intensity;
    }
    return kSkinFeelingInverse - observation.skin_feeling;
}

const std::vector<Observation>& SelectObservationSource(
    const std::vector<Observation>& real,
    const std::vector<Observation>& demo,
    bool use_demo) {
    return use_demo ? demo : real;
}

}  // namespace flaresignal
