#include "analysis/baseline.h"

namespace flaresignal::analysis {

std::string_view BaselineConfidenceToString(BaselineConfidence confidence) {
    switch (confidence) {
        case BaselineConfidence::kEarly:
            return "early";
        case BaselineConfidence::kProvisional:
            return "provisional";
        case BaselineConfidence::kMature:
            return "mature";
    }
    return "early";
}

BaselineConfidence ConfidenceForDayCount(size_t day_count, const FlareDetectorConfig& config) {
    if (day_count < config.provisional_min_days) {
        return BaselineConfidence::kEarly;
    }
    if (day_count < config.mature_min_days) {
        return BaselineConfidence::kProvisional;
    }
    return BaselineConfidence::kMature;
}

std::optional<double> TrailingBaseline(const std::vector<DailyBurden>& burdens,
                                       size_t index,
                                       int window_days) {
    if (index == 0 || index >= burdens.size() || window_days <= 0) {
        return std::nullopt;
    }

    const Date window_start = burdens[index].date - window_days;
    double total = 0.0;
    size_t count = 0;

    for (size_t i = index; i-- > 0;) {
        if (burdens[i].date < window_start) {
            break;
        }
        total += burdens[i].score;
        ++count;
    }

    if (count == 0) {
        return std::nullopt;
    }
    return total / static_cast<double>(count);
}

std::optional<double> LocalBaseline(const DailySeries& series,
                                    Date center,
                                    int window_days,
                                    const std::function<bool(Date)>& is_excluded) {
    if (window_days < 0) {
        return std::nullopt;
    }

    double total = 0.0;
    size_t count = 0;

    auto it = series.lower_bound(center - window_days);
    const auto end = series.upper_bound(center + window_days);
    for (; it != end; ++it) {
        if (it->first == center || (is_excluded && is_excluded(it->first))) {
            continue;
        }
        total += it->second;
        ++count;
    }

    if (count == 0) {
        return std::nullopt;
    }
    return total / static_cast<double>(count);
}

std::optional<double> MeanOverDays(const DailySeries& series, Date first, Date last) {
    if (last < first) {
        return std::nullopt;
    }

    double total = 0.0;
    size_t count = 0;

    const auto end = series.upper_bound(last);
    for (auto it = series.lower_bound(first); it != end; ++it) {
        total += it->second;
        ++count;
    }

    if (count == 0) {
        return std::nullopt;
    }
    return total / static_cast<double>(count);
}

}  // namespace flaresignal::analysis
