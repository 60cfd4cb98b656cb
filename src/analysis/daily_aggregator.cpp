#include "analysis/daily_aggregator.h"

#include <algorithm>
#include <utility>
#include <vector>

#include "common/logging.h"

namespace flaresignal::analysis {

namespace {

struct DayAccumulator {
    std::vector<double> severities;
    double max_skin_intensity = 0.0;
    double max_symptom_total = 0.0;
};

double Clamp(double value, double max_value) {
    return std::clamp(value, 0.0, max_value);
}

// Sums in ascending order: the same multiset of values always yields the same mean.
double OrderedMean(std::vector<double>& values) {
    std::sort(values.begin(), values.end());
    double total = 0.0;
    for (double value : values) {
        total += value;
    }
    return total / static_cast<double>(values.size());
}

}  // namespace

double ObservationSeverity(const Observation& observation, const FlareDetectorConfig& config) {
    const double skin = Clamp(SkinIntensity(observation), config.skin_intensity_max);
    const double normalized_skin =
        skin * config.symptom_severity_max / config.skin_intensity_max;

    if (observation.symptoms.empty()) {
        return normalized_skin;
    }

    double total = 0.0;
    for (const auto& symptom : observation.symptoms) {
        total += Clamp(symptom.severity, config.symptom_severity_max);
    }
    const double symptom_mean = total / static_cast<double>(observation.symptoms.size());

    return config.symptom_blend_weight * symptom_mean +
           (1.0 - config.symptom_blend_weight) * normalized_skin;
}

std::vector<DailyBurden> AggregateDailyBurdens(const std::vector<Observation>& observations,
                                               const FlareDetectorConfig& config) {
    std::map<Date, DayAccumulator> by_date;

    for (const auto& observation : observations) {
        auto& day = by_date[ObservationDate(observation)];
        day.severities.push_back(ObservationSeverity(observation, config));
        day.max_skin_intensity = std::max(
            day.max_skin_intensity, Clamp(SkinIntensity(observation), config.skin_intensity_max));

        double symptom_total = 0.0;
        for (const auto& symptom : observation.symptoms) {
            symptom_total += Clamp(symptom.severity, config.symptom_severity_max);
        }
        day.max_symptom_total = std::max(day.max_symptom_total, symptom_total);
    }

    std::vector<DailyBurden> burdens;
    burdens.reserve(by_date.size());
    for (auto& [date, day] : by_date) {
        DailyBurden burden;
        burden.date = date;
        burden.observation_count = day.severities.size();
        burden.score = OrderedMean(day.severities);
        burden.max_skin_intensity = day.max_skin_intensity;
        burden.max_symptom_total = day.max_symptom_total;
        burdens.push_back(burden);
    }

    FLARESIGNAL_LOG_TRACE("Aggregated {} observations into {} daily burdens",
                          observations.size(), burdens.size());
    return burdens;
}

DailySeries BuildDailyIntensity(const std::vector<Observation>& observations) {
    std::map<Date, std::vector<double>> by_date;
    for (const auto& observation : observations) {
        by_date[ObservationDate(observation)].push_back(SkinIntensity(observation));
    }

    DailySeries series;
    for (auto& [date, values] : by_date) {
        series.emplace(date, OrderedMean(values));
    }
    return series;
}

}  // namespace flaresignal::analysis
