/**
 * @file StatisticsExtractor.cpp
 * @brief Implementation of StatisticsExtractor.
 */

#include "application/StatisticsExtractor.hpp"

namespace healthexport::application {

using namespace healthexport::domain;

namespace {

std::optional<StatValue> ToStatValue(const std::optional<Quantity>& quantity,
                                     ProviderUnit target,
                                     const char* label) {
    if (!quantity) {
        return std::nullopt;
    }
    return StatValue{ConvertQuantity(*quantity, target), label};
}

} // namespace

WorkoutStatistics StatisticsExtractor::extract(HealthDataProvider& provider, const TimeRange& range) {
    WorkoutStatistics stats;

    if (auto energy = provider.queryStatistics(QuantityKind::ActiveEnergyBurned, range)) {
        stats.activeEnergyBurned = ToStatValue(energy->sum, ProviderUnit::Kilocalorie, unit_labels::kKilocalories);
    }

    if (auto distance = provider.queryStatistics(QuantityKind::DistanceWalkingRunning, range)) {
        stats.distance = ToStatValue(distance->sum, ProviderUnit::Kilometer, unit_labels::kKilometers);
    }

    if (auto steps = provider.queryStatistics(QuantityKind::StepCount, range)) {
        stats.stepCount = ToStatValue(steps->sum, ProviderUnit::Count, unit_labels::kSteps);
    }

    if (auto heartRate = provider.queryStatistics(QuantityKind::HeartRate, range)) {
        stats.averageHeartRate = ToStatValue(heartRate->average, ProviderUnit::CountPerMinute, unit_labels::kBeatsPerMinute);
        stats.maxHeartRate = ToStatValue(heartRate->maximum, ProviderUnit::CountPerMinute, unit_labels::kBeatsPerMinute);
    }

    if (auto speed = provider.queryStatistics(QuantityKind::RunningSpeed, range)) {
        stats.averageSpeed = ToStatValue(speed->average, ProviderUnit::MeterPerSecond, unit_labels::kMetersPerSecond);
    }

    if (auto power = provider.queryStatistics(QuantityKind::RunningPower, range)) {
        stats.averagePower = ToStatValue(power->average, ProviderUnit::Watt, unit_labels::kWatts);
    }

    return stats;
}

} // namespace healthexport::application
