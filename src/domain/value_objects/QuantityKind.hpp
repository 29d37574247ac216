/**
 * @file QuantityKind.hpp
 * @brief Value Object naming the measurement categories read from the provider.
 */

#pragma once

#include <optional>
#include <string>

namespace healthexport::domain {

/**
 * @enum QuantityKind
 * @brief The fixed set of quantity kinds the export reads.
 */
enum class QuantityKind {
    ActiveEnergyBurned,
    DistanceWalkingRunning,
    StepCount,
    HeartRate,
    RunningSpeed,
    RunningPower
};

/**
 * @enum AggregationStyle
 * @brief Cumulative kinds are summed over a range, discrete kinds are averaged.
 */
enum class AggregationStyle {
    Cumulative,
    Discrete
};

inline AggregationStyle AggregationStyleFor(QuantityKind kind) {
    switch (kind) {
        case QuantityKind::ActiveEnergyBurned:
        case QuantityKind::DistanceWalkingRunning:
        case QuantityKind::StepCount:
            return AggregationStyle::Cumulative;
        case QuantityKind::HeartRate:
        case QuantityKind::RunningSpeed:
        case QuantityKind::RunningPower:
            return AggregationStyle::Discrete;
    }
    return AggregationStyle::Discrete;
}

inline std::string QuantityKindToString(QuantityKind kind) {
    switch (kind) {
        case QuantityKind::ActiveEnergyBurned: return "activeEnergyBurned";
        case QuantityKind::DistanceWalkingRunning: return "distanceWalkingRunning";
        case QuantityKind::StepCount: return "stepCount";
        case QuantityKind::HeartRate: return "heartRate";
        case QuantityKind::RunningSpeed: return "runningSpeed";
        case QuantityKind::RunningPower: return "runningPower";
        default: return "unknown";
    }
}

inline std::optional<QuantityKind> QuantityKindFromString(const std::string& name) {
    if (name == "activeEnergyBurned") return QuantityKind::ActiveEnergyBurned;
    if (name == "distanceWalkingRunning") return QuantityKind::DistanceWalkingRunning;
    if (name == "stepCount") return QuantityKind::StepCount;
    if (name == "heartRate") return QuantityKind::HeartRate;
    if (name == "runningSpeed") return QuantityKind::RunningSpeed;
    if (name == "runningPower") return QuantityKind::RunningPower;
    return std::nullopt;
}

} // namespace healthexport::domain
