/**
 * @file ProviderRecords.hpp
 * @brief Records exchanged with a health-data provider.
 *
 * These mirror what the provider stores. They are never written into an
 * export directly; the extractors normalize them first.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "../TimeRange.hpp"
#include "../value_objects/ActivityKind.hpp"
#include "../value_objects/Units.hpp"
#include "../value_objects/WorkoutEventKind.hpp"

namespace healthexport::domain {

/// Provider identifier of a workout (UUID text).
using WorkoutId = std::string;

/**
 * @struct QuantityStatistics
 * @brief Aggregates the provider computed for one quantity kind over a range.
 *
 * Each aggregate is absent when the provider has nothing to report for it.
 */
struct QuantityStatistics {
    std::optional<Quantity> sum;
    std::optional<Quantity> average;
    std::optional<Quantity> maximum;
};

struct QuantitySample {
    Timestamp start;
    Timestamp end;
    Quantity quantity;
};

/**
 * @struct LocationPoint
 * @brief One raw route location. Negative accuracy or speed means "not available".
 */
struct LocationPoint {
    double latitude = 0.0;
    double longitude = 0.0;
    double altitude = 0.0;
    Timestamp timestamp;
    double horizontalAccuracy = -1.0;
    double speed = -1.0;
};

struct ProviderWorkoutEvent {
    ProviderEventType type = ProviderEventType::Marker;
    Timestamp start;
    std::optional<Timestamp> end; ///< Absent for instantaneous events.
};

struct ProviderWorkoutActivity {
    ProviderActivityType activityType = ProviderActivityType::Running;
    Timestamp start;
    std::optional<Timestamp> end;
    double duration = 0.0; ///< Seconds.
};

/**
 * @struct ProviderWorkout
 * @brief A completed workout as returned by the provider's workout query.
 */
struct ProviderWorkout {
    WorkoutId id;
    ProviderActivityType activityType = ProviderActivityType::Running;
    std::string sourceName;
    Timestamp start;
    Timestamp end;
    double duration = 0.0; ///< Seconds, as reported; may differ from end - start.
    std::vector<ProviderWorkoutEvent> events;
    std::vector<ProviderWorkoutActivity> activities;

    TimeRange range() const { return TimeRange{start, end}; }
};

/**
 * @struct RouteHandle
 * @brief Reference to the route series attached to a workout.
 */
struct RouteHandle {
    std::string routeId;
    WorkoutId workoutId;
    std::size_t pointCount = 0;
};

} // namespace healthexport::domain
