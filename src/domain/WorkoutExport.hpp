/**
 * @file WorkoutExport.hpp
 * @brief The versioned export document and its nested records.
 *
 * Every record is a plain value assembled once per export request. Optional
 * fields stay optional all the way to the serialized document: absent means
 * the provider had no data, which is not the same as zero.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "TimeRange.hpp"
#include "value_objects/ActivityKind.hpp"
#include "value_objects/WorkoutEventKind.hpp"

namespace healthexport::domain {

/// Schema version of WorkoutExport. Bump on any field added, removed or retyped.
inline constexpr const char* kExportVersion = "1.0";

/// Provider-side cap on heart-rate samples per export.
inline constexpr std::size_t kMaxHeartRateSamples = 5000;

/**
 * @struct StatValue
 * @brief A statistic already converted to the unit named by @c unit.
 */
struct StatValue {
    double value = 0.0;
    std::string unit;
};

struct WorkoutStatistics {
    std::optional<StatValue> activeEnergyBurned;
    std::optional<StatValue> distance;
    std::optional<StatValue> stepCount;
    std::optional<StatValue> averageHeartRate;
    std::optional<StatValue> maxHeartRate;
    std::optional<StatValue> averageSpeed;
    std::optional<StatValue> averagePower;
};

struct HeartRateSample {
    Timestamp date;
    double bpm = 0.0;
};

struct RoutePoint {
    double latitude = 0.0;
    double longitude = 0.0;
    double altitude = 0.0; ///< Meters.
    Timestamp timestamp;
    std::optional<double> horizontalAccuracy;
    std::optional<double> speed;
};

struct WorkoutEventData {
    WorkoutEventKind type = WorkoutEventKind::Unknown;
    Timestamp startDate;
    std::optional<Timestamp> endDate;
};

struct ActivityData {
    ActivityKind type = ActivityKind::Other;
    Timestamp startDate;
    Timestamp endDate;
    double duration = 0.0;
    WorkoutStatistics statistics; ///< Scoped to this activity's time range.
};

struct WorkoutData {
    ActivityKind type = ActivityKind::Other;
    std::string sourceApp;
    Timestamp startDate;
    Timestamp endDate;
    double duration = 0.0; ///< Provider-reported seconds, not recomputed.
    WorkoutStatistics statistics;
    std::vector<HeartRateSample> heartRateSamples;
    std::vector<RoutePoint> route;
    std::vector<WorkoutEventData> events;
    std::vector<ActivityData> activities;
};

/**
 * @struct WorkoutExport
 * @brief Root of the export document.
 */
struct WorkoutExport {
    std::string exportVersion = kExportVersion;
    Timestamp exportDate; ///< Generation time, not workout time.
    WorkoutData workout;
};

inline bool operator==(const StatValue& a, const StatValue& b) {
    return a.value == b.value && a.unit == b.unit;
}
inline bool operator!=(const StatValue& a, const StatValue& b) { return !(a == b); }

inline bool operator==(const WorkoutStatistics& a, const WorkoutStatistics& b) {
    return a.activeEnergyBurned == b.activeEnergyBurned &&
           a.distance == b.distance &&
           a.stepCount == b.stepCount &&
           a.averageHeartRate == b.averageHeartRate &&
           a.maxHeartRate == b.maxHeartRate &&
           a.averageSpeed == b.averageSpeed &&
           a.averagePower == b.averagePower;
}
inline bool operator!=(const WorkoutStatistics& a, const WorkoutStatistics& b) { return !(a == b); }

inline bool operator==(const HeartRateSample& a, const HeartRateSample& b) {
    return a.date == b.date && a.bpm == b.bpm;
}

inline bool operator==(const RoutePoint& a, const RoutePoint& b) {
    return a.latitude == b.latitude && a.longitude == b.longitude &&
           a.altitude == b.altitude && a.timestamp == b.timestamp &&
           a.horizontalAccuracy == b.horizontalAccuracy && a.speed == b.speed;
}

inline bool operator==(const WorkoutEventData& a, const WorkoutEventData& b) {
    return a.type == b.type && a.startDate == b.startDate && a.endDate == b.endDate;
}

inline bool operator==(const ActivityData& a, const ActivityData& b) {
    return a.type == b.type && a.startDate == b.startDate && a.endDate == b.endDate &&
           a.duration == b.duration && a.statistics == b.statistics;
}

inline bool operator==(const WorkoutData& a, const WorkoutData& b) {
    return a.type == b.type && a.sourceApp == b.sourceApp &&
           a.startDate == b.startDate && a.endDate == b.endDate &&
           a.duration == b.duration && a.statistics == b.statistics &&
           a.heartRateSamples == b.heartRateSamples && a.route == b.route &&
           a.events == b.events && a.activities == b.activities;
}

inline bool operator==(const WorkoutExport& a, const WorkoutExport& b) {
    return a.exportVersion == b.exportVersion && a.exportDate == b.exportDate &&
           a.workout == b.workout;
}
inline bool operator!=(const WorkoutExport& a, const WorkoutExport& b) { return !(a == b); }

} // namespace healthexport::domain
