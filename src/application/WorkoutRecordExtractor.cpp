/**
 * @file WorkoutRecordExtractor.cpp
 * @brief Implementation of WorkoutRecordExtractor.
 */

#include "application/WorkoutRecordExtractor.hpp"
#include "application/StatisticsExtractor.hpp"

namespace healthexport::application {

using namespace healthexport::domain;

std::vector<WorkoutEventData> WorkoutRecordExtractor::extractEvents(const ProviderWorkout& workout) {
    std::vector<WorkoutEventData> events;
    events.reserve(workout.events.size());
    for (const auto& event : workout.events) {
        events.push_back(WorkoutEventData{
            WorkoutEventKindFromProvider(event.type),
            event.start,
            event.end
        });
    }
    return events;
}

std::vector<ActivityData> WorkoutRecordExtractor::extractActivities(HealthDataProvider& provider,
                                                                    const ProviderWorkout& workout) {
    std::vector<ActivityData> activities;
    activities.reserve(workout.activities.size());
    for (const auto& activity : workout.activities) {
        ActivityData data;
        data.type = ActivityKindFromProvider(activity.activityType);
        data.startDate = activity.start;
        data.endDate = resolveEndDate(activity);
        data.duration = activity.duration;
        data.statistics = StatisticsExtractor::extract(provider, TimeRange{data.startDate, data.endDate});
        activities.push_back(std::move(data));
    }
    return activities;
}

Timestamp WorkoutRecordExtractor::resolveEndDate(const ProviderWorkoutActivity& activity) {
    // Fallback only: a reported end date is taken as is, even if it disagrees with the duration.
    if (activity.end) {
        return *activity.end;
    }
    return AddSeconds(activity.start, activity.duration);
}

} // namespace healthexport::application
