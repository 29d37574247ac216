/**
 * @file WorkoutRecordExtractor.hpp
 * @brief Normalizes provider events and sub-activities into export records.
 */

#pragma once

#include <vector>
#include "domain/WorkoutExport.hpp"
#include "domain/provider/HealthDataProvider.hpp"

namespace healthexport::application {

class WorkoutRecordExtractor {
public:
    /** @brief Maps events in provider order. Unmapped event kinds become "unknown". */
    static std::vector<domain::WorkoutEventData> extractEvents(const domain::ProviderWorkout& workout);

    /**
     * @brief Maps sub-activities in provider order, each with statistics scoped
     * to its own range. A missing end date falls back to start + duration.
     * @throws domain::ProviderError if a statistics query fails.
     */
    static std::vector<domain::ActivityData> extractActivities(domain::HealthDataProvider& provider,
                                                               const domain::ProviderWorkout& workout);

    static domain::Timestamp resolveEndDate(const domain::ProviderWorkoutActivity& activity);
};

} // namespace healthexport::application
