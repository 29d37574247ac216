/**
 * @file StatisticsExtractor.hpp
 * @brief Builds unit-normalized WorkoutStatistics from provider aggregates.
 */

#pragma once

#include "domain/WorkoutExport.hpp"
#include "domain/provider/HealthDataProvider.hpp"

namespace healthexport::application {

class StatisticsExtractor {
public:
    /**
     * @brief Queries every exported quantity kind over @p range.
     *
     * Energy, distance and steps use the sum; heart rate, speed and power the
     * average, plus the maximum for heart rate. A kind with no samples leaves
     * its field absent. Used identically for a workout and for each of its
     * sub-activities.
     *
     * @throws domain::ProviderError if a statistics query fails.
     * @throws domain::UnitMismatchError if the provider reports an incompatible unit.
     */
    static domain::WorkoutStatistics extract(domain::HealthDataProvider& provider,
                                             const domain::TimeRange& range);
};

} // namespace healthexport::application
