/**
 * @file HealthDataProvider.hpp
 * @brief Interface for the external store that holds workouts, samples and routes.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>
#include "ProviderRecords.hpp"
#include "../value_objects/QuantityKind.hpp"

namespace healthexport::domain {

enum class SortOrder {
    Ascending,
    Descending
};

/**
 * @class HealthDataProvider
 * @brief Abstract read-only boundary to a health-data store.
 *
 * Every operation may block on I/O and may throw ProviderError. Implementations
 * must accept concurrent calls: an export issues queries from several threads
 * at once. "No data" is never reported as an error.
 */
class HealthDataProvider {
public:
    virtual ~HealthDataProvider() = default;

    /**
     * @brief Looks up a completed workout.
     * @return The workout, or std::nullopt if the identifier is unknown.
     */
    virtual std::optional<ProviderWorkout> findWorkout(const WorkoutId& id) = 0;

    /**
     * @brief Computes statistics for one quantity kind over a time range.
     * @return std::nullopt when no samples of @p kind fall in @p range.
     */
    virtual std::optional<QuantityStatistics> queryStatistics(QuantityKind kind, const TimeRange& range) = 0;

    /**
     * @brief Returns raw samples of @p kind whose start lies in @p range.
     * @param order Ordering by sample start.
     * @param limit Maximum number of samples returned.
     */
    virtual std::vector<QuantitySample> querySamples(QuantityKind kind,
                                                     const TimeRange& range,
                                                     SortOrder order,
                                                     std::size_t limit) = 0;

    /** @brief Returns the route attached to a workout, if one was recorded. */
    virtual std::optional<RouteHandle> queryRoute(const WorkoutId& workoutId) = 0;

    /**
     * @brief Streams the locations of a route in chronological order.
     * @param onPoint Called once per location. Returning false stops the stream.
     */
    virtual void streamRoutePoints(const RouteHandle& route,
                                   const std::function<bool(const LocationPoint&)>& onPoint) = 0;
};

} // namespace healthexport::domain
