/**
 * @file InMemoryHealthDataProvider.hpp
 * @brief Deterministic HealthDataProvider backed by in-memory records.
 */

#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include "domain/ExportErrors.hpp"
#include "domain/provider/HealthDataProvider.hpp"

namespace healthexport::infrastructure {

/** @brief Provider operations that can be made to fail or slow down. */
enum class ProviderOperation {
    FindWorkout,
    QueryStatistics,
    QuerySamples,
    QueryRoute,
    StreamRoutePoints
};

/**
 * @class InMemoryHealthDataProvider
 * @brief Serves workouts, samples and routes from memory.
 *
 * Statistics are computed from the stored samples: sums for cumulative kinds,
 * mean and maximum for discrete kinds, reported in the unit of the first
 * matching sample. All methods are safe to call concurrently.
 */
class InMemoryHealthDataProvider : public domain::HealthDataProvider {
public:
    void addWorkout(const domain::ProviderWorkout& workout);
    void addSample(domain::QuantityKind kind, const domain::QuantitySample& sample);
    void addRoute(const domain::WorkoutId& workoutId, std::vector<domain::LocationPoint> points);

    /** @brief Makes every later call of @p operation throw @p error. */
    void failOperation(ProviderOperation operation, const domain::ProviderError& error);

    /** @brief Delays every later call of @p operation by @p delay. */
    void setLatency(ProviderOperation operation, std::chrono::milliseconds delay);

    std::size_t workoutCount() const;

    std::optional<domain::ProviderWorkout> findWorkout(const domain::WorkoutId& id) override;
    std::optional<domain::QuantityStatistics> queryStatistics(domain::QuantityKind kind,
                                                              const domain::TimeRange& range) override;
    std::vector<domain::QuantitySample> querySamples(domain::QuantityKind kind,
                                                     const domain::TimeRange& range,
                                                     domain::SortOrder order,
                                                     std::size_t limit) override;
    std::optional<domain::RouteHandle> queryRoute(const domain::WorkoutId& workoutId) override;
    void streamRoutePoints(const domain::RouteHandle& route,
                           const std::function<bool(const domain::LocationPoint&)>& onPoint) override;

private:
    void enter(ProviderOperation operation);
    std::vector<domain::QuantitySample> samplesInRange(domain::QuantityKind kind, const domain::TimeRange& range);

    mutable std::mutex m_mutex;
    std::map<domain::WorkoutId, domain::ProviderWorkout> m_workouts;
    std::map<domain::QuantityKind, std::vector<domain::QuantitySample>> m_samples;
    std::map<domain::WorkoutId, std::vector<domain::LocationPoint>> m_routes;
    std::map<ProviderOperation, domain::ProviderError> m_failures;
    std::map<ProviderOperation, std::chrono::milliseconds> m_latency;
};

} // namespace healthexport::infrastructure
