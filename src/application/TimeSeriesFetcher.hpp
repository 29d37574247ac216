/**
 * @file TimeSeriesFetcher.hpp
 * @brief Provider round trips for the two time series of an export.
 */

#pragma once

#include <vector>
#include "application/CancellationToken.hpp"
#include "domain/WorkoutExport.hpp"
#include "domain/provider/HealthDataProvider.hpp"

namespace healthexport::application {

/**
 * @class TimeSeriesFetcher
 * @brief Read-only fetches that are safe to run on any thread.
 *
 * The two fetches share nothing: each returns a sequence it owns. Both check
 * the cancellation token before every provider call and throw
 * domain::ExportCancelledError when it is set.
 */
class TimeSeriesFetcher {
public:
    /**
     * @brief Heart-rate samples inside the workout's range, ascending, at most
     * domain::kMaxHeartRateSamples entries, in beats per minute.
     */
    static std::vector<domain::HeartRateSample> fetchHeartRate(domain::HealthDataProvider& provider,
                                                               const domain::ProviderWorkout& workout,
                                                               const CancellationToken& cancellation);

    /**
     * @brief Points of the workout's route in chronological order.
     * @return An empty vector when the workout has no route.
     */
    static std::vector<domain::RoutePoint> fetchRoute(domain::HealthDataProvider& provider,
                                                      const domain::ProviderWorkout& workout,
                                                      const CancellationToken& cancellation);

    /** @brief Maps one provider location, dropping negative "unavailable" sentinels. */
    static domain::RoutePoint toRoutePoint(const domain::LocationPoint& location);
};

} // namespace healthexport::application
