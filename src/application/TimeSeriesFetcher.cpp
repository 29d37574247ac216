/**
 * @file TimeSeriesFetcher.cpp
 * @brief Implementation of TimeSeriesFetcher.
 */

#include "application/TimeSeriesFetcher.hpp"

namespace healthexport::application {

using namespace healthexport::domain;

namespace {

std::optional<double> NonNegative(double value) {
    if (value >= 0.0) {
        return value;
    }
    return std::nullopt;
}

} // namespace

std::vector<HeartRateSample> TimeSeriesFetcher::fetchHeartRate(HealthDataProvider& provider,
                                                               const ProviderWorkout& workout,
                                                               const CancellationToken& cancellation) {
    cancellation.throwIfCancelled("heart-rate fetch");

    auto samples = provider.querySamples(QuantityKind::HeartRate,
                                         workout.range(),
                                         SortOrder::Ascending,
                                         kMaxHeartRateSamples);

    cancellation.throwIfCancelled("heart-rate fetch");

    std::vector<HeartRateSample> result;
    result.reserve(samples.size());
    for (const auto& sample : samples) {
        result.push_back(HeartRateSample{
            sample.start,
            ConvertQuantity(sample.quantity, ProviderUnit::CountPerMinute)
        });
    }
    return result;
}

std::vector<RoutePoint> TimeSeriesFetcher::fetchRoute(HealthDataProvider& provider,
                                                      const ProviderWorkout& workout,
                                                      const CancellationToken& cancellation) {
    cancellation.throwIfCancelled("route fetch");

    auto route = provider.queryRoute(workout.id);
    if (!route) {
        return {};
    }

    std::vector<RoutePoint> points;
    points.reserve(route->pointCount);
    provider.streamRoutePoints(*route, [&points, &cancellation](const LocationPoint& location) {
        if (cancellation.isCancelled()) {
            return false;
        }
        points.push_back(toRoutePoint(location));
        return true;
    });

    // A stopped stream must not hand back a truncated route.
    cancellation.throwIfCancelled("route fetch");
    return points;
}

RoutePoint TimeSeriesFetcher::toRoutePoint(const LocationPoint& location) {
    RoutePoint point;
    point.latitude = location.latitude;
    point.longitude = location.longitude;
    point.altitude = location.altitude;
    point.timestamp = location.timestamp;
    point.horizontalAccuracy = NonNegative(location.horizontalAccuracy);
    point.speed = NonNegative(location.speed);
    return point;
}

} // namespace healthexport::application
