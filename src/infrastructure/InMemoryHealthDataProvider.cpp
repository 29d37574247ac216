/**
 * @file InMemoryHealthDataProvider.cpp
 * @brief Implementation of InMemoryHealthDataProvider.
 */

#include "infrastructure/InMemoryHealthDataProvider.hpp"
#include <algorithm>
#include <thread>

namespace healthexport::infrastructure {

using namespace healthexport::domain;

void InMemoryHealthDataProvider::addWorkout(const ProviderWorkout& workout) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_workouts[workout.id] = workout;
}

void InMemoryHealthDataProvider::addSample(QuantityKind kind, const QuantitySample& sample) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_samples[kind].push_back(sample);
}

void InMemoryHealthDataProvider::addRoute(const WorkoutId& workoutId, std::vector<LocationPoint> points) {
    std::stable_sort(points.begin(), points.end(), [](const LocationPoint& a, const LocationPoint& b) {
        return a.timestamp < b.timestamp;
    });
    std::lock_guard<std::mutex> lock(m_mutex);
    m_routes[workoutId] = std::move(points);
}

void InMemoryHealthDataProvider::failOperation(ProviderOperation operation, const ProviderError& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failures.erase(operation);
    m_failures.emplace(operation, error);
}

void InMemoryHealthDataProvider::setLatency(ProviderOperation operation, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_latency[operation] = delay;
}

std::size_t InMemoryHealthDataProvider::workoutCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_workouts.size();
}

void InMemoryHealthDataProvider::enter(ProviderOperation operation) {
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto latency = m_latency.find(operation);
        if (latency != m_latency.end()) delay = latency->second;
    }
    // Sleep outside the lock so concurrent callers overlap like real I/O.
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto failure = m_failures.find(operation);
    if (failure != m_failures.end()) {
        throw failure->second;
    }
}

std::vector<QuantitySample> InMemoryHealthDataProvider::samplesInRange(QuantityKind kind, const TimeRange& range) {
    std::vector<QuantitySample> result;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_samples.find(kind);
    if (it == m_samples.end()) return result;
    for (const auto& sample : it->second) {
        if (range.contains(sample.start)) {
            result.push_back(sample);
        }
    }
    return result;
}

std::optional<ProviderWorkout> InMemoryHealthDataProvider::findWorkout(const WorkoutId& id) {
    enter(ProviderOperation::FindWorkout);
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_workouts.find(id);
    if (it == m_workouts.end()) return std::nullopt;
    return it->second;
}

std::optional<QuantityStatistics> InMemoryHealthDataProvider::queryStatistics(QuantityKind kind, const TimeRange& range) {
    enter(ProviderOperation::QueryStatistics);

    auto samples = samplesInRange(kind, range);
    if (samples.empty()) return std::nullopt;

    const ProviderUnit unit = samples.front().quantity.unit;
    double sum = 0.0;
    double maximum = ConvertQuantity(samples.front().quantity, unit);
    for (const auto& sample : samples) {
        double value = ConvertQuantity(sample.quantity, unit);
        sum += value;
        maximum = std::max(maximum, value);
    }

    QuantityStatistics stats;
    if (AggregationStyleFor(kind) == AggregationStyle::Cumulative) {
        stats.sum = Quantity{sum, unit};
    } else {
        stats.average = Quantity{sum / static_cast<double>(samples.size()), unit};
        stats.maximum = Quantity{maximum, unit};
    }
    return stats;
}

std::vector<QuantitySample> InMemoryHealthDataProvider::querySamples(QuantityKind kind,
                                                                     const TimeRange& range,
                                                                     SortOrder order,
                                                                     std::size_t limit) {
    enter(ProviderOperation::QuerySamples);

    auto samples = samplesInRange(kind, range);
    std::stable_sort(samples.begin(), samples.end(), [order](const QuantitySample& a, const QuantitySample& b) {
        return order == SortOrder::Ascending ? a.start < b.start : a.start > b.start;
    });
    if (samples.size() > limit) {
        samples.resize(limit);
    }
    return samples;
}

std::optional<RouteHandle> InMemoryHealthDataProvider::queryRoute(const WorkoutId& workoutId) {
    enter(ProviderOperation::QueryRoute);
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_routes.find(workoutId);
    if (it == m_routes.end()) return std::nullopt;
    return RouteHandle{"route-" + workoutId, workoutId, it->second.size()};
}

void InMemoryHealthDataProvider::streamRoutePoints(const RouteHandle& route,
                                                   const std::function<bool(const LocationPoint&)>& onPoint) {
    enter(ProviderOperation::StreamRoutePoints);

    std::vector<LocationPoint> points;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_routes.find(route.workoutId);
        if (it == m_routes.end()) {
            throw ProviderError(ProviderErrorKind::Other, "Route no longer exists: " + route.routeId);
        }
        points = it->second;
    }

    for (const auto& point : points) {
        if (!onPoint(point)) {
            return;
        }
    }
}

} // namespace healthexport::infrastructure
