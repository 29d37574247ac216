/**
 * @file ExportAssembler.cpp
 * @brief Implementation of ExportAssembler.
 */

#include "application/ExportAssembler.hpp"
#include "application/StatisticsExtractor.hpp"
#include "application/TimeSeriesFetcher.hpp"
#include "application/WorkoutRecordExtractor.hpp"
#include <chrono>
#include <exception>
#include <future>
#include <iostream>

namespace healthexport::application {

using namespace healthexport::domain;

namespace {

Timestamp NowMillis() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

std::string DescribeError(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

// Waits for a fetch that is no longer needed because the export already failed.
template <typename T>
void JoinAbandoned(std::future<T>& future, const char* label) {
    try {
        future.get();
    } catch (const ExportCancelledError&) {
        // Expected: the assembler cancelled it.
    } catch (const std::exception& e) {
        std::cerr << "[ExportAssembler] " << label << " fetch also failed: " << e.what() << std::endl;
    }
}

} // namespace

ExportAssembler::ExportAssembler(std::shared_ptr<HealthDataProvider> provider, Clock clock)
    : m_provider(std::move(provider)), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = NowMillis;
    }
}

WorkoutExport ExportAssembler::buildExport(const ProviderWorkout& workout, const CancellationToken& cancellation) {
    cancellation.throwIfCancelled("export of workout " + workout.id);

    CancellationToken fetchCancellation = cancellation.linked();
    HealthDataProvider& provider = *m_provider;

    auto heartRateFuture = std::async(std::launch::async, [&provider, &workout, fetchCancellation]() {
        return TimeSeriesFetcher::fetchHeartRate(provider, workout, fetchCancellation);
    });
    auto routeFuture = std::async(std::launch::async, [&provider, &workout, fetchCancellation]() {
        return TimeSeriesFetcher::fetchRoute(provider, workout, fetchCancellation);
    });

    WorkoutData data;
    try {
        data.type = ActivityKindFromProvider(workout.activityType);
        data.sourceApp = workout.sourceName;
        data.startDate = workout.start;
        data.endDate = workout.end;
        data.duration = workout.duration;
        data.statistics = StatisticsExtractor::extract(provider, workout.range());
        data.events = WorkoutRecordExtractor::extractEvents(workout);
        data.activities = WorkoutRecordExtractor::extractActivities(provider, workout);
    } catch (...) {
        // The fetches borrow `workout` and `provider`; they must finish before unwinding.
        fetchCancellation.cancel();
        JoinAbandoned(heartRateFuture, "Heart-rate");
        JoinAbandoned(routeFuture, "Route");
        throw;
    }

    std::exception_ptr heartRateError;
    std::exception_ptr routeError;
    try {
        data.heartRateSamples = heartRateFuture.get();
    } catch (...) {
        heartRateError = std::current_exception();
    }
    try {
        data.route = routeFuture.get();
    } catch (...) {
        routeError = std::current_exception();
    }

    if (heartRateError) {
        if (routeError) {
            std::cerr << "[ExportAssembler] Route fetch also failed for workout " << workout.id
                      << ": " << DescribeError(routeError) << std::endl;
        }
        std::rethrow_exception(heartRateError);
    }
    if (routeError) {
        std::rethrow_exception(routeError);
    }
    fetchCancellation.throwIfCancelled("export of workout " + workout.id);

    WorkoutExport result;
    result.exportVersion = kExportVersion;
    result.exportDate = m_clock();
    result.workout = std::move(data);

    std::clog << "[ExportAssembler] Assembled workout " << workout.id << ": "
              << result.workout.heartRateSamples.size() << " heart-rate samples, "
              << result.workout.route.size() << " route points, "
              << result.workout.events.size() << " events, "
              << result.workout.activities.size() << " activities." << std::endl;
    return result;
}

WorkoutExport ExportAssembler::buildExportById(const WorkoutId& workoutId, const CancellationToken& cancellation) {
    cancellation.throwIfCancelled("lookup of workout " + workoutId);

    auto workout = m_provider->findWorkout(workoutId);
    if (!workout) {
        throw WorkoutNotFoundError(workoutId);
    }
    return buildExport(*workout, cancellation);
}

} // namespace healthexport::application
