/**
 * @file ProviderSnapshotLoader.hpp
 * @brief Loads an InMemoryHealthDataProvider from a JSON snapshot.
 *
 * Snapshot layout:
 * @code
 * {
 *   "workouts": [{ "id", "activityType", "sourceName", "start", "end", "duration",
 *                  "events": [{ "type", "start", "end"? }],
 *                  "activities": [{ "activityType", "start", "end"?, "duration" }] }],
 *   "samples":  [{ "kind", "start", "end"?, "value", "unit" }],
 *   "routes":   [{ "workoutId", "points": [{ "latitude", "longitude", "altitude",
 *                  "timestamp", "horizontalAccuracy"?, "speed"? }] }]
 * }
 * @endcode
 * Activity and event types are the provider's raw integer codes.
 */

#pragma once

#include <memory>
#include <string>
#include "infrastructure/InMemoryHealthDataProvider.hpp"

namespace healthexport::infrastructure {

class ProviderSnapshotLoader {
public:
    /** @throws domain::SnapshotError if the file is missing or malformed. */
    static std::shared_ptr<InMemoryHealthDataProvider> LoadFile(const std::string& path);

    /** @throws domain::SnapshotError if @p content is malformed. */
    static std::shared_ptr<InMemoryHealthDataProvider> LoadString(const std::string& content);
};

} // namespace healthexport::infrastructure
