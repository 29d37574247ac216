/**
 * @file ProviderSnapshotLoader.cpp
 * @brief Implementation of ProviderSnapshotLoader.
 */

#include "infrastructure/ProviderSnapshotLoader.hpp"
#include "infrastructure/IsoDateTime.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace healthexport::infrastructure {

using json = nlohmann::json;
using namespace healthexport::domain;

namespace {

Timestamp ReadTime(const json& j, const char* key) {
    try {
        return IsoDateTime::Parse(j.at(key).get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw SnapshotError(std::string("field '") + key + "': " + e.what());
    }
}

std::optional<Timestamp> ReadOptionalTime(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return ReadTime(j, key);
}

ProviderWorkout ReadWorkout(const json& j) {
    ProviderWorkout workout;
    workout.id = j.at("id").get<std::string>();
    workout.activityType = static_cast<ProviderActivityType>(j.at("activityType").get<int>());
    workout.sourceName = j.value("sourceName", "");
    workout.start = ReadTime(j, "start");
    workout.end = ReadTime(j, "end");
    workout.duration = j.contains("duration") ? j.at("duration").get<double>()
                                              : SecondsBetween(workout.start, workout.end);

    for (const auto& e : j.value("events", json::array())) {
        workout.events.push_back(ProviderWorkoutEvent{
            static_cast<ProviderEventType>(e.at("type").get<int>()),
            ReadTime(e, "start"),
            ReadOptionalTime(e, "end")
        });
    }

    for (const auto& a : j.value("activities", json::array())) {
        workout.activities.push_back(ProviderWorkoutActivity{
            static_cast<ProviderActivityType>(a.at("activityType").get<int>()),
            ReadTime(a, "start"),
            ReadOptionalTime(a, "end"),
            a.at("duration").get<double>()
        });
    }
    return workout;
}

void ReadSample(const json& j, InMemoryHealthDataProvider& provider) {
    const std::string kindName = j.at("kind").get<std::string>();
    auto kind = QuantityKindFromString(kindName);
    if (!kind) {
        throw SnapshotError("unknown quantity kind '" + kindName + "'");
    }
    const std::string unitName = j.at("unit").get<std::string>();
    auto unit = UnitFromString(unitName);
    if (!unit) {
        throw SnapshotError("unknown unit '" + unitName + "'");
    }

    QuantitySample sample;
    sample.start = ReadTime(j, "start");
    sample.end = ReadOptionalTime(j, "end").value_or(sample.start);
    sample.quantity = Quantity{j.at("value").get<double>(), *unit};
    provider.addSample(*kind, sample);
}

void ReadRoute(const json& j, InMemoryHealthDataProvider& provider) {
    std::vector<LocationPoint> points;
    for (const auto& p : j.at("points")) {
        LocationPoint point;
        point.latitude = p.at("latitude").get<double>();
        point.longitude = p.at("longitude").get<double>();
        point.altitude = p.value("altitude", 0.0);
        point.timestamp = ReadTime(p, "timestamp");
        point.horizontalAccuracy = p.value("horizontalAccuracy", -1.0);
        point.speed = p.value("speed", -1.0);
        points.push_back(point);
    }
    provider.addRoute(j.at("workoutId").get<std::string>(), std::move(points));
}

} // namespace

std::shared_ptr<InMemoryHealthDataProvider> ProviderSnapshotLoader::LoadFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw SnapshotError("file not found: " + path);
    }
    std::ifstream in(path);
    if (!in) {
        throw SnapshotError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return LoadString(buffer.str());
}

std::shared_ptr<InMemoryHealthDataProvider> ProviderSnapshotLoader::LoadString(const std::string& content) {
    auto provider = std::make_shared<InMemoryHealthDataProvider>();
    try {
        auto root = json::parse(content);
        for (const auto& w : root.value("workouts", json::array())) {
            provider->addWorkout(ReadWorkout(w));
        }
        for (const auto& s : root.value("samples", json::array())) {
            ReadSample(s, *provider);
        }
        for (const auto& r : root.value("routes", json::array())) {
            ReadRoute(r, *provider);
        }
    } catch (const json::exception& e) {
        throw SnapshotError(e.what());
    }

    std::clog << "[ProviderSnapshotLoader] Loaded " << provider->workoutCount() << " workouts." << std::endl;
    return provider;
}

} // namespace healthexport::infrastructure
