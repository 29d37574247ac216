/**
 * @file DocumentSerializer.cpp
 * @brief Implementation of DocumentSerializer.
 */

#include "infrastructure/DocumentSerializer.hpp"
#include "infrastructure/IsoDateTime.hpp"
#include "domain/ExportErrors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace healthexport::infrastructure {

using json = nlohmann::json;
using namespace healthexport::domain;

namespace {

// --- Encoding ---

void RequireFinite(double value, const std::string& field) {
    if (!std::isfinite(value)) {
        throw SerializationError("Non-finite value in '" + field + "'");
    }
}

void RequireOrdered(Timestamp start, Timestamp end, const std::string& field) {
    if (end < start) {
        throw SerializationError("'" + field + "' ends before it starts");
    }
}

void PutStat(json& j, const char* key, const std::optional<StatValue>& stat) {
    if (!stat) return;
    RequireFinite(stat->value, key);
    j[key] = {
        {"unit", stat->unit},
        {"value", stat->value}
    };
}

json StatisticsToJson(const WorkoutStatistics& stats) {
    json j = json::object();
    PutStat(j, "activeEnergyBurned", stats.activeEnergyBurned);
    PutStat(j, "distance", stats.distance);
    PutStat(j, "stepCount", stats.stepCount);
    PutStat(j, "averageHeartRate", stats.averageHeartRate);
    PutStat(j, "maxHeartRate", stats.maxHeartRate);
    PutStat(j, "averageSpeed", stats.averageSpeed);
    PutStat(j, "averagePower", stats.averagePower);
    return j;
}

json HeartRateToJson(const std::vector<HeartRateSample>& samples) {
    if (samples.size() > kMaxHeartRateSamples) {
        throw SerializationError("More than " + std::to_string(kMaxHeartRateSamples) + " heart-rate samples");
    }
    json arr = json::array();
    for (const auto& sample : samples) {
        RequireFinite(sample.bpm, "heartRateSamples.bpm");
        arr.push_back({
            {"bpm", sample.bpm},
            {"date", IsoDateTime::Format(sample.date)}
        });
    }
    return arr;
}

json RouteToJson(const std::vector<RoutePoint>& route) {
    json arr = json::array();
    for (const auto& point : route) {
        RequireFinite(point.latitude, "route.latitude");
        RequireFinite(point.longitude, "route.longitude");
        RequireFinite(point.altitude, "route.altitude");

        json j = {
            {"altitude", point.altitude},
            {"latitude", point.latitude},
            {"longitude", point.longitude},
            {"timestamp", IsoDateTime::Format(point.timestamp)}
        };
        if (point.horizontalAccuracy) {
            RequireFinite(*point.horizontalAccuracy, "route.horizontalAccuracy");
            j["horizontalAccuracy"] = *point.horizontalAccuracy;
        }
        if (point.speed) {
            RequireFinite(*point.speed, "route.speed");
            j["speed"] = *point.speed;
        }
        arr.push_back(std::move(j));
    }
    return arr;
}

json EventsToJson(const std::vector<WorkoutEventData>& events) {
    json arr = json::array();
    for (const auto& event : events) {
        json j = {
            {"startDate", IsoDateTime::Format(event.startDate)},
            {"type", WorkoutEventKindToTag(event.type)}
        };
        if (event.endDate) {
            RequireOrdered(event.startDate, *event.endDate, "events");
            j["endDate"] = IsoDateTime::Format(*event.endDate);
        }
        arr.push_back(std::move(j));
    }
    return arr;
}

json ActivitiesToJson(const std::vector<ActivityData>& activities) {
    json arr = json::array();
    for (const auto& activity : activities) {
        RequireOrdered(activity.startDate, activity.endDate, "activities");
        RequireFinite(activity.duration, "activities.duration");
        arr.push_back({
            {"duration", activity.duration},
            {"endDate", IsoDateTime::Format(activity.endDate)},
            {"startDate", IsoDateTime::Format(activity.startDate)},
            {"statistics", StatisticsToJson(activity.statistics)},
            {"type", ActivityKindToTag(activity.type)}
        });
    }
    return arr;
}

json WorkoutToJson(const WorkoutData& workout) {
    RequireOrdered(workout.startDate, workout.endDate, "workout");
    RequireFinite(workout.duration, "workout.duration");
    return {
        {"activities", ActivitiesToJson(workout.activities)},
        {"duration", workout.duration},
        {"endDate", IsoDateTime::Format(workout.endDate)},
        {"events", EventsToJson(workout.events)},
        {"heartRateSamples", HeartRateToJson(workout.heartRateSamples)},
        {"route", RouteToJson(workout.route)},
        {"sourceApp", workout.sourceApp},
        {"startDate", IsoDateTime::Format(workout.startDate)},
        {"statistics", StatisticsToJson(workout.statistics)},
        {"type", ActivityKindToTag(workout.type)}
    };
}

// --- Decoding ---

const json& RequireField(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key)) {
        throw SerializationError(std::string("Missing field '") + key + "'");
    }
    return j.at(key);
}

bool HasValue(const json& j, const char* key) {
    return j.is_object() && j.contains(key) && !j.at(key).is_null();
}

Timestamp ParseTime(const json& value) {
    try {
        return IsoDateTime::Parse(value.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw SerializationError(e.what());
    }
}

std::optional<StatValue> ParseStat(const json& stats, const char* key) {
    if (!HasValue(stats, key)) return std::nullopt;
    const json& j = stats.at(key);
    return StatValue{
        RequireField(j, "value").get<double>(),
        RequireField(j, "unit").get<std::string>()
    };
}

WorkoutStatistics ParseStatistics(const json& j) {
    WorkoutStatistics stats;
    stats.activeEnergyBurned = ParseStat(j, "activeEnergyBurned");
    stats.distance = ParseStat(j, "distance");
    stats.stepCount = ParseStat(j, "stepCount");
    stats.averageHeartRate = ParseStat(j, "averageHeartRate");
    stats.maxHeartRate = ParseStat(j, "maxHeartRate");
    stats.averageSpeed = ParseStat(j, "averageSpeed");
    stats.averagePower = ParseStat(j, "averagePower");
    return stats;
}

WorkoutData ParseWorkout(const json& j) {
    WorkoutData workout;
    workout.type = ActivityKindFromTag(RequireField(j, "type").get<std::string>());
    workout.sourceApp = RequireField(j, "sourceApp").get<std::string>();
    workout.startDate = ParseTime(RequireField(j, "startDate"));
    workout.endDate = ParseTime(RequireField(j, "endDate"));
    workout.duration = RequireField(j, "duration").get<double>();
    workout.statistics = ParseStatistics(RequireField(j, "statistics"));

    for (const auto& s : RequireField(j, "heartRateSamples")) {
        workout.heartRateSamples.push_back(HeartRateSample{
            ParseTime(RequireField(s, "date")),
            RequireField(s, "bpm").get<double>()
        });
    }

    for (const auto& p : RequireField(j, "route")) {
        RoutePoint point;
        point.latitude = RequireField(p, "latitude").get<double>();
        point.longitude = RequireField(p, "longitude").get<double>();
        point.altitude = RequireField(p, "altitude").get<double>();
        point.timestamp = ParseTime(RequireField(p, "timestamp"));
        if (HasValue(p, "horizontalAccuracy")) point.horizontalAccuracy = p.at("horizontalAccuracy").get<double>();
        if (HasValue(p, "speed")) point.speed = p.at("speed").get<double>();
        workout.route.push_back(point);
    }

    for (const auto& e : RequireField(j, "events")) {
        WorkoutEventData event;
        event.type = WorkoutEventKindFromTag(RequireField(e, "type").get<std::string>());
        event.startDate = ParseTime(RequireField(e, "startDate"));
        if (HasValue(e, "endDate")) event.endDate = ParseTime(e.at("endDate"));
        workout.events.push_back(event);
    }

    for (const auto& a : RequireField(j, "activities")) {
        ActivityData activity;
        activity.type = ActivityKindFromTag(RequireField(a, "type").get<std::string>());
        activity.startDate = ParseTime(RequireField(a, "startDate"));
        activity.endDate = ParseTime(RequireField(a, "endDate"));
        activity.duration = RequireField(a, "duration").get<double>();
        activity.statistics = ParseStatistics(RequireField(a, "statistics"));
        workout.activities.push_back(std::move(activity));
    }

    return workout;
}

} // namespace

DocumentSerializer::DocumentSerializer(SerializerOptions options) : m_options(options) {
    m_options.indent = std::max(1, m_options.indent);
}

SerializedDocument DocumentSerializer::serialize(const WorkoutExport& document) const {
    json root = {
        {"exportDate", IsoDateTime::Format(document.exportDate)},
        {"exportVersion", document.exportVersion},
        {"workout", WorkoutToJson(document.workout)}
    };

    SerializedDocument out;
    try {
        out.bytes = root.dump(m_options.indent);
    } catch (const json::exception& e) {
        // Strict dump rejects invalid UTF-8 in string fields.
        throw SerializationError(e.what());
    }
    out.filename = filenameFor(document);
    return out;
}

WorkoutExport DocumentSerializer::parse(const std::string& bytes) const {
    try {
        json root = json::parse(bytes);

        WorkoutExport document;
        document.exportVersion = RequireField(root, "exportVersion").get<std::string>();
        if (document.exportVersion != kExportVersion) {
            throw SerializationError("Unsupported exportVersion '" + document.exportVersion + "'");
        }
        document.exportDate = ParseTime(RequireField(root, "exportDate"));
        document.workout = ParseWorkout(RequireField(root, "workout"));
        return document;
    } catch (const json::exception& e) {
        throw SerializationError(e.what());
    }
}

std::string DocumentSerializer::filenameFor(const WorkoutExport& document) const {
    const bool local = m_options.filenameTimeZone == FilenameTimeZone::Local;
    return "workout-" + ActivityKindToTag(document.workout.type) + "-" +
           IsoDateTime::FormatDay(document.workout.startDate, local) + ".json";
}

} // namespace healthexport::infrastructure
