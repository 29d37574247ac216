/**
 * @file WorkoutEventKind.hpp
 * @brief Value Object mapping provider workout-event types to normalized event tags.
 */

#pragma once

#include <string>

namespace healthexport::domain {

/**
 * @enum ProviderEventType
 * @brief Raw event codes as the provider reports them. Open-ended like ProviderActivityType.
 */
enum class ProviderEventType : int {
    Pause = 1,
    Resume = 2,
    Lap = 3,
    Marker = 4,
    MotionPaused = 5,
    MotionResumed = 6,
    Segment = 7,
    PauseOrResumeRequest = 8
};

enum class WorkoutEventKind {
    Pause,
    Resume,
    Lap,
    Segment,
    Marker,
    MotionPaused,
    MotionResumed,
    Unknown     ///< Any provider code without a mapping, including future ones.
};

inline WorkoutEventKind WorkoutEventKindFromProvider(ProviderEventType type) {
    switch (type) {
        case ProviderEventType::Pause: return WorkoutEventKind::Pause;
        case ProviderEventType::Resume: return WorkoutEventKind::Resume;
        case ProviderEventType::Lap: return WorkoutEventKind::Lap;
        case ProviderEventType::Segment: return WorkoutEventKind::Segment;
        case ProviderEventType::Marker: return WorkoutEventKind::Marker;
        case ProviderEventType::MotionPaused: return WorkoutEventKind::MotionPaused;
        case ProviderEventType::MotionResumed: return WorkoutEventKind::MotionResumed;
        default: return WorkoutEventKind::Unknown;
    }
}

inline std::string WorkoutEventKindToTag(WorkoutEventKind kind) {
    switch (kind) {
        case WorkoutEventKind::Pause: return "pause";
        case WorkoutEventKind::Resume: return "resume";
        case WorkoutEventKind::Lap: return "lap";
        case WorkoutEventKind::Segment: return "segment";
        case WorkoutEventKind::Marker: return "marker";
        case WorkoutEventKind::MotionPaused: return "motionPaused";
        case WorkoutEventKind::MotionResumed: return "motionResumed";
        case WorkoutEventKind::Unknown: return "unknown";
        default: return "unknown";
    }
}

inline WorkoutEventKind WorkoutEventKindFromTag(const std::string& tag) {
    if (tag == "pause") return WorkoutEventKind::Pause;
    if (tag == "resume") return WorkoutEventKind::Resume;
    if (tag == "lap") return WorkoutEventKind::Lap;
    if (tag == "segment") return WorkoutEventKind::Segment;
    if (tag == "marker") return WorkoutEventKind::Marker;
    if (tag == "motionPaused") return WorkoutEventKind::MotionPaused;
    if (tag == "motionResumed") return WorkoutEventKind::MotionResumed;
    return WorkoutEventKind::Unknown;
}

} // namespace healthexport::domain
