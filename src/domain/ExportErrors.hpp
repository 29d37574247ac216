/**
 * @file ExportErrors.hpp
 * @brief Exception hierarchy for the workout export pipeline.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace healthexport::domain {

/**
 * @class ExportError
 * @brief Base class for every failure raised while building or encoding an export.
 */
class ExportError : public std::runtime_error {
public:
    explicit ExportError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @enum ProviderErrorKind
 * @brief Coarse cause reported by a health-data provider.
 */
enum class ProviderErrorKind {
    PermissionDenied,
    StoreUnavailable,
    Io,
    Other
};

inline std::string ProviderErrorKindToString(ProviderErrorKind kind) {
    switch (kind) {
        case ProviderErrorKind::PermissionDenied: return "permission_denied";
        case ProviderErrorKind::StoreUnavailable: return "store_unavailable";
        case ProviderErrorKind::Io: return "io";
        case ProviderErrorKind::Other: return "other";
        default: return "other";
    }
}

/**
 * @class ProviderError
 * @brief A provider query failed. Always fatal to the current export attempt.
 */
class ProviderError : public ExportError {
public:
    ProviderError(ProviderErrorKind kind, const std::string& message)
        : ExportError("Provider error (" + ProviderErrorKindToString(kind) + "): " + message),
          m_kind(kind),
          m_detail(message) {}

    ProviderErrorKind kind() const { return m_kind; }
    const std::string& detail() const { return m_detail; }

private:
    ProviderErrorKind m_kind;
    std::string m_detail;
};

/** @brief No workout with the requested identifier exists in the provider. */
class WorkoutNotFoundError : public ExportError {
public:
    explicit WorkoutNotFoundError(const std::string& workoutId)
        : ExportError("Workout not found: " + workoutId), m_workoutId(workoutId) {}

    const std::string& workoutId() const { return m_workoutId; }

private:
    std::string m_workoutId;
};

/** @brief A quantity arrived in a unit that cannot be converted to the requested one. */
class UnitMismatchError : public ExportError {
public:
    explicit UnitMismatchError(const std::string& message) : ExportError(message) {}
};

/** @brief The caller cancelled the export before it completed. */
class ExportCancelledError : public ExportError {
public:
    explicit ExportCancelledError(const std::string& operation)
        : ExportError("Export cancelled during " + operation) {}
};

/** @brief Encoding or decoding of an export document failed. */
class SerializationError : public ExportError {
public:
    explicit SerializationError(const std::string& message)
        : ExportError("Serialization error: " + message) {}
};

/** @brief A provider snapshot file could not be loaded. */
class SnapshotError : public ExportError {
public:
    explicit SnapshotError(const std::string& message)
        : ExportError("Snapshot error: " + message) {}
};

/** @brief Writing an export document to disk failed. */
class ExportIoError : public ExportError {
public:
    explicit ExportIoError(const std::string& message) : ExportError(message) {}
};

} // namespace healthexport::domain
