/**
 * @file DocumentSerializer.hpp
 * @brief Canonical JSON encoding of WorkoutExport documents.
 */

#pragma once

#include <string>
#include "domain/WorkoutExport.hpp"

namespace healthexport::infrastructure {

/** @brief Time zone used to pick the calendar day in the export filename. */
enum class FilenameTimeZone {
    Utc,
    Local
};

struct SerializerOptions {
    int indent = 2; ///< Spaces per level. Values below 1 are raised to 1.
    FilenameTimeZone filenameTimeZone = FilenameTimeZone::Utc;
};

/**
 * @struct SerializedDocument
 * @brief Encoded bytes plus the proposed artifact name. Storing them is the caller's job.
 */
struct SerializedDocument {
    std::string bytes;
    std::string filename;
};

/**
 * @class DocumentSerializer
 * @brief Encodes and decodes export documents.
 *
 * Output has lexicographically sorted keys in every object, indented lines,
 * ISO-8601 UTC timestamps, and omits absent optional fields instead of
 * writing null.
 */
class DocumentSerializer {
public:
    explicit DocumentSerializer(SerializerOptions options = SerializerOptions());

    /**
     * @brief Encodes @p document and derives its filename.
     * @throws domain::SerializationError if the document violates a model
     *         invariant (non-finite number, end before start, invalid UTF-8).
     */
    SerializedDocument serialize(const domain::WorkoutExport& document) const;

    /**
     * @brief Decodes bytes produced by serialize().
     * @throws domain::SerializationError on malformed input or an unsupported exportVersion.
     */
    domain::WorkoutExport parse(const std::string& bytes) const;

    /** @brief "workout-{type}-{yyyy-MM-dd}.json" from the workout type tag and start day. */
    std::string filenameFor(const domain::WorkoutExport& document) const;

private:
    SerializerOptions m_options;
};

} // namespace healthexport::infrastructure
