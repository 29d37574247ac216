/**
 * @file IsoDateTime.hpp
 * @brief ISO-8601 formatting and parsing of timestamps.
 */

#pragma once

#include <string>
#include "domain/TimeRange.hpp"

namespace healthexport::infrastructure {

class IsoDateTime {
public:
    /**
     * @brief Formats as UTC "YYYY-MM-DDTHH:MM:SSZ". A non-zero fraction is written
     * as 3, 6 or 9 digits, whichever is the fewest that keeps the instant exact.
     */
    static std::string Format(domain::Timestamp t);

    /**
     * @brief Parses "YYYY-MM-DDTHH:MM:SS[.fff...](Z|+HH:MM|-HH:MM)".
     * @throws std::invalid_argument if @p text is not in that form.
     */
    static domain::Timestamp Parse(const std::string& text);

    /** @brief Calendar day of @p t as "YYYY-MM-DD", in UTC or in the process's local zone. */
    static std::string FormatDay(domain::Timestamp t, bool localTime);
};

} // namespace healthexport::infrastructure
