/**
 * @file TimeRange.hpp
 * @brief Instants and closed time intervals used across the pipeline.
 */

#pragma once

#include <chrono>

namespace healthexport::domain {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @struct TimeRange
 * @brief Closed interval [start, end] of wall-clock instants.
 */
struct TimeRange {
    Timestamp start;
    Timestamp end;

    bool contains(Timestamp t) const { return t >= start && t <= end; }
};

/** @brief Shifts an instant by a (possibly fractional) number of seconds. */
inline Timestamp AddSeconds(Timestamp t, double seconds) {
    return t + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                   std::chrono::duration<double>(seconds));
}

inline double SecondsBetween(Timestamp from, Timestamp to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace healthexport::domain
