/**
 * @file IsoDateTime.cpp
 * @brief Implementation of IsoDateTime.
 */

#include "infrastructure/IsoDateTime.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace healthexport::infrastructure {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
long long DaysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

bool ReadDigits(const std::string& text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        unsigned char c = static_cast<unsigned char>(text[pos + i]);
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool Expect(const std::string& text, std::size_t& pos, char expected) {
    if (pos >= text.size() || text[pos] != expected) return false;
    ++pos;
    return true;
}

// Whole seconds since the epoch (floored) and the non-negative nanosecond remainder.
void SplitSeconds(domain::Timestamp t, long long& seconds, long long& nanos) {
    using namespace std::chrono;
    const long long total = duration_cast<nanoseconds>(t.time_since_epoch()).count();
    seconds = total / 1000000000LL;
    nanos = total % 1000000000LL;
    if (nanos < 0) {
        nanos += 1000000000LL;
        seconds -= 1;
    }
}

[[noreturn]] void Reject(const std::string& text) {
    throw std::invalid_argument("Invalid ISO-8601 timestamp: '" + text + "'");
}

} // namespace

std::string IsoDateTime::Format(domain::Timestamp t) {
    long long seconds = 0;
    long long nanos = 0;
    SplitSeconds(t, seconds, nanos);

    std::tm tm = ToUtcTime(static_cast<std::time_t>(seconds));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);

    std::string out(buf);
    if (nanos != 0) {
        // Shortest of .mmm, .uuuuuu, .nnnnnnnnn that holds the instant exactly.
        char frac[16];
        if (nanos % 1000000 == 0) {
            std::snprintf(frac, sizeof(frac), ".%03lld", nanos / 1000000);
        } else if (nanos % 1000 == 0) {
            std::snprintf(frac, sizeof(frac), ".%06lld", nanos / 1000);
        } else {
            std::snprintf(frac, sizeof(frac), ".%09lld", nanos);
        }
        out += frac;
    }
    out += "Z";
    return out;
}

domain::Timestamp IsoDateTime::Parse(const std::string& text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, month) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, day) || !Expect(text, pos, 'T') ||
        !ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') ||
        !ReadDigits(text, pos, 2, minute) || !Expect(text, pos, ':') ||
        !ReadDigits(text, pos, 2, second)) {
        Reject(text);
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        Reject(text);
    }

    long long nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        long long scale = 100000000;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (scale > 0) {
                nanos += (text[pos] - '0') * scale;
                scale /= 10;
            }
            ++pos;
            ++digits;
        }
        if (digits == 0) Reject(text);
    }

    long long offsetSeconds = 0;
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int offHours = 0, offMinutes = 0;
        if (!ReadDigits(text, pos, 2, offHours) || !Expect(text, pos, ':') ||
            !ReadDigits(text, pos, 2, offMinutes)) {
            Reject(text);
        }
        offsetSeconds = sign * (offHours * 3600LL + offMinutes * 60LL);
    } else {
        Reject(text);
    }
    if (pos != text.size()) Reject(text);

    long long days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    long long epochSeconds = days * 86400LL + hour * 3600LL + minute * 60LL + second - offsetSeconds;

    using namespace std::chrono;
    return domain::Timestamp(duration_cast<system_clock::duration>(seconds(epochSeconds) + nanoseconds(nanos)));
}

std::string IsoDateTime::FormatDay(domain::Timestamp t, bool localTime) {
    long long seconds = 0;
    long long nanos = 0;
    SplitSeconds(t, seconds, nanos);

    std::time_t tt = static_cast<std::time_t>(seconds);
    std::tm tm = localTime ? ToLocalTime(tt) : ToUtcTime(tt);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

} // namespace healthexport::infrastructure
