#ifndef NEWSFEED_CORE_TIMESTAMP_HPP
#define NEWSFEED_CORE_TIMESTAMP_HPP

#include <chrono>
#include <optional>
#include <string>

namespace newsfeed {
namespace core {

using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

// A point in time together with the fixed UTC offset it was written in.
// Nanosecond precision limits the accepted years to 1700..2200; both parsers
// return nothing for dates outside that range.
struct Timestamp {
    TimePoint instant;
    std::chrono::seconds offset{0};

    // "Tue, 02 Jan 2024 10:00:00 +0000". GMT, UT, UTC and Z count as +0000.
    static std::optional<Timestamp> parseRfc822(const std::string& text);

    // "2023-05-01T08:00:00+00:00", optional fraction, Z or +-HH:MM offset.
    static std::optional<Timestamp> parseIso8601(const std::string& text);

    // Inverse of parseIso8601; keeps the offset and any sub-second part.
    std::string toIso8601() const;

    // Chronological comparison, offsets ignored.
    bool isBefore(const Timestamp& other) const { return instant < other.instant; }

    // Same instant written with the same offset.
    bool operator==(const Timestamp& other) const {
        return instant == other.instant && offset == other.offset;
    }
    bool operator!=(const Timestamp& other) const { return !(*this == other); }
};

} // namespace core
} // namespace newsfeed

#endif // NEWSFEED_CORE_TIMESTAMP_HPP
