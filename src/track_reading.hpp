#pragma once

#include <chrono>
#include <string>

namespace dashgpx {
    using TrackClock = std::chrono::system_clock;

    /// One timestamped coordinate candidate recovered from a single video frame.
    /// Latitude/longitude are signed decimal degrees (WGS84). A missing hemisphere
    /// letter may leave the sign wrong until the sanitizer fixes it.
    struct TrackReading {
        TrackClock::time_point timestamp;
        double latitude  = 0;
        double longitude = 0;
    };

    /// Parse a "YYYY-mm-dd HH:MM:SS" wall-clock time, interpreted as UTC.
    /// Throws std::invalid_argument on malformed input.
    TrackClock::time_point parseStartTime(const std::string &text);

    /// ISO-8601 UTC form with a trailing "Z", e.g. 2024-05-01T12:00:03Z.
    std::string formatIsoUtc(TrackClock::time_point time);

    /// Wall-clock part only (HH:MM:SS), used for progress lines.
    std::string formatClockTime(TrackClock::time_point time);

    /// Signed elapsed seconds from `from` to `to`.
    [[nodiscard]] double secondsBetween(TrackClock::time_point from, TrackClock::time_point to);
} // namespace dashgpx
