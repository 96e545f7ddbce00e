#pragma once

#include <string>
#include <vector>

#include "track_reading.hpp"

namespace dashgpx {
    /// GPX 1.1 serialization: one track, one segment, one trkpt per reading with
    /// lat/lon at 6 decimals and a UTC <time>.
    class GpxWriter {
    public:
        [[nodiscard]] static std::string format(const std::vector<TrackReading> &points);

        /// Throws std::runtime_error if `gpx_path` cannot be written.
        static void write(const std::vector<TrackReading> &points, const std::string &gpx_path);
    };
} // namespace dashgpx
