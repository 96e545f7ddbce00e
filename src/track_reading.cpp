#include "track_reading.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace dashgpx {
    namespace {
        std::tm toUtcTm(const TrackClock::time_point time) {
            const std::time_t seconds = TrackClock::to_time_t(time);
            std::tm tm{};
            if (gmtime_r(&seconds, &tm) == nullptr) {
                throw std::runtime_error("timestamp out of range");
            }
            return tm;
        }
    }

    TrackClock::time_point parseStartTime(const std::string &text) {
        std::tm tm{};
        std::istringstream iss(text);
        iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (iss.fail()) {
            throw std::invalid_argument("start time must be 'YYYY-mm-dd HH:MM:SS': " + text);
        }
        // 尾部只允许空白
        iss >> std::ws;
        if (!iss.eof()) {
            throw std::invalid_argument("trailing characters after start time: " + text);
        }
        tm.tm_isdst = 0;
        const std::time_t seconds = timegm(&tm);
        if (seconds == static_cast<std::time_t>(-1)) {
            throw std::invalid_argument("start time out of range: " + text);
        }
        return TrackClock::from_time_t(seconds);
    }

    std::string formatIsoUtc(const TrackClock::time_point time) {
        const std::tm tm = toUtcTm(time);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    std::string formatClockTime(const TrackClock::time_point time) {
        const std::tm tm = toUtcTm(time);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%H:%M:%S");
        return oss.str();
    }

    double secondsBetween(const TrackClock::time_point from, const TrackClock::time_point to) {
        return std::chrono::duration<double>(to - from).count();
    }
} // namespace dashgpx
