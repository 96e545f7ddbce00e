#include "reading_extractor.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "coord_parser.hpp"

namespace dashgpx {
    ReadingExtractor::ReadingExtractor(TextRecognizer &recognizer, const TrackClock::time_point start)
        : recognizer_(recognizer), start_(start), last_time_(start) {
    }

    std::optional<TrackReading> ReadingExtractor::readFrame(const cv::Mat &overlay, const int second) {
        ++stats_.sampled_frames;
        const auto coordinate = CoordinateParser::parse(recognizer_.recognize(overlay));
        if (!coordinate) {
            return std::nullopt;
        }
        ++stats_.parsed_frames;

        TrackReading reading;
        reading.timestamp = start_ + std::chrono::seconds(second);
        reading.latitude = coordinate->latitude;
        reading.longitude = coordinate->longitude;
        last_time_ = reading.timestamp;
        return reading;
    }

    std::vector<TrackReading> ReadingExtractor::extract(FrameSource &source) {
        std::cout << "[Extract] extracting coordinates..." << std::endl;
        std::vector<TrackReading> readings;
        SampledFrame frame;
        while (source.next(frame)) {
            if (auto reading = readFrame(frame.overlay, frame.second)) {
                readings.push_back(*reading);
            }
            reportProgress(frame.second, source.durationSeconds());
        }
        std::cout << "\n[Extract] done: sampled=" << stats_.sampled_frames
                << ", parsed=" << stats_.parsed_frames << std::endl;
        return readings;
    }

    void ReadingExtractor::reportProgress(const int second, const double duration_sec) const {
        if (duration_sec <= 0.0) {
            return;
        }
        const double pct = second / duration_sec * 100.0;
        const int eta = static_cast<int>(duration_sec - second);
        std::ostringstream line;
        line << "\r " << std::fixed << std::setprecision(1) << std::setw(5) << pct
                << "% | video time " << formatClockTime(last_time_)
                << " | ETA " << eta << "s";
        std::cout << line.str() << std::flush;
    }
} // namespace dashgpx
