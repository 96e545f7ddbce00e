#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <vector>

#include "frame_sampler.hpp"
#include "overlay_ocr.hpp"
#include "track_reading.hpp"

namespace dashgpx {
    struct ExtractionStats {
        int sampled_frames = 0;
        int parsed_frames = 0;
    };

    /// Drives recognizer + parser over sampled frames. Frame N seconds into the
    /// video is stamped start + N seconds; frames without a parsable coordinate
    /// produce no reading.
    class ReadingExtractor {
    public:
        ReadingExtractor(TextRecognizer &recognizer, TrackClock::time_point start);

        [[nodiscard]] std::optional<TrackReading> readFrame(const cv::Mat &overlay, int second);

        /// Raw readings in chronological order.
        std::vector<TrackReading> extract(FrameSource &source);

        [[nodiscard]] const ExtractionStats &stats() const { return stats_; }

    private:
        void reportProgress(int second, double duration_sec) const;

        TextRecognizer &recognizer_;
        TrackClock::time_point start_;
        TrackClock::time_point last_time_;
        ExtractionStats stats_;
    };
} // namespace dashgpx
