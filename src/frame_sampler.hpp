#pragma once

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <string>

#include "extract_config.hpp"

namespace dashgpx {
    /// One sampled frame: whole seconds from the start of the video and the
    /// binarized overlay crop.
    struct SampledFrame {
        int second = 0;
        cv::Mat overlay;
    };

    /// Source of overlay crops in chronological order.
    class FrameSource {
    public:
        virtual ~FrameSource() = default;

        /// false once the source is exhausted or a frame can no longer be decoded.
        virtual bool next(SampledFrame &frame) = 0;

        [[nodiscard]] virtual double durationSeconds() const = 0;
    };

    /// Pixel rectangle of `roi` inside a frame of `frame_size`. Throws
    /// std::runtime_error if it collapses to zero area.
    cv::Rect roiToPixels(const OverlayRoi &roi, const cv::Size &frame_size);

    /// Crop, grayscale, Otsu-binarize.
    cv::Mat binarizeOverlay(const cv::Mat &frame, const cv::Rect &roi);

    /// Seeks through a video file one sample interval at a time and yields the
    /// binarized overlay crop of each sampled frame.
    class VideoFrameSampler final : public FrameSource {
    public:
        /// Opens the video and computes the crop rectangle from its first frame.
        /// Throws std::runtime_error if the file cannot be opened or decoded.
        VideoFrameSampler(const std::string &video_path, const OverlayRoi &roi, int interval_sec = 1);

        bool next(SampledFrame &frame) override;

        [[nodiscard]] double durationSeconds() const override { return duration_sec_; }
        [[nodiscard]] double fps() const { return fps_; }
        [[nodiscard]] const cv::Rect &roiRect() const { return roi_rect_; }

    private:
        cv::VideoCapture capture_;
        double fps_ = 0;
        double duration_sec_ = 0;
        int interval_sec_ = 1;
        int next_second_ = 0;
        cv::Rect roi_rect_;
    };
} // namespace dashgpx
