#include "frame_sampler.hpp"

#include <opencv2/imgproc.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace dashgpx {
    cv::Rect roiToPixels(const OverlayRoi &roi, const cv::Size &frame_size) {
        const int x1 = static_cast<int>(frame_size.width * roi.x0);
        const int x2 = static_cast<int>(frame_size.width * roi.x1);
        const int y1 = static_cast<int>(frame_size.height * roi.y0);
        const int y2 = static_cast<int>(frame_size.height * roi.y1);

        const cv::Rect rect = cv::Rect(x1, y1, x2 - x1, y2 - y1) & cv::Rect(0, 0, frame_size.width, frame_size.height);
        if (rect.area() <= 0) {
            throw std::runtime_error("overlay ROI is empty for frame " +
                                     std::to_string(frame_size.width) + "x" + std::to_string(frame_size.height));
        }
        return rect;
    }

    cv::Mat binarizeOverlay(const cv::Mat &frame, const cv::Rect &roi) {
        const cv::Mat crop = frame(roi);

        cv::Mat gray;
        if (crop.channels() == 3) {
            cv::cvtColor(crop, gray, cv::COLOR_BGR2GRAY);
        } else if (crop.channels() == 4) {
            cv::cvtColor(crop, gray, cv::COLOR_BGRA2GRAY);
        } else {
            gray = crop.clone();
        }

        cv::Mat thresh;
        cv::threshold(gray, thresh, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
        return thresh;
    }

    VideoFrameSampler::VideoFrameSampler(const std::string &video_path, const OverlayRoi &roi, const int interval_sec)
        : interval_sec_(interval_sec) {
        if (interval_sec_ < 1) {
            throw std::invalid_argument("sample interval must be at least 1 second");
        }
        if (!capture_.open(video_path)) {
            throw std::runtime_error("cannot open video: " + video_path);
        }

        fps_ = capture_.get(cv::CAP_PROP_FPS);
        if (fps_ <= 0.0) {
            throw std::runtime_error("video reports no frame rate: " + video_path);
        }
        const auto total_frames = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_COUNT));
        duration_sec_ = total_frames / fps_;
        std::ostringstream info;
        info << std::fixed << std::setprecision(1) << duration_sec_ << "s | FPS: " << std::setprecision(2) << fps_;
        std::cout << "[Video] duration: " << info.str() << std::endl;

        cv::Mat first;
        if (!capture_.read(first) || first.empty()) {
            throw std::runtime_error("could not read video frame: " + video_path);
        }
        roi_rect_ = roiToPixels(roi, first.size());
        std::cout << "[Video] overlay ROI: x=" << roi_rect_.x << ", y=" << roi_rect_.y
                << ", w=" << roi_rect_.width << ", h=" << roi_rect_.height << std::endl;
    }

    bool VideoFrameSampler::next(SampledFrame &frame) {
        if (next_second_ >= static_cast<int>(duration_sec_)) {
            return false;
        }

        capture_.set(cv::CAP_PROP_POS_FRAMES, static_cast<int>(next_second_ * fps_));
        cv::Mat decoded;
        if (!capture_.read(decoded) || decoded.empty()) {
            std::cout << "\n[Video] frame read failed at " << next_second_ << "s, stop sampling" << std::endl;
            next_second_ = static_cast<int>(duration_sec_);
            return false;
        }
        if ((roi_rect_ & cv::Rect(0, 0, decoded.cols, decoded.rows)) != roi_rect_) {
            throw std::runtime_error("frame size changed mid-video at " + std::to_string(next_second_) + "s");
        }

        frame.second = next_second_;
        frame.overlay = binarizeOverlay(decoded, roi_rect_);
        next_second_ += interval_sec_;
        return true;
    }
} // namespace dashgpx
