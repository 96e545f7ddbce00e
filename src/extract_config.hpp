#pragma once

#include <string>

#include "track_sanitizer.hpp"

namespace dashgpx {
    /// Tesseract settings for reading the overlay strip.
    struct OcrEngineConfig {
        /// Tesseract data directory handed to the engine at init; empty uses the
        /// engine default (TESSDATA_PREFIX or the compiled-in path).
        std::string tool_path;
        std::string language = "eng";
        /// Digits, hemisphere letters, degree sign and separators.
        std::string char_whitelist = "0123456789NnSsEeWw\xC2\xB0.,-";
        /// tesseract::PageSegMode value, 6 = single uniform block of text.
        int page_segmentation_mode = 6;
    };

    /// Overlay region as fractions of the frame size, [x0, x1) x [y0, y1).
    struct OverlayRoi {
        double x0 = 0.32;
        double x1 = 0.54;
        double y0 = 0.91;
        double y1 = 1.00;

        [[nodiscard]] bool isValid() const {
            return 0.0 <= x0 && x0 < x1 && x1 <= 1.0 && 0.0 <= y0 && y0 < y1 && y1 <= 1.0;
        }
    };

    struct ExtractTuning {
        OverlayRoi roi;
        /// 采样间隔（秒），每隔这么多秒取一帧做 OCR
        int sample_interval_sec = 1;
        SanitizerLimits limits;
        OcrEngineConfig ocr;
    };

    /// Build tuning from an overlay preset ("default", "bottom-center",
    /// "bottom-left", "bottom-right"; unknown names use the default), then apply
    /// DASHGPX_* environment overrides. Throws std::invalid_argument if the
    /// resulting ROI is empty.
    ExtractTuning loadExtractTuning(const std::string &preset = "default");
} // namespace dashgpx
