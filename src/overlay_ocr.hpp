#pragma once

#include <opencv2/core.hpp>

#include <tesseract/baseapi.h>

#include <string>

#include "extract_config.hpp"

namespace dashgpx {
    /// Turns a small binarized overlay image into raw text.
    class TextRecognizer {
    public:
        virtual ~TextRecognizer() = default;

        virtual std::string recognize(const cv::Mat &image) = 0;
    };

    /// Tesseract-backed recognizer. Holds one engine handle; not safe to share
    /// across threads.
    class TesseractRecognizer final : public TextRecognizer {
    public:
        /// Throws std::runtime_error if the engine fails to initialize for the
        /// configured data path and language.
        explicit TesseractRecognizer(const OcrEngineConfig &config);
        ~TesseractRecognizer() override;

        TesseractRecognizer(const TesseractRecognizer &) = delete;
        TesseractRecognizer &operator=(const TesseractRecognizer &) = delete;

        std::string recognize(const cv::Mat &image) override;

    private:
        tesseract::TessBaseAPI tesseract_;
    };
} // namespace dashgpx
