#include "overlay_ocr.hpp"

#include <opencv2/imgproc.hpp>

#include <iostream>
#include <memory>
#include <stdexcept>

namespace dashgpx {
    TesseractRecognizer::TesseractRecognizer(const OcrEngineConfig &config) {
        if (config.page_segmentation_mode < 0 || config.page_segmentation_mode >= tesseract::PSM_COUNT) {
            throw std::invalid_argument("invalid page segmentation mode: " +
                                        std::to_string(config.page_segmentation_mode));
        }

        const char *datapath = config.tool_path.empty() ? nullptr : config.tool_path.c_str();
        if (tesseract_.Init(datapath, config.language.c_str()) != 0) {
            throw std::runtime_error("tesseract init failed (datapath=" +
                                     (config.tool_path.empty() ? std::string("<default>") : config.tool_path) +
                                     ", lang=" + config.language + ")");
        }
        tesseract_.SetVariable("debug_file", "/dev/null");
        if (!tesseract_.SetVariable("tessedit_char_whitelist", config.char_whitelist.c_str())) {
            std::cerr << "[OCR] whitelist not accepted by this tesseract build" << std::endl;
        }
        tesseract_.SetPageSegMode(static_cast<tesseract::PageSegMode>(config.page_segmentation_mode));

        std::cout << "[OCR] tesseract " << tesseract::TessBaseAPI::Version()
                << ", lang=" << config.language
                << ", psm=" << config.page_segmentation_mode << std::endl;
    }

    TesseractRecognizer::~TesseractRecognizer() {
        tesseract_.End();
    }

    std::string TesseractRecognizer::recognize(const cv::Mat &image) {
        if (image.empty()) {
            return {};
        }

        cv::Mat gray;
        if (image.channels() == 3) {
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
        } else if (image.channels() == 4) {
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
        } else {
            gray = image;
        }
        if (gray.depth() != CV_8U) {
            gray.convertTo(gray, CV_8U);
        }

        tesseract_.SetImage(gray.data, gray.cols, gray.rows,
                            static_cast<int>(gray.elemSize()), static_cast<int>(gray.step1()));
        const std::unique_ptr<char[]> text(tesseract_.GetUTF8Text());
        return text ? std::string(text.get()) : std::string();
    }
} // namespace dashgpx
