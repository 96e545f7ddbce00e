#include "extract_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace dashgpx {
    namespace {
        std::string normalizePreset(const std::string &preset) {
            std::string normalized;
            normalized.reserve(preset.size());
            for (const unsigned char c: preset) {
                if (std::isalnum(c)) {
                    normalized.push_back(static_cast<char>(std::tolower(c)));
                }
            }
            return normalized;
        }

        int envIntOr(const char *name, const int default_value, const int min_value, const int max_value) {
            const char *value = std::getenv(name);
            if (!value) {
                return default_value;
            }
            char *end = nullptr;
            const long parsed = std::strtol(value, &end, 10);
            if (end == value || *end != '\0') {
                return default_value;
            }
            return static_cast<int>(std::clamp<long>(parsed, min_value, max_value));
        }

        double envDoubleOr(const char *name, const double default_value, const double min_value,
                           const double max_value) {
            const char *value = std::getenv(name);
            if (!value) {
                return default_value;
            }
            char *end = nullptr;
            const double parsed = std::strtod(value, &end);
            if (end == value || *end != '\0') {
                return default_value;
            }
            return std::clamp(parsed, min_value, max_value);
        }

        std::string envStringOr(const char *name, const std::string &default_value) {
            const char *value = std::getenv(name);
            if (!value || *value == '\0') {
                return default_value;
            }
            return value;
        }

        void applyBottomCenterPreset(ExtractTuning &tuning) {
            tuning.roi = {0.32, 0.54, 0.91, 1.00};
        }

        void applyBottomLeftPreset(ExtractTuning &tuning) {
            tuning.roi = {0.00, 0.30, 0.91, 1.00};
        }

        void applyBottomRightPreset(ExtractTuning &tuning) {
            tuning.roi = {0.62, 1.00, 0.91, 1.00};
        }

        void applyEnvOverrides(ExtractTuning &tuning) {
            tuning.roi.x0 = envDoubleOr("DASHGPX_ROI_X0", tuning.roi.x0, 0.0, 1.0);
            tuning.roi.x1 = envDoubleOr("DASHGPX_ROI_X1", tuning.roi.x1, 0.0, 1.0);
            tuning.roi.y0 = envDoubleOr("DASHGPX_ROI_Y0", tuning.roi.y0, 0.0, 1.0);
            tuning.roi.y1 = envDoubleOr("DASHGPX_ROI_Y1", tuning.roi.y1, 0.0, 1.0);
            tuning.sample_interval_sec = envIntOr("DASHGPX_SAMPLE_INTERVAL", tuning.sample_interval_sec, 1, 3600);

            tuning.limits.max_speed_kmh =
                    envDoubleOr("DASHGPX_MAX_SPEED_KMH", tuning.limits.max_speed_kmh, 1.0, 100000.0);
            tuning.limits.sign_ambiguity_deg =
                    envDoubleOr("DASHGPX_SIGN_AMBIGUITY_DEG", tuning.limits.sign_ambiguity_deg, 0.0, 90.0);

            tuning.ocr.tool_path = envStringOr("DASHGPX_TESSDATA", tuning.ocr.tool_path);
            tuning.ocr.language = envStringOr("DASHGPX_OCR_LANG", tuning.ocr.language);
            tuning.ocr.char_whitelist = envStringOr("DASHGPX_OCR_WHITELIST", tuning.ocr.char_whitelist);
            tuning.ocr.page_segmentation_mode =
                    envIntOr("DASHGPX_OCR_PSM", tuning.ocr.page_segmentation_mode, 0, 13);
        }
    }

    ExtractTuning loadExtractTuning(const std::string &preset) {
        ExtractTuning tuning;

        const std::string normalized = normalizePreset(preset);
        if (normalized == "bottomleft" || normalized == "left") {
            applyBottomLeftPreset(tuning);
        } else if (normalized == "bottomright" || normalized == "right") {
            applyBottomRightPreset(tuning);
        } else {
            // default / bottom-center / 未识别的名字
            applyBottomCenterPreset(tuning);
        }

        applyEnvOverrides(tuning);

        if (!tuning.roi.isValid()) {
            throw std::invalid_argument("overlay ROI is empty, check DASHGPX_ROI_* overrides");
        }
        return tuning;
    }
} // namespace dashgpx
