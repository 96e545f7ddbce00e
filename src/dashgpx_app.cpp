#include "dashgpx_app.hpp"

#include <opencv2/core/utils/logging.hpp>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "extract_config.hpp"
#include "frame_sampler.hpp"
#include "gpx_writer.hpp"
#include "overlay_ocr.hpp"
#include "reading_extractor.hpp"
#include "run_summary.hpp"
#include "track_sanitizer.hpp"

namespace fs = std::filesystem;

namespace dashgpx {
    namespace {
        void logRuntimeOptions(const AppOptions &options, const ExtractTuning &tuning,
                               const std::string &output_path) {
            std::cout << "[Main] video: " << options.video_path << std::endl;
            std::cout << "[Main] start: " << options.start_time
                    << ", hemisphere: " << (options.south ? "S" : "N") << (options.west ? "W" : "E") << std::endl;
            std::cout << "[Main] output: " << output_path << std::endl;
            std::cout << "[Main] params: preset=" << options.preset
                    << ", roi=[" << tuning.roi.x0 << "," << tuning.roi.x1 << ")x["
                    << tuning.roi.y0 << "," << tuning.roi.y1 << ")"
                    << ", interval=" << tuning.sample_interval_sec << "s"
                    << ", max_speed=" << tuning.limits.max_speed_kmh << "km/h"
                    << ", sign_ambiguity=" << tuning.limits.sign_ambiguity_deg << "deg" << std::endl;
        }
    }

    std::string defaultOutputPath(const std::string &video_path) {
        return fs::path(video_path).replace_extension(".gpx").string();
    }

    int runDashcamGpx(const AppOptions &options) {
        cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_SILENT);

        try {
            if (options.video_path.empty()) {
                throw std::invalid_argument("no video selected");
            }
            const auto start = parseStartTime(options.start_time);
            const ExtractTuning tuning = loadExtractTuning(options.preset);
            const std::string output_path =
                    options.output_path.empty() ? defaultOutputPath(options.video_path) : options.output_path;
            logRuntimeOptions(options, tuning, output_path);

            const HemisphereSigns signs{options.south ? -1 : 1, options.west ? -1 : 1};
            const TrackSanitizer sanitizer(signs, tuning.limits);

            VideoFrameSampler sampler(options.video_path, tuning.roi, tuning.sample_interval_sec);
            TesseractRecognizer recognizer(tuning.ocr);
            ReadingExtractor extractor(recognizer, start);

            std::cout << "\n[STEP 1] Extracting coordinates..." << std::endl;
            const std::vector<TrackReading> readings = extractor.extract(sampler);

            std::cout << "\n[STEP 2] Sanity check..." << std::endl;
            const SanitizeResult result = sanitizer.sanitize(readings);

            std::cout << "[STEP 3] Writing GPX with " << result.cleaned.size() << " points..." << std::endl;
            GpxWriter::write(result.cleaned, output_path);

            std::cout << "\n[Finish] GPX saved to " << output_path << std::endl;
            std::cout << RunSummary::from(readings.size(), result).describe();
        } catch (const std::exception &e) {
            std::cerr << "[Error] " << e.what() << std::endl;
            return 1;
        }
        return 0;
    }
} // namespace dashgpx
