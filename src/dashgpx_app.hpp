#pragma once

#include <string>

namespace dashgpx {
    struct AppOptions {
        std::string video_path;
        /// "YYYY-mm-dd HH:MM:SS" of the first frame, UTC.
        std::string start_time;
        bool south = false;
        bool west = false;
        /// Empty: video path with a .gpx extension.
        std::string output_path;
        std::string preset = "default";
    };

    std::string defaultOutputPath(const std::string &video_path);

    /// Full video -> GPX run. Returns the process exit code; errors are logged,
    /// not thrown.
    int runDashcamGpx(const AppOptions &options);
} // namespace dashgpx
