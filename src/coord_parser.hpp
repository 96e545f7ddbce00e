#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace dashgpx {
    /// Only this many leading bytes of OCR text are searched. An overlay strip
    /// yields a few dozen characters; anything longer is noise.
    constexpr std::size_t kMaxOcrTextLength = 4096;

    /// Latitude/longitude pair in signed decimal degrees.
    struct GeoCoordinate {
        double latitude  = 0;
        double longitude = 0;
    };

    /// Extracts a coordinate pair from raw OCR text of the dashcam overlay.
    ///
    /// Accepted shape: "<lat>[sep][N|S] ... <lon>[sep][E|W]", where each number is
    /// a signed decimal with 1-3 integer digits and sep is any run of spaces,
    /// commas or degree signs. The first number is always latitude.
    /// A hemisphere letter overrides whatever sign OCR produced; without one the
    /// raw sign is kept.
    class CoordinateParser {
    public:
        /// nullopt when no coordinate-shaped substring exists in `text`.
        [[nodiscard]] static std::optional<GeoCoordinate> parse(const std::string &text);

    private:
        static double applyHemisphere(double value, char letter, char negative_letter);
    };
} // namespace dashgpx
