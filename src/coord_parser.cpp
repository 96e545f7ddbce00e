#include "coord_parser.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace dashgpx {
    namespace {
        // 度数符号在 UTF-8 下是 0xC2 0xB0，两个字节都放进分隔符集合
        const std::regex &coordinatePattern() {
            static const std::regex pattern(
                R"((-?\d{1,3}\.\d+)[ ,\xC2\xB0]*([NnSs])?[^0-9\-]*(-?\d{1,3}\.\d+)[ ,\xC2\xB0]*([EeWw])?)",
                std::regex::ECMAScript | std::regex::optimize);
            return pattern;
        }

        // 下溢时返回 0 或非规格化数，不抛异常
        double toDegrees(const std::ssub_match &group) {
            const std::string token = group.str();
            return std::strtod(token.c_str(), nullptr);
        }

        char hemisphereLetter(const std::ssub_match &group) {
            if (!group.matched || group.length() == 0) {
                return '\0';
            }
            return static_cast<char>(std::toupper(static_cast<unsigned char>(*group.first)));
        }
    }

    std::optional<GeoCoordinate> CoordinateParser::parse(const std::string &text) {
        // libstdc++ 的 regex 递归回溯，超长输入会栈溢出，只看前 kMaxOcrTextLength 字节
        const std::string window = text.size() > kMaxOcrTextLength ? text.substr(0, kMaxOcrTextLength) : text;

        std::smatch match;
        if (!std::regex_search(window, match, coordinatePattern())) {
            return std::nullopt;
        }

        GeoCoordinate coordinate;
        coordinate.latitude = applyHemisphere(toDegrees(match[1]), hemisphereLetter(match[2]), 'S');
        coordinate.longitude = applyHemisphere(toDegrees(match[3]), hemisphereLetter(match[4]), 'W');
        return coordinate;
    }

    double CoordinateParser::applyHemisphere(const double value, const char letter, const char negative_letter) {
        if (letter == '\0') {
            return value;
        }
        return letter == negative_letter ? -std::abs(value) : std::abs(value);
    }
} // namespace dashgpx
