#include "track_sanitizer.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "geo_math.hpp"

namespace dashgpx {
    namespace {
        bool isUnitSign(const int sign) {
            return sign == 1 || sign == -1;
        }

        bool disagrees(const double value, const int expected_sign, const double ambiguity_deg) {
            return std::abs(value) > ambiguity_deg && value * expected_sign < 0;
        }
    }

    TrackSanitizer::TrackSanitizer(const HemisphereSigns signs, const SanitizerLimits limits)
        : signs_(signs), limits_(limits) {
        if (!isUnitSign(signs_.latitude) || !isUnitSign(signs_.longitude)) {
            throw std::invalid_argument("hemisphere signs must be +1 or -1");
        }
        if (!(limits_.max_speed_kmh > 0.0)) {
            throw std::invalid_argument("max speed must be positive");
        }
        if (limits_.sign_ambiguity_deg < 0.0) {
            throw std::invalid_argument("sign ambiguity limit must not be negative");
        }
    }

    SanitizeResult TrackSanitizer::sanitize(const std::vector<TrackReading> &readings) const {
        SanitizeAccumulator acc;
        acc.cleaned.reserve(readings.size());
        for (const auto &reading: readings) {
            step(acc, reading);
        }

        std::cout << "[Sanity] done: input=" << readings.size()
                << ", kept=" << acc.cleaned.size()
                << ", corrections=" << acc.corrections
                << ", skipped=" << acc.skipped << std::endl;
        return {std::move(acc.cleaned), acc.corrections, acc.skipped};
    }

    StepVerdict TrackSanitizer::step(SanitizeAccumulator &acc, const TrackReading &reading) const {
        TrackReading corrected = reading;
        if (correctSign(corrected).any()) {
            ++acc.corrections;
        }

        if (acc.state() == AnchorState::HasAnchor && !isPlausibleMove(*acc.anchor, corrected)) {
            ++acc.skipped;
            return StepVerdict::Rejected;
        }

        acc.cleaned.push_back(corrected);
        acc.anchor = corrected;
        return StepVerdict::Accepted;
    }

    SignCorrection TrackSanitizer::correctSign(TrackReading &reading) const {
        SignCorrection flipped;
        if (disagrees(reading.latitude, signs_.latitude, limits_.sign_ambiguity_deg)) {
            reading.latitude = -reading.latitude;
            flipped.latitude = true;
        }
        if (disagrees(reading.longitude, signs_.longitude, limits_.sign_ambiguity_deg)) {
            reading.longitude = -reading.longitude;
            flipped.longitude = true;
        }
        return flipped;
    }

    bool TrackSanitizer::isPlausibleMove(const TrackReading &anchor, const TrackReading &reading) const {
        const double dt = secondsBetween(anchor.timestamp, reading.timestamp);
        // 时间戳重复或倒序时不做速度判断，直接保留
        if (dt <= 0.0) {
            return true;
        }
        const double distance = haversineMeters(anchor.latitude, anchor.longitude,
                                                reading.latitude, reading.longitude);
        return impliedSpeedKmh(distance, dt) <= limits_.max_speed_kmh;
    }
} // namespace dashgpx
