#pragma once

#include <optional>
#include <vector>

#include "track_reading.hpp"

namespace dashgpx {
    /// Implied ground speed above which a reading is treated as an OCR outlier.
    constexpr double kDefaultMaxSpeedKmh = 300.0;
    /// Coordinates within this many degrees of zero keep whatever sign they have.
    constexpr double kDefaultSignAmbiguityDeg = 1.0;

    /// Hemisphere the whole recording is declared to lie in: +1 north/east, -1 south/west.
    struct HemisphereSigns {
        int latitude  = 1;
        int longitude = 1;
    };

    struct SanitizerLimits {
        double max_speed_kmh = kDefaultMaxSpeedKmh;
        double sign_ambiguity_deg = kDefaultSignAmbiguityDeg;
    };

    enum class AnchorState {
        NoAnchor,
        HasAnchor
    };

    enum class StepVerdict {
        Accepted,
        Rejected
    };

    /// Which axes a sign correction flipped.
    struct SignCorrection {
        bool latitude  = false;
        bool longitude = false;

        [[nodiscard]] bool any() const { return latitude || longitude; }
    };

    /// Fold state threaded through TrackSanitizer::step. `anchor` is the last
    /// accepted reading; it only moves when a reading is accepted.
    struct SanitizeAccumulator {
        std::optional<TrackReading> anchor;
        std::vector<TrackReading> cleaned;
        int corrections = 0;
        int skipped = 0;

        [[nodiscard]] AnchorState state() const {
            return anchor.has_value() ? AnchorState::HasAnchor : AnchorState::NoAnchor;
        }
    };

    struct SanitizeResult {
        std::vector<TrackReading> cleaned;
        int corrections = 0;
        int skipped = 0;
    };

    /// Cleans a chronologically ordered reading sequence: forces the declared
    /// hemisphere signs onto unambiguous coordinates and drops readings whose
    /// implied speed from the last accepted reading is implausible.
    /// Every input reading ends up either in `cleaned` or counted in `skipped`.
    class TrackSanitizer {
    public:
        /// Throws std::invalid_argument unless both signs are +1 or -1 and the
        /// limits are positive.
        explicit TrackSanitizer(HemisphereSigns signs, SanitizerLimits limits = {});

        [[nodiscard]] SanitizeResult sanitize(const std::vector<TrackReading> &readings) const;

        /// Process one reading against the accumulator. Sign correction is applied
        /// in both anchor states; the speed check only runs in HasAnchor with dt > 0.
        StepVerdict step(SanitizeAccumulator &acc, const TrackReading &reading) const;

        /// Flip the sign of each axis whose magnitude exceeds the ambiguity limit
        /// and disagrees with the expected hemisphere. Modifies `reading` in place.
        SignCorrection correctSign(TrackReading &reading) const;

        [[nodiscard]] bool isPlausibleMove(const TrackReading &anchor, const TrackReading &reading) const;

        [[nodiscard]] const HemisphereSigns &signs() const { return signs_; }
        [[nodiscard]] const SanitizerLimits &limits() const { return limits_; }

    private:
        HemisphereSigns signs_;
        SanitizerLimits limits_;
    };
} // namespace dashgpx
