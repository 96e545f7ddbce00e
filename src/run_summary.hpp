#pragma once

#include <cstddef>
#include <string>

#include "track_sanitizer.hpp"

namespace dashgpx {
    struct RunSummary {
        std::size_t total = 0;
        int corrections = 0;
        int skipped = 0;
        std::size_t kept = 0;

        static RunSummary from(std::size_t total_readings, const SanitizeResult &result);

        /// Multi-line human-readable block.
        [[nodiscard]] std::string describe() const;
    };
} // namespace dashgpx
