#include "run_summary.hpp"

#include <sstream>

namespace dashgpx {
    RunSummary RunSummary::from(const std::size_t total_readings, const SanitizeResult &result) {
        RunSummary summary;
        summary.total = total_readings;
        summary.corrections = result.corrections;
        summary.skipped = result.skipped;
        summary.kept = result.cleaned.size();
        return summary;
    }

    std::string RunSummary::describe() const {
        std::ostringstream oss;
        oss << "--- SUMMARY ---\n"
                << "Total extracted points: " << total << "\n"
                << "Sign corrections:       " << corrections << "\n"
                << "Skipped (bad jumps):    " << skipped << "\n"
                << "Final kept points:      " << kept << "\n"
                << "----------------\n";
        return oss.str();
    }
} // namespace dashgpx
