#include "geo_math.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace dashgpx {
    double degreeToRadian(const double degree) {
        return degree * std::numbers::pi / 180.0;
    }

    double haversineMeters(const double lat1, const double lon1, const double lat2, const double lon2) {
        const double phi1 = degreeToRadian(lat1);
        const double phi2 = degreeToRadian(lat2);
        const double dphi = degreeToRadian(lat2 - lat1);
        const double dlambda = degreeToRadian(lon2 - lon1);

        const double s_phi = std::sin(dphi / 2.0);
        const double s_lambda = std::sin(dlambda / 2.0);
        // 近对跖点时舍入误差可能让 a 略大于 1
        const double a = std::min(1.0, s_phi * s_phi + std::cos(phi1) * std::cos(phi2) * s_lambda * s_lambda);
        return kEarthRadiusMeters * 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    }

    double impliedSpeedKmh(const double distance_m, const double dt_sec) {
        return distance_m / dt_sec * kMpsToKmh;
    }
} // namespace dashgpx
