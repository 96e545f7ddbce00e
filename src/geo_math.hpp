#pragma once

namespace dashgpx {
    /// Mean Earth radius used for great-circle distances (meters).
    constexpr double kEarthRadiusMeters = 6371000.0;

    /// m/s -> km/h
    constexpr double kMpsToKmh = 3.6;

    double degreeToRadian(double degree);

    /// Great-circle surface distance in meters (haversine on a sphere of
    /// kEarthRadiusMeters). Inputs are decimal degrees.
    double haversineMeters(double lat1, double lon1, double lat2, double lon2);

    /// Ground speed in km/h implied by covering `distance_m` in `dt_sec` seconds.
    /// Caller guarantees dt_sec > 0.
    double impliedSpeedKmh(double distance_m, double dt_sec);
} // namespace dashgpx
