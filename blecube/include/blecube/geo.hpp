#pragma once
// Geometry helpers for spatial queries
//
// Coordinates are (lat, lon) in degrees on a spherical Earth.
// Envelopes are axis-aligned in degree space; they only prune candidates
// before an exact test (haversine distance or ray casting).

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace blecube {

constexpr double EARTH_RADIUS_M = 6371000.0;

// Meters per degree of latitude. Applied to longitude too: the radius
// envelope does not widen with latitude.
constexpr double METERS_PER_DEGREE = 111000.0;

constexpr double PI = 3.14159265358979323846;

struct LatLon {
    double lat;
    double lon;
};

inline double deg_to_rad(double deg) {
    return deg * (PI / 180.0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Envelopes
// ═══════════════════════════════════════════════════════════════════════════

struct GeoEnvelope {
    double min_lat;
    double min_lon;
    double max_lat;
    double max_lon;

    // Corners in any order; normalized per axis
    static GeoEnvelope from_corners(double lat1, double lon1, double lat2, double lon2) {
        return {std::min(lat1, lat2), std::min(lon1, lon2),
                std::max(lat1, lat2), std::max(lon1, lon2)};
    }

    // Square of half-width radius_m / METERS_PER_DEGREE around a centre
    static GeoEnvelope around(double lat, double lon, double radius_m) {
        double radius_deg = radius_m / METERS_PER_DEGREE;
        return from_corners(lat - radius_deg, lon - radius_deg,
                            lat + radius_deg, lon + radius_deg);
    }

    // Bounding box of a vertex list (caller guarantees non-empty)
    static GeoEnvelope bounding(const std::vector<LatLon>& vertices) {
        GeoEnvelope env{std::numeric_limits<double>::max(),
                        std::numeric_limits<double>::max(),
                        std::numeric_limits<double>::lowest(),
                        std::numeric_limits<double>::lowest()};
        for (const auto& v : vertices) {
            env.min_lat = std::min(env.min_lat, v.lat);
            env.min_lon = std::min(env.min_lon, v.lon);
            env.max_lat = std::max(env.max_lat, v.lat);
            env.max_lon = std::max(env.max_lon, v.lon);
        }
        return env;
    }

    // Boundary inclusive
    bool contains(double lat, double lon) const {
        return lat >= min_lat && lat <= max_lat &&
               lon >= min_lon && lon <= max_lon;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Exact tests
// ═══════════════════════════════════════════════════════════════════════════

// Great-circle distance in meters
inline double haversine_distance(double lat1, double lon1, double lat2, double lon2) {
    double lat1_rad = deg_to_rad(lat1);
    double lat2_rad = deg_to_rad(lat2);
    double dlat = deg_to_rad(lat2 - lat1);
    double dlon = deg_to_rad(lon2 - lon1);

    double sin_dlat = std::sin(dlat / 2.0);
    double sin_dlon = std::sin(dlon / 2.0);
    double a = sin_dlat * sin_dlat +
               std::cos(lat1_rad) * std::cos(lat2_rad) * sin_dlon * sin_dlon;
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return EARTH_RADIUS_M * c;
}

// Ray casting along the latitude axis. Each edge whose longitude span
// straddles the point toggles the flag when the point lies below the
// crossing. Simple polygons only; degenerate edges give no defined answer.
inline bool point_in_polygon(double lat, double lon, const std::vector<LatLon>& polygon) {
    bool inside = false;
    size_t n = polygon.size();
    if (n == 0) return false;

    size_t j = n - 1;
    for (size_t i = 0; i < n; ++i) {
        const LatLon& pi = polygon[i];
        const LatLon& pj = polygon[j];

        if (((pi.lon > lon) != (pj.lon > lon)) &&
            (lat < (pj.lat - pi.lat) * (lon - pi.lon) / (pj.lon - pi.lon) + pi.lat)) {
            inside = !inside;
        }
        j = i;
    }

    return inside;
}

} // namespace blecube
