#pragma once
// Spatial Index: R-tree of (lat, lon) points tagged with record ids
//
// Every query is envelope-first: the R-tree returns candidates inside an
// axis-aligned box, then an exact test (if any) filters them.
//
//   radius  : square envelope of radius_m / 111000 degrees, then haversine
//   bbox    : the envelope itself, boundary inclusive
//   polygon : vertex bounding box, then ray casting
//
// Results come back in ascending record id order.

#include "types.hpp"
#include "geo.hpp"
#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>
#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

namespace blecube {

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

class SpatialIndex {
public:
    // Axis 0 = latitude, axis 1 = longitude
    using Point = bg::model::point<double, 2, bg::cs::cartesian>;
    using Box = bg::model::box<Point>;
    using Entry = std::pair<Point, RecordId>;
    using Tree = bgi::rtree<Entry, bgi::quadratic<16>>;

    void insert(double lat, double lon, RecordId id) {
        tree_.insert(Entry(Point(lat, lon), id));
    }

    // Points within radius_m meters of (lat, lon)
    std::vector<RecordId> radius(double lat, double lon, double radius_m) const {
        auto env = GeoEnvelope::around(lat, lon, radius_m);
        return collect(env, [&](const Entry& e) {
            return haversine_distance(lat, lon, bg::get<0>(e.first), bg::get<1>(e.first))
                   <= radius_m;
        });
    }

    std::vector<RecordId> bbox(double min_lat, double min_lon,
                               double max_lat, double max_lon) const {
        auto env = GeoEnvelope::from_corners(min_lat, min_lon, max_lat, max_lon);
        return collect(env, [](const Entry&) { return true; });
    }

    // Fewer than 3 vertices is not a polygon: empty result
    std::vector<RecordId> polygon(const std::vector<LatLon>& vertices) const {
        if (vertices.size() < 3) return {};

        auto env = GeoEnvelope::bounding(vertices);
        return collect(env, [&](const Entry& e) {
            return point_in_polygon(bg::get<0>(e.first), bg::get<1>(e.first), vertices);
        });
    }

    size_t size() const { return tree_.size(); }
    bool empty() const { return tree_.empty(); }

private:
    static Box to_box(const GeoEnvelope& env) {
        return Box(Point(env.min_lat, env.min_lon), Point(env.max_lat, env.max_lon));
    }

    template<typename Filter>
    std::vector<RecordId> collect(const GeoEnvelope& env, Filter&& keep) const {
        std::vector<Entry> candidates;
        tree_.query(bgi::intersects(to_box(env)), std::back_inserter(candidates));

        std::vector<RecordId> result;
        result.reserve(candidates.size());
        for (const auto& e : candidates) {
            if (keep(e)) {
                result.push_back(e.second);
            }
        }

        // R-tree traversal order depends on node layout, not insertion
        std::sort(result.begin(), result.end());
        return result;
    }

    Tree tree_;
};

} // namespace blecube
