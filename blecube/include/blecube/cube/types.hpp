#pragma once
// Cube types: configuration, statistics and query predicates
//
// Kept apart from cube.hpp so tools can build queries without pulling
// in the index headers.

#include "../types.hpp"
#include <optional>

namespace blecube {

// Cube configuration. Capacity hints never change query results.
struct CubeConfig {
    size_t expected_records = 0;   // Record store reserve
    size_t expected_macs = 0;      // MAC bucket reserve (0 = expected_records / 100)
    bool verbose = false;          // Turn on debug logging
};

// Snapshot of index sizes
struct CubeStats {
    size_t records = 0;
    size_t distinct_macs = 0;
    size_t distinct_rssi = 0;
    size_t distinct_timestamps = 0;
    size_t spatial_entries = 0;
};

// Inclusive [min, max]
struct RssiRange {
    Rssi min;
    Rssi max;
};

// Inclusive [start, end]
struct TimeRange {
    Timestamp start;
    Timestamp end;
};

struct GeoRadius {
    double lat;
    double lon;
    double radius_m;
};

// Conjunctive query; an unset field does not filter
struct MultiQuery {
    std::optional<MacAddress> mac;
    std::optional<RssiRange> rssi;
    std::optional<TimeRange> time;
    std::optional<GeoRadius> geo;

    bool unfiltered() const { return !mac && !rssi && !time && !geo; }
};

} // namespace blecube
