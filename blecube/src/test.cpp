#include <blecube/blecube.hpp>
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <random>
#include <set>
#include <sstream>
#include <vector>

using namespace blecube;

const MacAddress MAC_A{{0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF}};
const MacAddress MAC_B{{0x11, 0x22, 0x33, 0x44, 0x55, 0x66}};
const MacAddress MAC_ZERO{};

// Observation at the origin; timestamp doubles as a label
Observation obs_at(Rssi rssi, Timestamp t, const MacAddress& mac = MAC_ZERO,
                   double lat = 0.0, double lon = 0.0) {
    Observation o;
    o.rssi = rssi;
    o.mac = mac;
    o.timestamp = t;
    o.lat = lat;
    o.lon = lon;
    return o;
}

std::vector<Timestamp> labels(const std::vector<Observation>& results) {
    std::vector<Timestamp> out;
    for (const auto& o : results) out.push_back(o.timestamp);
    return out;
}

void test_mac_address() {
    std::cout << "Testing MacAddress..." << std::endl;

    assert(MAC_A.to_string() == "AA:BB:CC:DD:EE:FF");

    auto parsed = MacAddress::from_string("aa:bb:cc:dd:ee:ff");
    assert(parsed.has_value());
    assert(*parsed == MAC_A);

    auto dashed = MacAddress::from_string("11-22-33-44-55-66");
    assert(dashed.has_value());
    assert(*dashed == MAC_B);

    assert(!MacAddress::from_string("AA:BB:CC:DD:EE").has_value());
    assert(!MacAddress::from_string("AA:BB:CC:DD:EE:GG").has_value());
    assert(!MacAddress::from_string("AA.BB.CC.DD.EE.FF").has_value());

    assert(MAC_ZERO < MAC_B);
    assert(MAC_B < MAC_A);
    assert(MacAddressHash{}(MAC_A) == MacAddressHash{}(*parsed));

    std::cout << "  PASS" << std::endl;
}

void test_insert_get() {
    std::cout << "Testing insert/get..." << std::endl;

    BleCube cube;
    assert(cube.empty());
    assert(cube.size() == 0);
    assert(!cube.get(0).has_value());

    std::vector<Observation> inserted = {
        obs_at(-65, 1700000000, MAC_A, 37.7749, -122.4194),
        obs_at(-72, 1700000100, MAC_A, 37.7750, -122.4195),
        obs_at(-80, 1700000200, MAC_B, 37.8044, -122.2712),
        // Out-of-range values are stored as-is
        obs_at(127, -5, MAC_ZERO, 123.0, -400.0),
    };

    for (size_t i = 0; i < inserted.size(); ++i) {
        RecordId id = cube.insert(inserted[i]);
        assert(id == i);
    }

    assert(!cube.empty());
    assert(cube.size() == inserted.size());

    for (size_t i = 0; i < inserted.size(); ++i) {
        auto record = cube.get(static_cast<RecordId>(i));
        assert(record.has_value());
        assert(*record == inserted[i]);
    }

    // Out of range is absence, not an error
    assert(!cube.get(4).has_value());
    assert(!cube.get(std::numeric_limits<RecordId>::max()).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_record_store() {
    std::cout << "Testing RecordStore..." << std::endl;

    RecordStore store;
    assert(store.insert(obs_at(-60, 10)) == 0);
    assert(store.insert(obs_at(-61, 11)) == 1);
    assert(store.size() == 2);

    // Unknown ids are skipped, order of the rest is kept
    auto resolved = store.resolve({0, 99, 1});
    assert(resolved.size() == 2);
    assert((labels(resolved) == std::vector<Timestamp>{10, 11}));

    assert(store.resolve({99, 100}).empty());
    assert(!store.get(99).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_mac_queries() {
    std::cout << "Testing MAC queries..." << std::endl;

    BleCube cube;
    cube.insert(obs_at(-60, 0, MAC_A));
    cube.insert(obs_at(-61, 1, MAC_B));
    cube.insert(obs_at(-62, 2, MAC_A));
    cube.insert(obs_at(-63, 3, MAC_ZERO));
    cube.insert(obs_at(-64, 4, MAC_A));

    auto a = cube.query_mac(MAC_A);
    assert((labels(a) == std::vector<Timestamp>{0, 2, 4}));
    for (const auto& o : a) assert(o.mac == MAC_A);

    assert(cube.query_mac(MAC_B).size() == 1);

    MacAddress unknown{{0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x01}};
    assert(cube.query_mac(unknown).empty());

    auto macs = cube.get_all_macs();
    assert(macs.size() == 3);
    assert(macs[0] == MAC_ZERO);
    assert(macs[1] == MAC_B);
    assert(macs[2] == MAC_A);
    assert(std::is_sorted(macs.begin(), macs.end()));

    std::cout << "  PASS" << std::endl;
}

void test_rssi_range_query() {
    std::cout << "Testing RSSI range query..." << std::endl;

    BleCube cube;
    cube.insert(obs_at(-50, 0));
    cube.insert(obs_at(-70, 1));
    cube.insert(obs_at(-90, 2));

    auto results = cube.query_rssi_range(-80, -60);
    assert(results.size() == 1);
    assert(results[0].rssi == -70);

    auto results_gte = cube.query_rssi_gte(-70);
    assert(results_gte.size() == 2);  // -70 and -50
    assert(results_gte[0].rssi == -70);
    assert(results_gte[1].rssi == -50);

    assert(cube.query_rssi_gt(-70).size() == 1);
    assert(cube.query_rssi_lt(-70).size() == 1);
    assert(cube.query_rssi_lte(-70).size() == 2);
    assert(cube.query_rssi(-90).size() == 1);
    assert(cube.query_rssi(-91).empty());

    // Inclusive on both ends
    assert(cube.query_rssi_range(-90, -50).size() == 3);
    assert(cube.query_rssi_range(-70, -70).size() == 1);

    // Inverted range is empty
    assert(cube.query_rssi_range(-60, -80).empty());

    std::cout << "  PASS" << std::endl;
}

void test_rssi_ordering_and_limits() {
    std::cout << "Testing RSSI ordering and type limits..." << std::endl;

    BleCube cube;
    cube.insert(obs_at(-60, 0));
    cube.insert(obs_at(-50, 1));
    cube.insert(obs_at(-60, 2));
    cube.insert(obs_at(-70, 3));

    // Grouped by ascending key, insertion order within a key
    auto grouped = cube.query_rssi_range(-70, -50);
    assert((labels(grouped) == std::vector<Timestamp>{3, 0, 2, 1}));
    assert((labels(cube.query_rssi_lte(-60)) == std::vector<Timestamp>{3, 0, 2}));

    cube.insert(obs_at(127, 4));
    cube.insert(obs_at(-128, 5));

    // Nothing lies above the maximum; no wrap to -128
    assert(cube.query_rssi_gt(127).empty());
    assert((labels(cube.query_rssi_gt(126)) == std::vector<Timestamp>{4}));
    assert(cube.query_rssi_lt(-128).empty());
    assert((labels(cube.query_rssi_lte(-128)) == std::vector<Timestamp>{5}));
    assert(cube.query_rssi_gte(-128).size() == 6);
    assert(cube.query_rssi_range(-128, 127).size() == 6);

    std::cout << "  PASS" << std::endl;
}

void test_timestamp_queries() {
    std::cout << "Testing timestamp queries..." << std::endl;

    const Timestamp tmax = std::numeric_limits<Timestamp>::max();
    const Timestamp tmin = std::numeric_limits<Timestamp>::min();

    BleCube cube;
    cube.insert(obs_at(-60, 1700000000));
    cube.insert(obs_at(-61, 1700000100));
    cube.insert(obs_at(-62, 1700000200));
    cube.insert(obs_at(-63, 1700000100));

    assert(cube.query_timestamp(1700000100).size() == 2);
    assert(cube.query_timestamp(1700000101).empty());

    auto range = cube.query_time_range(1700000000, 1700000150);
    assert(range.size() == 3);
    assert(range[0].rssi == -60);
    assert(range[1].rssi == -61);
    assert(range[2].rssi == -63);

    assert(cube.query_time_after(1700000100).size() == 1);
    assert(cube.query_time_before(1700000100).size() == 1);
    assert(cube.query_time_range(1700000200, 1700000000).empty());

    cube.insert(obs_at(-64, tmax));
    cube.insert(obs_at(-65, tmin));

    assert(cube.query_time_after(tmax).empty());
    assert(cube.query_time_after(tmax - 1).size() == 1);
    assert(cube.query_time_before(tmin).empty());
    assert(cube.query_time_before(tmin + 1).size() == 1);
    assert(cube.query_time_range(tmin, tmax).size() == 6);

    std::cout << "  PASS" << std::endl;
}

void test_haversine() {
    std::cout << "Testing haversine distance..." << std::endl;

    assert(haversine_distance(37.7749, -122.4194, 37.7749, -122.4194) == 0.0);

    double sf_oak = haversine_distance(37.7749, -122.4194, 37.8044, -122.2712);
    assert(sf_oak > 13000.0 && sf_oak < 14000.0);

    // Symmetric
    double oak_sf = haversine_distance(37.8044, -122.2712, 37.7749, -122.4194);
    assert(std::abs(sf_oak - oak_sf) < 1e-6);

    // One degree of latitude on a 6371 km sphere
    double one_deg = haversine_distance(0.0, 0.0, 1.0, 0.0);
    assert(std::abs(one_deg - EARTH_RADIUS_M * PI / 180.0) < 1e-3);

    std::cout << "  PASS" << std::endl;
}

void test_envelopes() {
    std::cout << "Testing envelopes..." << std::endl;

    auto env = GeoEnvelope::from_corners(3.0, 4.0, 1.0, 2.0);
    assert(env.min_lat == 1.0 && env.max_lat == 3.0);
    assert(env.min_lon == 2.0 && env.max_lon == 4.0);
    assert(env.contains(1.0, 2.0));
    assert(env.contains(3.0, 4.0));
    assert(!env.contains(3.1, 4.0));

    // Same half-width on both axes, whatever the latitude
    auto sq = GeoEnvelope::around(60.0, 10.0, 111000.0);
    assert(std::abs(sq.max_lat - sq.min_lat - 2.0) < 1e-9);
    assert(std::abs(sq.max_lon - sq.min_lon - 2.0) < 1e-9);

    std::vector<LatLon> tri = {{37.7, -122.5}, {37.9, -122.5}, {37.8, -122.2}};
    auto b = GeoEnvelope::bounding(tri);
    assert(b.min_lat == 37.7 && b.max_lat == 37.9);
    assert(b.min_lon == -122.5 && b.max_lon == -122.2);

    std::cout << "  PASS" << std::endl;
}

void test_point_in_polygon() {
    std::cout << "Testing point-in-polygon..." << std::endl;

    std::vector<LatLon> square = {{0.0, 0.0}, {0.0, 10.0}, {10.0, 10.0}, {10.0, 0.0}};
    assert(point_in_polygon(5.0, 5.0, square));
    assert(point_in_polygon(1.0, 9.0, square));
    assert(!point_in_polygon(15.0, 5.0, square));
    assert(!point_in_polygon(5.0, -1.0, square));
    assert(!point_in_polygon(5.0, 11.0, square));

    std::vector<LatLon> tri = {{37.7, -122.5}, {37.9, -122.5}, {37.8, -122.2}};
    assert(point_in_polygon(37.7749, -122.4194, tri));   // San Francisco
    assert(!point_in_polygon(37.8044, -122.2712, tri));  // Oakland, just past the edge

    std::cout << "  PASS" << std::endl;
}

void test_geo_radius_query() {
    std::cout << "Testing geo radius query..." << std::endl;

    BleCube cube;
    cube.insert(obs_at(-60, 0, MAC_ZERO, 37.7749, -122.4194));  // San Francisco
    cube.insert(obs_at(-60, 1, MAC_ZERO, 37.8044, -122.2712));  // Oakland, ~13 km

    auto results = cube.query_geo_radius(37.7749, -122.4194, 10000.0);
    assert(results.size() == 1);
    assert(results[0].timestamp == 0);

    results = cube.query_geo_radius(37.7749, -122.4194, 20000.0);
    assert(results.size() == 2);
    assert((labels(results) == std::vector<Timestamp>{0, 1}));

    // Zero radius still matches the exact point
    assert(cube.query_geo_radius(37.7749, -122.4194, 0.0).size() == 1);
    assert(cube.query_geo_radius(0.0, 0.0, 1000.0).empty());
    assert(cube.query_geo_radius(37.7749, -122.4194, -5.0).empty());

    std::cout << "  PASS" << std::endl;
}

void test_geo_radius_envelope_approximation() {
    std::cout << "Testing geo radius envelope approximation..." << std::endl;

    // At 60N a degree of longitude is ~55.6 km. A point 0.15 deg east is
    // ~8.3 km away by haversine, but outside the 10 km / 111000 envelope
    // (0.09 deg), so the prefilter drops it.
    BleCube cube;
    cube.insert(obs_at(-60, 0, MAC_ZERO, 60.0, 10.15));

    double d = haversine_distance(60.0, 10.0, 60.0, 10.15);
    assert(d < 10000.0);
    assert(cube.query_geo_radius(60.0, 10.0, 10000.0).empty());

    // Inside the envelope on latitude: found
    cube.insert(obs_at(-60, 1, MAC_ZERO, 60.05, 10.0));
    assert((labels(cube.query_geo_radius(60.0, 10.0, 10000.0)) == std::vector<Timestamp>{1}));

    std::cout << "  PASS" << std::endl;
}

void test_geo_radius_monotonic() {
    std::cout << "Testing geo radius monotonicity..." << std::endl;

    BleCube cube;
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> jitter(-0.3, 0.3);
    for (int i = 0; i < 400; ++i) {
        cube.insert(obs_at(-60, i, MAC_ZERO, 37.7749 + jitter(rng), -122.4194 + jitter(rng)));
    }

    const double radii[] = {0.0, 500.0, 1000.0, 5000.0, 10000.0, 20000.0, 50000.0};
    std::vector<Timestamp> prev;
    for (double r : radii) {
        auto current = labels(cube.query_geo_radius(37.7749, -122.4194, r));
        assert(std::is_sorted(current.begin(), current.end()));
        assert(std::includes(current.begin(), current.end(), prev.begin(), prev.end()));
        prev = current;
    }
    assert(!prev.empty());

    std::cout << "  PASS" << std::endl;
}

void test_geo_bbox_query() {
    std::cout << "Testing geo bbox query..." << std::endl;

    BleCube cube;
    cube.insert(obs_at(-65, 0, MAC_A, 37.7749, -122.4194));
    cube.insert(obs_at(-72, 1, MAC_A, 37.7750, -122.4195));
    cube.insert(obs_at(-80, 2, MAC_B, 37.8044, -122.2712));
    cube.insert(obs_at(-80, 3, MAC_B, 1.0, 2.0));

    assert(cube.query_geo_bbox(37.77, -122.42, 37.81, -122.27).size() == 3);

    // Boundary inclusive
    assert((labels(cube.query_geo_bbox(1.0, 2.0, 3.0, 4.0)) == std::vector<Timestamp>{3}));

    // Swapped corners describe the same box
    assert((labels(cube.query_geo_bbox(3.0, 4.0, 1.0, 2.0)) == std::vector<Timestamp>{3}));

    assert(cube.query_geo_bbox(-10.0, -10.0, -5.0, -5.0).empty());

    std::cout << "  PASS" << std::endl;
}

void test_geo_polygon_query() {
    std::cout << "Testing geo polygon query..." << std::endl;

    BleCube cube;
    cube.insert(obs_at(-60, 0, MAC_ZERO, 5.0, 5.0));
    cube.insert(obs_at(-60, 1, MAC_ZERO, 15.0, 5.0));
    cube.insert(obs_at(-60, 2, MAC_ZERO, 5.0, -1.0));
    cube.insert(obs_at(-60, 3, MAC_ZERO, 9.0, 1.0));

    std::vector<LatLon> square = {{0.0, 0.0}, {0.0, 10.0}, {10.0, 10.0}, {10.0, 0.0}};
    assert((labels(cube.query_geo_polygon(square)) == std::vector<Timestamp>{0, 3}));

    // Fewer than three vertices: empty, whatever the data
    std::vector<LatLon> segment = {{0.0, 0.0}, {10.0, 10.0}};
    assert(cube.query_geo_polygon(segment).empty());
    assert(cube.query_geo_polygon({}).empty());

    std::cout << "  PASS" << std::endl;
}

void test_multi_query() {
    std::cout << "Testing multi-dimensional query..." << std::endl;

    BleCube cube;
    cube.insert(obs_at(-65, 1700000000, MAC_A, 37.7749, -122.4194));
    cube.insert(obs_at(-72, 1700000100, MAC_A, 37.7750, -122.4195));
    cube.insert(obs_at(-80, 1700000200, MAC_B, 37.8044, -122.2712));
    cube.insert(obs_at(-62, 1700000050, MAC_B, 37.7751, -122.4190));

    // No filters: every record, id order
    auto all = cube.query_multi(std::nullopt, std::nullopt, std::nullopt, std::nullopt);
    assert(all.size() == 4);
    for (size_t i = 0; i < all.size(); ++i) {
        assert(all[i] == *cube.get(static_cast<RecordId>(i)));
    }
    assert(cube.query_multi(MultiQuery{}).size() == 4);

    // MAC only
    assert((labels(cube.query_multi(MAC_A, std::nullopt, std::nullopt, std::nullopt)) ==
            std::vector<Timestamp>{1700000000, 1700000100}));

    // Every dimension
    auto combined = cube.query_multi(MAC_A,
                                     RssiRange{-70, -60},
                                     TimeRange{1700000000, 1700000120},
                                     GeoRadius{37.7749, -122.4194, 10000.0});
    assert(combined.size() == 1);
    assert(combined[0].rssi == -65);

    // RSSI + geo without MAC: id order across addresses
    auto strong_near = cube.query_multi(std::nullopt, RssiRange{-70, -60}, std::nullopt,
                                        GeoRadius{37.7749, -122.4194, 1000.0});
    assert((labels(strong_near) == std::vector<Timestamp>{1700000000, 1700000050}));

    // Unknown MAC short-circuits to empty
    MacAddress unknown{{1, 2, 3, 4, 5, 6}};
    assert(cube.query_multi(unknown, RssiRange{-128, 127}, std::nullopt, std::nullopt).empty());

    // Disjoint dimensions
    assert(cube.query_multi(MAC_B, RssiRange{-75, -70}, std::nullopt, std::nullopt).empty());

    // Id-level result
    MultiQuery q;
    q.time = TimeRange{1700000050, 1700000200};
    assert((cube.query_multi_ids(q) == std::vector<RecordId>{1, 2, 3}));

    std::cout << "  PASS" << std::endl;
}

void test_multi_matches_retain_filter() {
    std::cout << "Testing multi query against retain filter..." << std::endl;

    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> rssi_dist(-100, -30);
    std::uniform_int_distribution<int> time_dist(0, 99);
    std::uniform_int_distribution<int> mac_dist(0, 4);
    std::uniform_real_distribution<double> jitter(-0.2, 0.2);

    std::vector<MacAddress> macs;
    for (uint8_t i = 0; i < 5; ++i) {
        macs.push_back(MacAddress{{0x10, 0x20, 0x30, 0x40, 0x50, i}});
    }

    BleCube cube;
    std::vector<Observation> records;
    for (int i = 0; i < 500; ++i) {
        Observation o = obs_at(static_cast<Rssi>(rssi_dist(rng)), time_dist(rng),
                               macs[mac_dist(rng)],
                               37.7749 + jitter(rng), -122.4194 + jitter(rng));
        records.push_back(o);
        cube.insert(o);
    }

    const double lat = 37.7749, lon = -122.4194, radius = 8000.0;
    const double deg = radius / METERS_PER_DEGREE;

    for (int trial = 0; trial < 16; ++trial) {
        MultiQuery q;
        if (trial & 1) q.mac = macs[trial % 5];
        if (trial & 2) q.rssi = RssiRange{-80, -50};
        if (trial & 4) q.time = TimeRange{20, 70};
        if (trial & 8) q.geo = GeoRadius{lat, lon, radius};

        // Walk the base set and retain ids matching every given filter
        std::vector<RecordId> expected;
        for (RecordId id = 0; id < records.size(); ++id) {
            const auto& o = records[id];
            if (q.mac && o.mac != *q.mac) continue;
            if (q.rssi && (o.rssi < q.rssi->min || o.rssi > q.rssi->max)) continue;
            if (q.time && (o.timestamp < q.time->start || o.timestamp > q.time->end)) continue;
            if (q.geo) {
                bool in_envelope = std::abs(o.lat - lat) <= deg && std::abs(o.lon - lon) <= deg;
                if (!in_envelope || haversine_distance(lat, lon, o.lat, o.lon) > radius) continue;
            }
            expected.push_back(id);
        }

        assert(cube.query_multi_ids(q) == expected);

        auto resolved = cube.query_multi(q);
        assert(resolved.size() == expected.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            assert(resolved[i] == records[expected[i]]);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_idempotence() {
    std::cout << "Testing query idempotence..." << std::endl;

    BleCube cube;
    std::mt19937 rng(99);
    std::uniform_real_distribution<double> jitter(-0.1, 0.1);
    for (int i = 0; i < 200; ++i) {
        cube.insert(obs_at(static_cast<Rssi>(-40 - i % 50), i % 17,
                           i % 2 ? MAC_A : MAC_B,
                           37.7749 + jitter(rng), -122.4194 + jitter(rng)));
    }

    std::vector<LatLon> tri = {{37.7, -122.5}, {37.9, -122.5}, {37.8, -122.2}};

    auto rssi = cube.query_rssi_range(-70, -50);
    auto near = cube.query_geo_radius(37.7749, -122.4194, 5000.0);
    auto poly = cube.query_geo_polygon(tri);
    auto multi = cube.query_multi(MAC_A, RssiRange{-80, -40}, TimeRange{3, 9}, std::nullopt);
    auto mac = cube.query_mac(MAC_B);

    assert(!rssi.empty() && !near.empty() && !poly.empty() && !multi.empty());

    assert(cube.query_rssi_range(-70, -50) == rssi);
    assert(cube.query_geo_radius(37.7749, -122.4194, 5000.0) == near);
    assert(cube.query_geo_polygon(tri) == poly);
    assert(cube.query_multi(MAC_A, RssiRange{-80, -40}, TimeRange{3, 9}, std::nullopt) == multi);
    assert(cube.query_mac(MAC_B) == mac);

    std::cout << "  PASS" << std::endl;
}

void test_posting() {
    std::cout << "Testing Posting..." << std::endl;

    Posting all = Posting::range(0, 10);
    assert(all.cardinality() == 10);
    assert(all.contains(0) && all.contains(9) && !all.contains(10));

    Posting evens(std::vector<RecordId>{8, 2, 4, 0, 6, 12});
    all.intersect(evens);
    assert((all.to_vector() == std::vector<RecordId>{0, 2, 4, 6, 8}));

    Posting none = Posting::range(5, 5);
    assert(none.empty());
    assert(none.to_vector().empty());

    Posting moved = std::move(all);
    assert(moved.cardinality() == 5);

    std::cout << "  PASS" << std::endl;
}

void test_stats_and_config() {
    std::cout << "Testing stats and capacity config..." << std::endl;

    CubeConfig config;
    config.expected_records = 1000;
    config.expected_macs = 4;
    BleCube cube(config);
    auto sized = BleCube::with_capacity(1000);

    for (BleCube* c : {&cube, &sized}) {
        c->insert(obs_at(-60, 1, MAC_A, 1.0, 1.0));
        c->insert(obs_at(-60, 2, MAC_B, 2.0, 2.0));
        c->insert(obs_at(-61, 2, MAC_A, 3.0, 3.0));
    }

    auto s = cube.stats();
    assert(s.records == 3);
    assert(s.distinct_macs == 2);
    assert(s.distinct_rssi == 2);
    assert(s.distinct_timestamps == 2);
    assert(s.spatial_entries == 3);

    // Capacity hints never change results
    assert(cube.query_rssi_range(-61, -60) == sized.query_rssi_range(-61, -60));
    assert(cube.query_mac(MAC_A) == sized.query_mac(MAC_A));
    assert(cube.config().expected_macs == 4);

    std::cout << "  PASS" << std::endl;
}

void test_json_codec() {
    std::cout << "Testing JSON codec..." << std::endl;

    Observation o = obs_at(-65, 1700000000, MAC_A, 37.7749, -122.4194);
    json j = o;
    assert(j["mac"] == "AA:BB:CC:DD:EE:FF");
    assert(j["rssi"] == -65);
    assert(j["timestamp"] == 1700000000);
    assert(j.get<Observation>() == o);

    std::istringstream array_in(
        "  [{\"mac\":\"aa:bb:cc:dd:ee:ff\",\"rssi\":-65,\"timestamp\":1700000000,"
        "\"lat\":37.7749,\"lon\":-122.4194},"
        " {\"mac\":\"11:22:33:44:55:66\",\"rssi\":-80,\"timestamp\":1700000200,"
        "\"lat\":37.8044,\"lon\":-122.2712}]");
    auto from_array = load_observations(array_in);
    assert(from_array.size() == 2);
    assert(from_array[0] == o);
    assert(from_array[1].mac == MAC_B);

    std::istringstream lines_in(
        "{\"mac\":\"AA:BB:CC:DD:EE:FF\",\"rssi\":-65,\"timestamp\":1700000000,"
        "\"lat\":37.7749,\"lon\":-122.4194}\n"
        "\n"
        "{\"mac\":\"11-22-33-44-55-66\",\"rssi\":-80,\"timestamp\":1700000200,"
        "\"lat\":37.8044,\"lon\":-122.2712}\n");
    auto from_lines = load_observations(lines_in);
    assert(from_lines.size() == 2);
    assert(from_lines[0] == o);
    assert(from_lines[1].rssi == -80);

    bool threw = false;
    try {
        json bad = {{"mac", "nope"}, {"rssi", 1}, {"timestamp", 0}, {"lat", 0.0}, {"lon", 0.0}};
        (void)bad.get<Observation>();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // RSSI is a signed byte; 200 must not wrap to -56
    threw = false;
    try {
        std::istringstream loud(
            "{\"mac\":\"AA:BB:CC:DD:EE:FF\",\"rssi\":200,\"timestamp\":1,"
            "\"lat\":0.0,\"lon\":0.0}\n");
        (void)load_observations(loud);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    json edge = {{"mac", "AA:BB:CC:DD:EE:FF"}, {"rssi", -128}, {"timestamp", 0},
                 {"lat", 0.0}, {"lon", 0.0}};
    assert(edge.get<Observation>().rssi == -128);

    threw = false;
    try {
        std::istringstream broken("{\"mac\": ");
        (void)load_observations(broken);
    } catch (const json::exception&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== blecube " << BLECUBE_VERSION << " Tests ===" << std::endl;
    std::cout << std::endl;

    test_mac_address();
    test_insert_get();
    test_record_store();
    test_mac_queries();
    test_rssi_range_query();
    test_rssi_ordering_and_limits();
    test_timestamp_queries();

    std::cout << std::endl;
    std::cout << "=== Geo ===" << std::endl;
    test_haversine();
    test_envelopes();
    test_point_in_polygon();
    test_geo_radius_query();
    test_geo_radius_envelope_approximation();
    test_geo_radius_monotonic();
    test_geo_bbox_query();
    test_geo_polygon_query();

    std::cout << std::endl;
    std::cout << "=== Multi-dimensional ===" << std::endl;
    test_multi_query();
    test_multi_matches_retain_filter();
    test_idempotence();
    test_posting();
    test_stats_and_config();
    test_json_codec();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
