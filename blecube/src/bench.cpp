// blecube_bench: insert throughput and per-query latency
//
// Usage: blecube_bench [--count N] [--verbose]
//
// Observations are synthetic: the MAC is derived from the insert index,
// RSSI cycles through [-100, -30], positions scatter around San Francisco.

#include <blecube/blecube.hpp>
#include <chrono>
#include <cstring>
#include <functional>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace blecube;

namespace {

using Clock = std::chrono::high_resolution_clock;

Observation synthetic(size_t i, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> jitter(-0.2, 0.2);

    Observation obs;
    obs.rssi = static_cast<Rssi>(-100 + static_cast<int>(i % 71));
    obs.mac.bytes = {0, 0, 0, 0,
                     static_cast<uint8_t>((i >> 8) & 0xFF),
                     static_cast<uint8_t>(i & 0xFF)};
    obs.timestamp = static_cast<Timestamp>(1700000000 + i);
    obs.lat = 37.7749 + jitter(rng);
    obs.lon = -122.4194 + jitter(rng);
    return obs;
}

void time_query(const char* name, int iterations, const std::function<size_t()>& fn) {
    size_t hits = 0;
    auto start = Clock::now();
    for (int i = 0; i < iterations; ++i) {
        hits = fn();
    }
    auto elapsed = Clock::now() - start;
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();

    std::cout << "  " << name << ": "
              << (us / iterations) << " us/query"
              << " (" << hits << " hits)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    size_t count = 100000;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--count") == 0 && i + 1 < argc) {
            count = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (strcmp(argv[i], "--verbose") == 0) {
            set_verbose(true);
        } else {
            std::cerr << "Usage: " << argv[0] << " [--count N] [--verbose]\n";
            return 1;
        }
    }

    std::cout << "=== blecube " << BLECUBE_VERSION << " benchmark ===\n";
    std::cout << "Records: " << count << "\n\n";

    std::mt19937_64 rng(42);
    std::vector<Observation> data;
    data.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        data.push_back(synthetic(i, rng));
    }

    auto cube = BleCube::with_capacity(count);

    auto start = Clock::now();
    for (const auto& obs : data) {
        cube.insert(obs);
    }
    auto insert_time = Clock::now() - start;
    auto insert_ms = std::chrono::duration_cast<std::chrono::milliseconds>(insert_time).count();

    std::cout << "Insert: " << insert_ms << " ms";
    if (insert_ms > 0) {
        std::cout << " (" << (count * 1000 / static_cast<size_t>(insert_ms)) << " records/s)";
    }
    std::cout << "\n\nQueries:\n";

    MacAddress probe = data.empty() ? MacAddress{} : data[count / 2].mac;
    const int iters = 100;

    time_query("mac exact", iters, [&] { return cube.query_mac(probe).size(); });
    time_query("all macs", 10, [&] { return cube.get_all_macs().size(); });
    time_query("rssi exact", iters, [&] { return cube.query_rssi(-65).size(); });
    time_query("rssi range", iters, [&] { return cube.query_rssi_range(-70, -60).size(); });
    time_query("rssi gt", iters, [&] { return cube.query_rssi_gt(-40).size(); });
    time_query("time range", iters, [&] {
        return cube.query_time_range(1700000000, 1700001000).size();
    });
    time_query("geo radius 1km", iters, [&] {
        return cube.query_geo_radius(37.7749, -122.4194, 1000.0).size();
    });
    time_query("geo bbox", iters, [&] {
        return cube.query_geo_bbox(37.77, -122.42, 37.78, -122.41).size();
    });
    std::vector<LatLon> triangle = {{37.7, -122.5}, {37.9, -122.5}, {37.8, -122.2}};
    time_query("geo polygon", iters, [&] { return cube.query_geo_polygon(triangle).size(); });
    time_query("multi (rssi+time+geo)", iters, [&] {
        return cube.query_multi(std::nullopt,
                                RssiRange{-80, -50},
                                TimeRange{1700000000, 1700050000},
                                GeoRadius{37.7749, -122.4194, 5000.0}).size();
    });

    auto s = cube.stats();
    std::cout << "\nDistinct MACs: " << s.distinct_macs
              << ", RSSI values: " << s.distinct_rssi
              << ", timestamps: " << s.distinct_timestamps << "\n";
    return 0;
}
