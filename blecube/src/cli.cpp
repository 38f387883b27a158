// blecube: Command-line interface for querying BLE observation files
//
// Usage: blecube <command> [options]
//
// Commands:
//   demo       Walk through every query family on sample data
//   stats      Show index statistics
//   mac        Query by MAC address (or list all addresses)
//   rssi       Query by signal strength
//   time       Query by timestamp
//   geo        Radius, bounding-box or polygon query
//   multi      Conjunctive MAC + RSSI + time + geo query
//   help       Show this help

#include <blecube/blecube.hpp>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace blecube;

struct Args {
    std::string command;
    std::string input;
    bool json_output = false;
    size_t limit = 20;

    // mac / multi
    std::optional<MacAddress> mac;

    // rssi
    std::optional<Rssi> rssi_eq, rssi_min, rssi_max;
    std::optional<Rssi> rssi_gt, rssi_gte, rssi_lt, rssi_lte;

    // time
    std::optional<Timestamp> time_at, time_start, time_end;
    std::optional<Timestamp> time_after, time_before;

    // geo
    std::optional<double> lat, lon, radius;
    std::optional<GeoEnvelope> bbox;
    std::vector<LatLon> polygon;
    bool has_polygon = false;
};

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "blecube " << BLECUBE_VERSION << " - BLE observation index\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  demo               Run every query family on built-in sample data\n"
              << "  stats              Show index statistics\n"
              << "  mac                Records for --mac, or every distinct address\n"
              << "  rssi               One of --eq, --min/--max, --gt, --gte, --lt, --lte\n"
              << "  time               One of --at, --start/--end, --after, --before\n"
              << "  geo                --lat/--lon/--radius, --bbox, or --polygon\n"
              << "  multi              Any of --mac, --rssi-min/--rssi-max,\n"
              << "                     --start/--end, --lat/--lon/--radius\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --input FILE       Observations as a JSON array or JSON Lines\n"
              << "  --json             Output as JSON\n"
              << "  --limit N          Records to print (default: 20, 0 = all)\n"
              << "  --bbox A,B,C,D     min_lat,min_lon,max_lat,max_lon\n"
              << "  --polygon P        lat,lon;lat,lon;lat,lon[;...]\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

static Rssi parse_rssi(const std::string& s) {
    int v = std::stoi(s);
    if (v < std::numeric_limits<Rssi>::min() || v > std::numeric_limits<Rssi>::max()) {
        throw std::out_of_range("rssi out of range: " + s);
    }
    return static_cast<Rssi>(v);
}

static size_t parse_limit(const std::string& s) {
    long long v = std::stoll(s);
    if (v < 0) {
        throw std::out_of_range("limit must be non-negative: " + s);
    }
    return static_cast<size_t>(v);
}

static std::vector<double> parse_doubles(const std::string& s, char sep) {
    std::vector<double> values;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) {
        values.push_back(std::stod(item));
    }
    return values;
}

static std::vector<LatLon> parse_polygon(const std::string& s) {
    std::vector<LatLon> vertices;
    std::stringstream ss(s);
    std::string pair;
    while (std::getline(ss, pair, ';')) {
        auto v = parse_doubles(pair, ',');
        if (v.size() != 2) {
            throw std::invalid_argument("polygon vertex must be lat,lon: " + pair);
        }
        vertices.push_back({v[0], v[1]});
    }
    return vertices;
}

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

void print_observation(const Observation& obs) {
    std::cout << "  " << obs.mac.to_string()
              << "  rssi=" << std::setw(4) << static_cast<int>(obs.rssi) << " dBm"
              << "  t=" << obs.timestamp
              << std::fixed << std::setprecision(4)
              << "  lat=" << obs.lat << "  lon=" << obs.lon
              << std::defaultfloat << "\n";
}

int print_results(const std::string& label, const std::vector<Observation>& results,
                  const Args& args) {
    size_t shown = results.size();
    if (args.limit > 0 && shown > args.limit) shown = args.limit;

    if (args.json_output) {
        std::vector<Observation> head(results.begin(), results.begin() + shown);
        json out = {
            {"query", label},
            {"count", results.size()},
            {"results", observations_to_json(head)}
        };
        std::cout << out.dump() << "\n";
        return 0;
    }

    std::cout << label << ": " << results.size() << " observation"
              << (results.size() == 1 ? "" : "s") << "\n";
    for (size_t i = 0; i < shown; ++i) {
        print_observation(results[i]);
    }
    if (shown < results.size()) {
        std::cout << "  ... " << (results.size() - shown) << " more (use --limit)\n";
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

bool load_cube(const std::string& path, BleCube& cube) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Error: cannot open " << path << "\n";
        return false;
    }

    auto observations = load_observations(in);
    cube.reserve(observations.size());
    for (const auto& obs : observations) {
        cube.insert(obs);
    }
    if (observations.empty()) {
        log_warn("cli", "no observations in %s", path.c_str());
    }
    log_debug("cli", "loaded %zu observations from %s", observations.size(), path.c_str());
    return true;
}

int cmd_stats(const BleCube& cube, bool json_output) {
    auto s = cube.stats();
    if (json_output) {
        json out = s;
        out["version"] = BLECUBE_VERSION;
        std::cout << out.dump() << "\n";
        return 0;
    }

    std::cout << "Cube Statistics\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "  Records:             " << s.records << "\n";
    std::cout << "  Distinct MACs:       " << s.distinct_macs << "\n";
    std::cout << "  Distinct RSSI:       " << s.distinct_rssi << "\n";
    std::cout << "  Distinct timestamps: " << s.distinct_timestamps << "\n";
    std::cout << "  Spatial entries:     " << s.spatial_entries << "\n";
    return 0;
}

int cmd_mac(const BleCube& cube, const Args& args) {
    if (args.mac) {
        return print_results("mac = " + args.mac->to_string(), cube.query_mac(*args.mac), args);
    }

    auto macs = cube.get_all_macs();
    if (args.json_output) {
        json out = {{"count", macs.size()}, {"macs", macs}};
        std::cout << out.dump() << "\n";
        return 0;
    }

    std::cout << "Unique MACs: " << macs.size() << "\n";
    for (const auto& mac : macs) {
        std::cout << "  " << mac.to_string() << "\n";
    }
    return 0;
}

int cmd_rssi(const BleCube& cube, const Args& args) {
    auto n = [](Rssi v) { return std::to_string(static_cast<int>(v)); };

    if (args.rssi_eq) {
        return print_results("rssi = " + n(*args.rssi_eq), cube.query_rssi(*args.rssi_eq), args);
    }
    if (args.rssi_min || args.rssi_max) {
        Rssi lo = args.rssi_min.value_or(std::numeric_limits<Rssi>::min());
        Rssi hi = args.rssi_max.value_or(std::numeric_limits<Rssi>::max());
        return print_results("rssi in [" + n(lo) + ", " + n(hi) + "]",
                             cube.query_rssi_range(lo, hi), args);
    }
    if (args.rssi_gt) {
        return print_results("rssi > " + n(*args.rssi_gt), cube.query_rssi_gt(*args.rssi_gt), args);
    }
    if (args.rssi_gte) {
        return print_results("rssi >= " + n(*args.rssi_gte), cube.query_rssi_gte(*args.rssi_gte), args);
    }
    if (args.rssi_lt) {
        return print_results("rssi < " + n(*args.rssi_lt), cube.query_rssi_lt(*args.rssi_lt), args);
    }
    if (args.rssi_lte) {
        return print_results("rssi <= " + n(*args.rssi_lte), cube.query_rssi_lte(*args.rssi_lte), args);
    }

    std::cerr << "Error: rssi needs one of --eq, --min/--max, --gt, --gte, --lt, --lte\n";
    return 1;
}

int cmd_time(const BleCube& cube, const Args& args) {
    if (args.time_at) {
        return print_results("timestamp = " + std::to_string(*args.time_at),
                             cube.query_timestamp(*args.time_at), args);
    }
    if (args.time_start || args.time_end) {
        Timestamp lo = args.time_start.value_or(std::numeric_limits<Timestamp>::min());
        Timestamp hi = args.time_end.value_or(std::numeric_limits<Timestamp>::max());
        return print_results("timestamp in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]",
                             cube.query_time_range(lo, hi), args);
    }
    if (args.time_after) {
        return print_results("timestamp > " + std::to_string(*args.time_after),
                             cube.query_time_after(*args.time_after), args);
    }
    if (args.time_before) {
        return print_results("timestamp < " + std::to_string(*args.time_before),
                             cube.query_time_before(*args.time_before), args);
    }

    std::cerr << "Error: time needs one of --at, --start/--end, --after, --before\n";
    return 1;
}

int cmd_geo(const BleCube& cube, const Args& args) {
    if (args.lat && args.lon && args.radius) {
        std::ostringstream label;
        label << "within " << *args.radius << " m of (" << *args.lat << ", " << *args.lon << ")";
        return print_results(label.str(),
                             cube.query_geo_radius(*args.lat, *args.lon, *args.radius), args);
    }
    if (args.bbox) {
        const auto& b = *args.bbox;
        return print_results("bounding box",
                             cube.query_geo_bbox(b.min_lat, b.min_lon, b.max_lat, b.max_lon), args);
    }
    if (args.has_polygon) {
        return print_results("polygon (" + std::to_string(args.polygon.size()) + " vertices)",
                             cube.query_geo_polygon(args.polygon), args);
    }

    std::cerr << "Error: geo needs --lat/--lon/--radius, --bbox or --polygon\n";
    return 1;
}

int cmd_multi(const BleCube& cube, const Args& args) {
    MultiQuery q;
    q.mac = args.mac;
    if (args.rssi_min || args.rssi_max) {
        q.rssi = RssiRange{args.rssi_min.value_or(std::numeric_limits<Rssi>::min()),
                           args.rssi_max.value_or(std::numeric_limits<Rssi>::max())};
    }
    if (args.time_start || args.time_end) {
        q.time = TimeRange{args.time_start.value_or(std::numeric_limits<Timestamp>::min()),
                           args.time_end.value_or(std::numeric_limits<Timestamp>::max())};
    }
    if (args.lat || args.lon || args.radius) {
        if (!(args.lat && args.lon && args.radius)) {
            std::cerr << "Error: geo filter needs all of --lat, --lon, --radius\n";
            return 1;
        }
        q.geo = GeoRadius{*args.lat, *args.lon, *args.radius};
    }

    std::string label = "multi";
    if (q.mac) label += " mac";
    if (q.rssi) label += " rssi";
    if (q.time) label += " time";
    if (q.geo) label += " geo";
    if (q.unfiltered()) label += " (no filters)";

    return print_results(label, cube.query_multi(q), args);
}

// The usage walkthrough: three observations, every query family
int cmd_demo() {
    auto cube = BleCube::with_capacity(1000);

    const MacAddress tag_a{{0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF}};
    const MacAddress tag_b{{0x11, 0x22, 0x33, 0x44, 0x55, 0x66}};

    cube.insert({-65, tag_a, 1700000000, 37.7749, -122.4194});
    cube.insert({-72, tag_a, 1700000100, 37.7750, -122.4195});
    cube.insert({-80, tag_b, 1700000200, 37.8044, -122.2712});

    std::cout << "Total observations: " << cube.size() << "\n\n";

    std::cout << "=== MAC Address Queries ===\n";
    auto mac_results = cube.query_mac(tag_a);
    std::cout << "Observations for MAC " << tag_a.to_string() << ": " << mac_results.size() << "\n";
    for (const auto& obs : mac_results) {
        std::cout << "  RSSI: " << static_cast<int>(obs.rssi) << " dBm, Time: " << obs.timestamp << "\n";
    }
    auto all_macs = cube.get_all_macs();
    std::cout << "\nUnique MACs: " << all_macs.size() << "\n";
    for (const auto& mac : all_macs) {
        std::cout << "  " << mac.to_string() << "\n";
    }

    std::cout << "\n=== RSSI Queries ===\n";
    std::cout << "RSSI = -72 dBm: " << cube.query_rssi(-72).size() << "\n";
    std::cout << "RSSI in [-75, -65] dBm: " << cube.query_rssi_range(-75, -65).size() << "\n";
    std::cout << "RSSI > -70 dBm (strong): " << cube.query_rssi_gt(-70).size() << "\n";
    std::cout << "RSSI <= -75 dBm (weak): " << cube.query_rssi_lte(-75).size() << "\n";

    std::cout << "\n=== Timestamp Queries ===\n";
    std::cout << "At 1700000100: " << cube.query_timestamp(1700000100).size() << "\n";
    std::cout << "In [1700000000, 1700000150]: "
              << cube.query_time_range(1700000000, 1700000150).size() << "\n";
    std::cout << "After 1700000100: " << cube.query_time_after(1700000100).size() << "\n";

    std::cout << "\n=== Geolocation Queries ===\n";
    std::cout << "Within 5 km of SF: " << cube.query_geo_radius(37.7749, -122.4194, 5000.0).size() << "\n";
    std::cout << "Within 20 km of SF: " << cube.query_geo_radius(37.7749, -122.4194, 20000.0).size() << "\n";
    std::cout << "In bounding box: "
              << cube.query_geo_bbox(37.77, -122.42, 37.81, -122.27).size() << "\n";
    std::vector<LatLon> bay = {{37.7, -122.5}, {37.9, -122.5}, {37.8, -122.2}};
    std::cout << "In polygon: " << cube.query_geo_polygon(bay).size() << "\n";

    std::cout << "\n=== Multi-Dimensional Queries ===\n";
    auto combined = cube.query_multi(tag_a,
                                     RssiRange{-70, -60},
                                     TimeRange{1700000000, 1700000120},
                                     GeoRadius{37.7749, -122.4194, 10000.0});
    std::cout << "MAC + RSSI + Time + Geo: " << combined.size() << " results\n";
    for (const auto& obs : combined) {
        print_observation(obs);
    }

    std::cout << "\n=== Direct Record Access ===\n";
    if (auto record = cube.get(0)) {
        std::cout << "Record 0: RSSI=" << static_cast<int>(record->rssi)
                  << " dBm, MAC=" << record->mac.to_string() << "\n";
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int run(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        auto next = [&]() -> std::string { return argv[++i]; };
        bool has_value = i + 1 < argc;

        if (strcmp(argv[i], "--input") == 0 && has_value) {
            args.input = next();
        } else if (strcmp(argv[i], "--json") == 0) {
            args.json_output = true;
        } else if (strcmp(argv[i], "--limit") == 0 && has_value) {
            args.limit = parse_limit(next());
        } else if (strcmp(argv[i], "--verbose") == 0) {
            set_verbose(true);
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "blecube " << BLECUBE_VERSION << "\n";
            return 0;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        // MAC
        } else if (strcmp(argv[i], "--mac") == 0 && has_value) {
            std::string s = next();
            args.mac = MacAddress::from_string(s);
            if (!args.mac) {
                std::cerr << "Error: invalid MAC address: " << s << "\n";
                return 1;
            }
        // RSSI
        } else if (strcmp(argv[i], "--eq") == 0 && has_value) {
            args.rssi_eq = parse_rssi(next());
        } else if ((strcmp(argv[i], "--min") == 0 || strcmp(argv[i], "--rssi-min") == 0) && has_value) {
            args.rssi_min = parse_rssi(next());
        } else if ((strcmp(argv[i], "--max") == 0 || strcmp(argv[i], "--rssi-max") == 0) && has_value) {
            args.rssi_max = parse_rssi(next());
        } else if (strcmp(argv[i], "--gt") == 0 && has_value) {
            args.rssi_gt = parse_rssi(next());
        } else if (strcmp(argv[i], "--gte") == 0 && has_value) {
            args.rssi_gte = parse_rssi(next());
        } else if (strcmp(argv[i], "--lt") == 0 && has_value) {
            args.rssi_lt = parse_rssi(next());
        } else if (strcmp(argv[i], "--lte") == 0 && has_value) {
            args.rssi_lte = parse_rssi(next());
        // Time
        } else if (strcmp(argv[i], "--at") == 0 && has_value) {
            args.time_at = std::stoll(next());
        } else if (strcmp(argv[i], "--start") == 0 && has_value) {
            args.time_start = std::stoll(next());
        } else if (strcmp(argv[i], "--end") == 0 && has_value) {
            args.time_end = std::stoll(next());
        } else if (strcmp(argv[i], "--after") == 0 && has_value) {
            args.time_after = std::stoll(next());
        } else if (strcmp(argv[i], "--before") == 0 && has_value) {
            args.time_before = std::stoll(next());
        // Geo
        } else if (strcmp(argv[i], "--lat") == 0 && has_value) {
            args.lat = std::stod(next());
        } else if (strcmp(argv[i], "--lon") == 0 && has_value) {
            args.lon = std::stod(next());
        } else if (strcmp(argv[i], "--radius") == 0 && has_value) {
            args.radius = std::stod(next());
        } else if (strcmp(argv[i], "--bbox") == 0 && has_value) {
            auto v = parse_doubles(next(), ',');
            if (v.size() != 4) {
                std::cerr << "Error: --bbox needs min_lat,min_lon,max_lat,max_lon\n";
                return 1;
            }
            args.bbox = GeoEnvelope::from_corners(v[0], v[1], v[2], v[3]);
        } else if (strcmp(argv[i], "--polygon") == 0 && has_value) {
            args.polygon = parse_polygon(next());
            args.has_polygon = true;
        } else if (argv[i][0] != '-' && args.command.empty()) {
            args.command = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (args.command.empty() || args.command == "help") {
        print_usage(argv[0]);
        return args.command.empty() ? 1 : 0;
    }

    if (args.command == "demo") {
        return cmd_demo();
    }

    if (args.input.empty()) {
        std::cerr << "Error: --input is required for " << args.command << "\n";
        return 1;
    }

    BleCube cube;
    if (!load_cube(args.input, cube)) {
        return 1;
    }

    if (args.command == "stats") return cmd_stats(cube, args.json_output);
    if (args.command == "mac") return cmd_mac(cube, args);
    if (args.command == "rssi") return cmd_rssi(cube, args);
    if (args.command == "time") return cmd_time(cube, args);
    if (args.command == "geo") return cmd_geo(cube, args);
    if (args.command == "multi") return cmd_multi(cube, args);

    std::cerr << "Unknown command: " << args.command << "\n";
    print_usage(argv[0]);
    return 1;
}

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const json::exception& e) {
        std::cerr << "Error: malformed input: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 1;
}
