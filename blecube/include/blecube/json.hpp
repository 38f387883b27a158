#pragma once
// JSON codec for observations
//
// {"mac":"AA:BB:CC:DD:EE:FF","rssi":-65,"timestamp":1700000000,
//  "lat":37.7749,"lon":-122.4194}
//
// Input files are either one JSON array of these objects or JSON Lines
// (one object per line). Malformed input throws nlohmann::json::exception,
// std::invalid_argument for an unparseable MAC, or std::out_of_range for an
// RSSI outside [-128, 127].

#include "types.hpp"
#include "cube/types.hpp"
#include <nlohmann/json.hpp>
#include <istream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace blecube {

using json = nlohmann::json;

inline void to_json(json& j, const MacAddress& mac) {
    j = mac.to_string();
}

inline void from_json(const json& j, MacAddress& mac) {
    auto s = j.get<std::string>();
    auto parsed = MacAddress::from_string(s);
    if (!parsed) {
        throw std::invalid_argument("invalid MAC address: " + s);
    }
    mac = *parsed;
}

inline void to_json(json& j, const Observation& obs) {
    j = json{
        {"mac", obs.mac},
        {"rssi", static_cast<int>(obs.rssi)},
        {"timestamp", obs.timestamp},
        {"lat", obs.lat},
        {"lon", obs.lon}
    };
}

inline void from_json(const json& j, Observation& obs) {
    obs.mac = j.at("mac").get<MacAddress>();

    // Other fields are stored as-is; RSSI must fit the signed byte
    int rssi = j.at("rssi").get<int>();
    if (rssi < std::numeric_limits<Rssi>::min() || rssi > std::numeric_limits<Rssi>::max()) {
        throw std::out_of_range("rssi out of range: " + std::to_string(rssi));
    }
    obs.rssi = static_cast<Rssi>(rssi);
    obs.timestamp = j.at("timestamp").get<Timestamp>();
    obs.lat = j.at("lat").get<double>();
    obs.lon = j.at("lon").get<double>();
}

inline void to_json(json& j, const CubeStats& s) {
    j = json{
        {"records", s.records},
        {"distinct_macs", s.distinct_macs},
        {"distinct_rssi", s.distinct_rssi},
        {"distinct_timestamps", s.distinct_timestamps},
        {"spatial_entries", s.spatial_entries}
    };
}

// Read a JSON array or JSON Lines stream
inline std::vector<Observation> load_observations(std::istream& in) {
    std::vector<Observation> result;

    // Peek past leading whitespace to pick the format
    in >> std::ws;
    if (in.peek() == '[') {
        json doc = json::parse(in);
        result = doc.get<std::vector<Observation>>();
        return result;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        result.push_back(json::parse(line).get<Observation>());
    }
    return result;
}

inline json observations_to_json(const std::vector<Observation>& observations) {
    json arr = json::array();
    for (const auto& obs : observations) {
        arr.push_back(obs);
    }
    return arr;
}

} // namespace blecube
