#pragma once
// Core types: one beacon sighting and how it is identified
//
// An Observation never changes once stored. Its RecordId is its position
// in the record store, and that id is the only thing any index holds.

#include <array>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <optional>
#include <string>

namespace blecube {

// Record identity = insertion order, starting at 0
using RecordId = uint32_t;

// Largest number of records a cube can hold (posting bitmaps are 32-bit)
constexpr uint64_t MAX_RECORDS = UINT32_MAX;

// Signal strength in dBm
using Rssi = int8_t;

// Caller-defined unit (seconds, millis, micros...)
using Timestamp = int64_t;

constexpr size_t MAC_LEN = 6;

// 48-bit hardware address
struct MacAddress {
    std::array<uint8_t, MAC_LEN> bytes{};

    bool operator==(const MacAddress& other) const { return bytes == other.bytes; }
    bool operator!=(const MacAddress& other) const { return bytes != other.bytes; }

    // Lexicographic byte order
    bool operator<(const MacAddress& other) const { return bytes < other.bytes; }

    uint64_t to_u64() const {
        uint64_t v = 0;
        for (uint8_t b : bytes) {
            v = (v << 8) | b;
        }
        return v;
    }

    // "AA:BB:CC:DD:EE:FF"
    std::string to_string() const {
        char buf[18];
        snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                 bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
        return buf;
    }

    // Accepts upper or lower case hex, separated by ':' or '-'
    static std::optional<MacAddress> from_string(const std::string& s) {
        if (s.size() != 17) return std::nullopt;

        MacAddress mac;
        for (size_t i = 0; i < MAC_LEN; ++i) {
            size_t pos = i * 3;
            if (i > 0 && s[pos - 1] != ':' && s[pos - 1] != '-') {
                return std::nullopt;
            }
            int hi = hex_value(s[pos]);
            int lo = hex_value(s[pos + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            mac.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return mac;
    }

private:
    static int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

// Hash function for MacAddress (for use in unordered containers)
struct MacAddressHash {
    size_t operator()(const MacAddress& mac) const {
        return std::hash<uint64_t>{}(mac.to_u64());
    }
};

// Single BLE observation. Field values are stored as given, never validated.
struct Observation {
    Rssi rssi = 0;
    MacAddress mac;
    Timestamp timestamp = 0;
    double lat = 0.0;      // degrees
    double lon = 0.0;      // degrees

    bool operator==(const Observation& other) const {
        return rssi == other.rssi && mac == other.mac &&
               timestamp == other.timestamp &&
               lat == other.lat && lon == other.lon;
    }

    bool operator!=(const Observation& other) const {
        return !(*this == other);
    }
};

} // namespace blecube
