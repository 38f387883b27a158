#pragma once
// BleCube: the unified API for beacon observations
//
// One owning aggregate over five structures that must agree:
// - RecordStore (the arena, owns every Observation)
// - MacIndex    (address -> ids)
// - RssiIndex   (signal strength -> ids, ordered)
// - TimeIndex   (timestamp -> ids, ordered)
// - SpatialIndex (R-tree over lat/lon)
//
// insert() is the only way in and threads each new id through all of
// them. Every query is const and reads indices only. Indices hold ids,
// never records, so they carry no lifetime ties to the store.
//
// Not synchronized: callers serialize inserts and read only while no
// insert is running.

#include "cube/types.hpp"
#include "types.hpp"
#include "log.hpp"
#include "posting.hpp"
#include "record_store.hpp"
#include "mac_index.hpp"
#include "ordered_index.hpp"
#include "spatial_index.hpp"
#include <optional>
#include <vector>

namespace blecube {

class BleCube {
public:
    BleCube() = default;

    explicit BleCube(CubeConfig config) : config_(config) {
        if (config_.verbose) {
            set_verbose(true);
        }
        reserve(config_.expected_records, config_.expected_macs);
    }

    // Preallocate for roughly `capacity` observations
    static BleCube with_capacity(size_t capacity) {
        CubeConfig config;
        config.expected_records = capacity;
        return BleCube(config);
    }

    BleCube(const BleCube&) = delete;
    BleCube& operator=(const BleCube&) = delete;
    BleCube(BleCube&&) = default;
    BleCube& operator=(BleCube&&) = default;

    // Capacity hint; no effect on results. macs = 0 estimates one
    // address per hundred records.
    void reserve(size_t records, size_t macs = 0) {
        if (records == 0 && macs == 0) return;
        if (macs == 0) macs = records / 100;

        records_.reserve(records);
        mac_index_.reserve(macs);
        log_debug("BleCube", "reserved %zu records, %zu mac buckets", records, macs);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Records
    // ═══════════════════════════════════════════════════════════════════════

    // Append an observation and index it. Returns its id (0, 1, 2, ...).
    RecordId insert(const Observation& obs) {
        RecordId id = records_.insert(obs);

        mac_index_.add(obs.mac, id);
        rssi_index_.add(obs.rssi, id);
        time_index_.add(obs.timestamp, id);
        geo_index_.insert(obs.lat, obs.lon, id);

        return id;
    }

    std::optional<Observation> get(RecordId id) const {
        return records_.get(id);
    }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    // ═══════════════════════════════════════════════════════════════════════
    // MAC address queries
    // ═══════════════════════════════════════════════════════════════════════

    std::vector<Observation> query_mac(const MacAddress& mac) const {
        return records_.resolve(mac_index_.find(mac));
    }

    // Distinct addresses, sorted lexicographically
    std::vector<MacAddress> get_all_macs() const {
        return mac_index_.keys();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // RSSI queries (grouped by ascending RSSI, then insertion order)
    // ═══════════════════════════════════════════════════════════════════════

    std::vector<Observation> query_rssi(Rssi rssi) const {
        return records_.resolve(rssi_index_.equal(rssi));
    }

    // [min, max] inclusive
    std::vector<Observation> query_rssi_range(Rssi min, Rssi max) const {
        return records_.resolve(rssi_index_.range(min, max));
    }

    std::vector<Observation> query_rssi_gt(Rssi threshold) const {
        return records_.resolve(rssi_index_.greater(threshold));
    }

    std::vector<Observation> query_rssi_gte(Rssi threshold) const {
        return records_.resolve(rssi_index_.greater_equal(threshold));
    }

    std::vector<Observation> query_rssi_lt(Rssi threshold) const {
        return records_.resolve(rssi_index_.less(threshold));
    }

    std::vector<Observation> query_rssi_lte(Rssi threshold) const {
        return records_.resolve(rssi_index_.less_equal(threshold));
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Timestamp queries
    // ═══════════════════════════════════════════════════════════════════════

    std::vector<Observation> query_timestamp(Timestamp t) const {
        return records_.resolve(time_index_.equal(t));
    }

    // [start, end] inclusive
    std::vector<Observation> query_time_range(Timestamp start, Timestamp end) const {
        return records_.resolve(time_index_.range(start, end));
    }

    // Strictly after t
    std::vector<Observation> query_time_after(Timestamp t) const {
        return records_.resolve(time_index_.greater(t));
    }

    // Strictly before t
    std::vector<Observation> query_time_before(Timestamp t) const {
        return records_.resolve(time_index_.less(t));
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Geolocation queries (ascending id order)
    // ═══════════════════════════════════════════════════════════════════════

    // Within radius_m meters (haversine) of (lat, lon)
    std::vector<Observation> query_geo_radius(double lat, double lon, double radius_m) const {
        return records_.resolve(geo_index_.radius(lat, lon, radius_m));
    }

    std::vector<Observation> query_geo_bbox(double min_lat, double min_lon,
                                            double max_lat, double max_lon) const {
        return records_.resolve(geo_index_.bbox(min_lat, min_lon, max_lat, max_lon));
    }

    // Vertices as (lat, lon); fewer than 3 returns empty
    std::vector<Observation> query_geo_polygon(const std::vector<LatLon>& vertices) const {
        return records_.resolve(geo_index_.polygon(vertices));
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Multi-dimensional queries
    // ═══════════════════════════════════════════════════════════════════════

    // Start from the MAC bucket (or every id), then keep only ids that also
    // match RSSI, then time, then geo. Order: ascending id, which is the
    // base set's own order.
    std::vector<RecordId> query_multi_ids(const MultiQuery& q) const {
        Posting candidates = q.mac
            ? Posting(mac_index_.find(*q.mac))
            : Posting::range(0, records_.size());

        if (q.rssi && !candidates.empty()) {
            candidates.intersect(Posting(rssi_index_.range(q.rssi->min, q.rssi->max)));
        }

        if (q.time && !candidates.empty()) {
            candidates.intersect(Posting(time_index_.range(q.time->start, q.time->end)));
        }

        if (q.geo && !candidates.empty()) {
            candidates.intersect(Posting(
                geo_index_.radius(q.geo->lat, q.geo->lon, q.geo->radius_m)));
        }

        return candidates.to_vector();
    }

    std::vector<Observation> query_multi(const MultiQuery& q) const {
        return records_.resolve(query_multi_ids(q));
    }

    std::vector<Observation> query_multi(const std::optional<MacAddress>& mac,
                                         const std::optional<RssiRange>& rssi,
                                         const std::optional<TimeRange>& time,
                                         const std::optional<GeoRadius>& geo) const {
        MultiQuery q;
        q.mac = mac;
        q.rssi = rssi;
        q.time = time;
        q.geo = geo;
        return query_multi(q);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Statistics
    // ═══════════════════════════════════════════════════════════════════════

    CubeStats stats() const {
        CubeStats s;
        s.records = records_.size();
        s.distinct_macs = mac_index_.key_count();
        s.distinct_rssi = rssi_index_.key_count();
        s.distinct_timestamps = time_index_.key_count();
        s.spatial_entries = geo_index_.size();
        return s;
    }

    const CubeConfig& config() const { return config_; }

private:
    CubeConfig config_;

    RecordStore records_;
    MacIndex mac_index_;
    RssiIndex rssi_index_;
    TimeIndex time_index_;
    SpatialIndex geo_index_;
};

} // namespace blecube
