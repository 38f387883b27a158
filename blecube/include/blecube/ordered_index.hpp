#pragma once
// Ordered Index: sorted key -> record ids, with range scans
//
// Results are grouped by ascending key, then insertion order inside each
// bucket. All bounds are inclusive except greater()/less().

#include "types.hpp"
#include <limits>
#include <map>
#include <vector>

namespace blecube {

template<typename Key>
class OrderedIndex {
public:
    using Buckets = std::map<Key, std::vector<RecordId>>;

    void add(Key key, RecordId id) {
        buckets_[key].push_back(id);
    }

    std::vector<RecordId> equal(Key key) const {
        auto it = buckets_.find(key);
        if (it == buckets_.end()) return {};
        return it->second;
    }

    // [min, max], empty when min > max
    std::vector<RecordId> range(Key min, Key max) const {
        if (min > max) return {};
        return collect(buckets_.lower_bound(min), buckets_.upper_bound(max));
    }

    // Keys strictly above threshold: the scan starts at threshold + 1,
    // so the type's maximum has nothing above it
    std::vector<RecordId> greater(Key threshold) const {
        if (threshold == std::numeric_limits<Key>::max()) return {};
        Key start = static_cast<Key>(threshold + 1);
        return collect(buckets_.lower_bound(start), buckets_.end());
    }

    std::vector<RecordId> greater_equal(Key threshold) const {
        return collect(buckets_.lower_bound(threshold), buckets_.end());
    }

    std::vector<RecordId> less(Key threshold) const {
        return collect(buckets_.begin(), buckets_.lower_bound(threshold));
    }

    std::vector<RecordId> less_equal(Key threshold) const {
        return collect(buckets_.begin(), buckets_.upper_bound(threshold));
    }

    size_t key_count() const { return buckets_.size(); }

private:
    static std::vector<RecordId> collect(typename Buckets::const_iterator first,
                                         typename Buckets::const_iterator last) {
        std::vector<RecordId> result;
        for (auto it = first; it != last; ++it) {
            result.insert(result.end(), it->second.begin(), it->second.end());
        }
        return result;
    }

    Buckets buckets_;
};

using RssiIndex = OrderedIndex<Rssi>;
using TimeIndex = OrderedIndex<Timestamp>;

} // namespace blecube
