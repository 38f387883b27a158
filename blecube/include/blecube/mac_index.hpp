#pragma once
// MAC Index: hardware address -> record ids
//
// Unordered buckets. Each bucket lists ids in insertion order.
// keys() is sorted explicitly; hash-map iteration order is never exposed.

#include "types.hpp"
#include <algorithm>
#include <unordered_map>
#include <vector>

namespace blecube {

class MacIndex {
public:
    void add(const MacAddress& mac, RecordId id) {
        buckets_[mac].push_back(id);
    }

    // Ids for an address, empty if never seen
    std::vector<RecordId> find(const MacAddress& mac) const {
        auto it = buckets_.find(mac);
        if (it == buckets_.end()) return {};
        return it->second;
    }

    // Every distinct address, lexicographic byte order
    std::vector<MacAddress> keys() const {
        std::vector<MacAddress> result;
        result.reserve(buckets_.size());
        for (const auto& [mac, ids] : buckets_) {
            result.push_back(mac);
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    size_t key_count() const { return buckets_.size(); }

    void reserve(size_t n) { buckets_.reserve(n); }

private:
    std::unordered_map<MacAddress, std::vector<RecordId>, MacAddressHash> buckets_;
};

} // namespace blecube
