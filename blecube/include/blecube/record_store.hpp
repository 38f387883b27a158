#pragma once
// Record Store: the arena every index points into
//
// Append-only. A record's id is its position and is never reused.

#include "types.hpp"
#include <optional>
#include <stdexcept>
#include <vector>

namespace blecube {

class RecordStore {
public:
    RecordStore() = default;

    // Append and return the assigned id
    RecordId insert(const Observation& obs) {
        if (records_.size() >= MAX_RECORDS) {
            throw std::length_error("blecube: record id space exhausted");
        }
        RecordId id = static_cast<RecordId>(records_.size());
        records_.push_back(obs);
        return id;
    }

    // Absent (not an error) when id is out of range
    std::optional<Observation> get(RecordId id) const {
        if (id >= records_.size()) return std::nullopt;
        return records_[id];
    }

    // Resolve ids to records, skipping ids the store does not hold
    std::vector<Observation> resolve(const std::vector<RecordId>& ids) const {
        std::vector<Observation> result;
        result.reserve(ids.size());
        for (RecordId id : ids) {
            if (id < records_.size()) {
                result.push_back(records_[id]);
            }
        }
        return result;
    }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    void reserve(size_t n) { records_.reserve(n); }

private:
    std::vector<Observation> records_;
};

} // namespace blecube
