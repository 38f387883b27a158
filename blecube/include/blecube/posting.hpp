#pragma once
// Posting: a compressed set of record ids backed by a roaring bitmap
//
// Used by the multi-dimensional query to intersect per-dimension match
// sets. Iteration is always in ascending id order, which is also the
// insertion order of every bucket the cube builds.
//
//   - Membership: O(1)
//   - Intersection: O(min(n,m)) per container
//   - Export: ascending uint32 array

#include "types.hpp"
#include <roaring/roaring.h>
#include <vector>

namespace blecube {

class Posting {
public:
    Posting() : bitmap_(roaring_bitmap_create()) {}

    explicit Posting(const std::vector<RecordId>& ids)
        : bitmap_(roaring_bitmap_create()) {
        add_many(ids);
    }

    ~Posting() {
        if (bitmap_) roaring_bitmap_free(bitmap_);
    }

    Posting(const Posting&) = delete;
    Posting& operator=(const Posting&) = delete;

    Posting(Posting&& o) noexcept : bitmap_(o.bitmap_) {
        o.bitmap_ = nullptr;
    }

    Posting& operator=(Posting&& o) noexcept {
        if (this != &o) {
            if (bitmap_) roaring_bitmap_free(bitmap_);
            bitmap_ = o.bitmap_;
            o.bitmap_ = nullptr;
        }
        return *this;
    }

    // Every id in [begin, end)
    static Posting range(uint64_t begin, uint64_t end) {
        Posting p;
        if (end > begin) {
            roaring_bitmap_add_range(p.bitmap_, begin, end);
        }
        return p;
    }

    void add_many(const std::vector<RecordId>& ids) {
        if (ids.empty()) return;
        roaring_bitmap_add_many(bitmap_, ids.size(), ids.data());
    }

    bool contains(RecordId id) const {
        return roaring_bitmap_contains(bitmap_, id);
    }

    // Keep only ids also present in other
    void intersect(const Posting& other) {
        roaring_bitmap_and_inplace(bitmap_, other.bitmap_);
    }

    size_t cardinality() const {
        return static_cast<size_t>(roaring_bitmap_get_cardinality(bitmap_));
    }

    bool empty() const { return roaring_bitmap_is_empty(bitmap_); }

    std::vector<RecordId> to_vector() const {
        std::vector<RecordId> result(cardinality());
        if (!result.empty()) {
            roaring_bitmap_to_uint32_array(bitmap_, result.data());
        }
        return result;
    }

private:
    roaring_bitmap_t* bitmap_;
};

} // namespace blecube
