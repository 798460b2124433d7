#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>

namespace bpfs::overlay {

/// Bounded record of store paths recently observed as materialized. Only a
/// hint: a hit must still be confirmed against the physical store, and a
/// failed confirmation invalidates the entry. Oldest entries are evicted
/// first once capacity is reached.
class MaterializedMemo {
public:
    explicit MaterializedMemo(size_t capacity);

    bool contains(std::string_view store_path) const;
    void record(std::string_view store_path);
    void invalidate(std::string_view store_path);

    /// Drop a path and everything below it.
    void invalidate_prefix(std::string_view store_path);

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<std::string> order_; // insertion order, for eviction
    std::unordered_set<std::string> entries_;

    void evict_stale_front();
};

} // namespace bpfs::overlay
