#include "overlay/materialized_memo.hpp"

namespace bpfs::overlay {

MaterializedMemo::MaterializedMemo(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

bool MaterializedMemo::contains(std::string_view store_path) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(store_path)) != 0;
}

void MaterializedMemo::record(std::string_view store_path) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = entries_.emplace(store_path);
    if (!inserted) return;
    order_.push_back(*it);

    while (entries_.size() > capacity_) {
        evict_stale_front();
        if (order_.empty()) break;
        entries_.erase(order_.front());
        order_.pop_front();
    }
    // Keep the queue from growing with entries already invalidated.
    if (order_.size() > 2 * capacity_) {
        std::deque<std::string> live;
        for (auto& path : order_) {
            if (entries_.count(path)) live.push_back(std::move(path));
        }
        order_.swap(live);
    }
}

void MaterializedMemo::evict_stale_front() {
    // Entries invalidated earlier still sit in the queue.
    while (!order_.empty() && entries_.count(order_.front()) == 0) {
        order_.pop_front();
    }
}

void MaterializedMemo::invalidate(std::string_view store_path) {
    std::lock_guard lock(mutex_);
    entries_.erase(std::string(store_path));
}

void MaterializedMemo::invalidate_prefix(std::string_view store_path) {
    std::lock_guard lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& path = *it;
        bool below = path.size() > store_path.size() &&
                     path.compare(0, store_path.size(), store_path) == 0 &&
                     path[store_path.size()] == '/';
        if (path == store_path || below) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t MaterializedMemo::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

} // namespace bpfs::overlay
