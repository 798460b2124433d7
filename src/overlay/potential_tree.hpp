#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace bpfs::overlay {

/// Recursive name -> subtree mapping of folder names that could exist.
/// Children are kept sorted by name so listings are stable.
class PotentialTree {
public:
    PotentialTree() = default;

    bool empty() const { return names_.empty(); }
    size_t size() const { return names_.size(); }

    bool contains(std::string_view name) const;

    /// Direct child subtree, or nullptr.
    const PotentialTree* child(std::string_view name) const;

    /// Insert a child (or return the existing one) and return it.
    PotentialTree& add_child(std::string_view name);

    /// Descend along a '/'-separated relative path ("" = this node).
    /// Returns nullptr if any segment is missing.
    const PotentialTree* find(std::string_view relative_path) const;

    /// Child names in lexical order.
    const std::vector<std::string>& names() const { return names_; }

    /// Total number of nodes below this one.
    size_t node_count() const;

    /// Union-merge other into this tree: keys present on both sides merge
    /// their subtrees recursively, keys on one side are copied.
    void merge_from(const PotentialTree& other);

    /// merge(a, b) == merge(b, a); merge(a, a) == a.
    static PotentialTree merge(const PotentialTree& a, const PotentialTree& b);

    bool operator==(const PotentialTree& other) const = default;

private:
    // Parallel vectors, sorted by name.
    std::vector<std::string> names_;
    std::vector<PotentialTree> subtrees_;

    size_t lower_bound(std::string_view name) const;
};

} // namespace bpfs::overlay
