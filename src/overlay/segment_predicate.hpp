#pragma once

#include <cstddef>
#include <string_view>

namespace bpfs::vfs {
class PhysicalStore;
}

namespace bpfs::overlay {

class PotentialTree;

/// Decides whether one path segment names a still-virtual potential entry.
/// The classifier asks once per segment, top-down; swapping the marking
/// scheme only requires a different implementation of this interface.
class VirtualSegmentPredicate {
public:
    virtual ~VirtualSegmentPredicate() = default;

    /// name:              the segment being tested
    /// depth:             0 for the first segment below the project root
    /// parent_node:       potential subtree at the parent, or nullptr
    /// parent_store_path: store-relative path of the parent directory
    /// parent_is_virtual: the parent itself was classified virtual
    virtual bool is_virtual_segment(std::string_view name, size_t depth,
                                    const PotentialTree* parent_node,
                                    std::string_view parent_store_path,
                                    bool parent_is_virtual,
                                    const vfs::PhysicalStore& store) const = 0;
};

/// Default rule: a segment is virtual when the potential tree declares it
/// at this depth and nothing of that name exists on disk. Physical reality
/// always wins.
class TreeMembershipPredicate : public VirtualSegmentPredicate {
public:
    bool is_virtual_segment(std::string_view name, size_t depth,
                            const PotentialTree* parent_node,
                            std::string_view parent_store_path,
                            bool parent_is_virtual,
                            const vfs::PhysicalStore& store) const override;
};

} // namespace bpfs::overlay
