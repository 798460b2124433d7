#include "overlay/segment_predicate.hpp"
#include "overlay/potential_tree.hpp"
#include "vfs/physical_store.hpp"

namespace bpfs::overlay {

bool TreeMembershipPredicate::is_virtual_segment(
    std::string_view name, size_t /*depth*/, const PotentialTree* parent_node,
    std::string_view parent_store_path, bool parent_is_virtual,
    const vfs::PhysicalStore& store) const {
    if (!parent_node || !parent_node->contains(name)) return false;
    // Nothing can exist below a directory that has not been born.
    if (parent_is_virtual) return true;
    return !store.exists(vfs::join_path(parent_store_path, name));
}

} // namespace bpfs::overlay
