#include "overlay/potential_tree.hpp"

#include <algorithm>

namespace bpfs::overlay {

size_t PotentialTree::lower_bound(std::string_view name) const {
    auto it = std::lower_bound(
        names_.begin(), names_.end(), name,
        [](const std::string& a, std::string_view b) { return a < b; });
    return static_cast<size_t>(it - names_.begin());
}

bool PotentialTree::contains(std::string_view name) const {
    return child(name) != nullptr;
}

const PotentialTree* PotentialTree::child(std::string_view name) const {
    size_t i = lower_bound(name);
    if (i < names_.size() && names_[i] == name) {
        return &subtrees_[i];
    }
    return nullptr;
}

PotentialTree& PotentialTree::add_child(std::string_view name) {
    size_t i = lower_bound(name);
    if (i < names_.size() && names_[i] == name) {
        return subtrees_[i];
    }
    names_.insert(names_.begin() + static_cast<std::ptrdiff_t>(i),
                  std::string(name));
    subtrees_.insert(subtrees_.begin() + static_cast<std::ptrdiff_t>(i),
                     PotentialTree{});
    return subtrees_[i];
}

const PotentialTree* PotentialTree::find(std::string_view relative_path) const {
    const PotentialTree* node = this;
    while (node && !relative_path.empty()) {
        size_t slash = relative_path.find('/');
        auto segment = relative_path.substr(0, slash);
        if (!segment.empty()) {
            node = node->child(segment);
        }
        if (slash == std::string_view::npos) break;
        relative_path.remove_prefix(slash + 1);
    }
    return node;
}

size_t PotentialTree::node_count() const {
    size_t count = names_.size();
    for (const auto& subtree : subtrees_) {
        count += subtree.node_count();
    }
    return count;
}

void PotentialTree::merge_from(const PotentialTree& other) {
    for (size_t i = 0; i < other.names_.size(); i++) {
        add_child(other.names_[i]).merge_from(other.subtrees_[i]);
    }
}

PotentialTree PotentialTree::merge(const PotentialTree& a,
                                   const PotentialTree& b) {
    PotentialTree result = a;
    result.merge_from(b);
    return result;
}

} // namespace bpfs::overlay
