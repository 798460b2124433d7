#pragma once

#include "core/result.hpp"
#include "overlay/project_registry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bpfs::vfs {
class PhysicalStore;
}

namespace bpfs::overlay {

class VirtualSegmentPredicate;

/// Reserved name inside a project that exposes its potential tree.
constexpr const char* VIEWPORT_NAME = ".blueprint";

enum class Zone {
    Root,            ///< "/" - the mount root
    ProjectList,     ///< "/<collection>"
    Viewport,        ///< "/<collection>/<project>/.blueprint/..."
    ProjectRelative, ///< "/<collection>/<project>/..."
};

const char* zone_name(Zone zone);

enum class SegmentState {
    Physical, ///< Exists on disk
    Virtual,  ///< Declared by a template, not born yet
    Absent,   ///< Neither
};

struct PathSegment {
    std::string name;
    SegmentState state = SegmentState::Absent;
};

/// Result of resolving one caller-supplied path. Recomputed per call.
struct VirtualPathClassification {
    Zone zone = Zone::Root;
    std::string project;
    std::string relative_path; ///< Inside the project, no leading '/'
    std::string store_path;    ///< Relative to the physical store root
    std::string project_store_path;
    bool project_present = false;

    /// Segments of relative_path. For the viewport every segment found in
    /// the tree is Virtual.
    std::vector<PathSegment> segments;

    std::shared_ptr<const ProjectSession> session;
    const PotentialTree* node = nullptr; ///< Potential subtree at the leaf

    bool is_project_root() const { return segments.empty(); }

    /// State of the leaf; the project directory itself when relative_path
    /// is empty.
    SegmentState leaf_state() const;

    bool has_virtual_segment() const;
    bool has_virtual_ancestor() const;
    bool leaf_is_virtual() const { return leaf_state() == SegmentState::Virtual; }

    /// Every segment above the leaf is either physical or virtual.
    bool ancestors_present() const;

    /// Index of the first virtual segment.
    std::optional<size_t> first_virtual() const;

    /// Project-relative path with a leading '/', as the permission oracle
    /// expects it.
    std::string oracle_path() const { return "/" + relative_path; }

    /// relative_path without its last segment.
    std::string parent_relative_path() const;
};

/// Turns mount paths into classifications. Lexical validation runs before
/// any store call so a rejected path never touches the disk.
class PathClassifier {
public:
    PathClassifier(const vfs::PhysicalStore& store, ProjectRegistry& registry,
                   const VirtualSegmentPredicate& predicate);

    Result<VirtualPathClassification> classify(std::string_view path) const;

    /// Split and validate without consulting the store.
    static Result<std::vector<std::string>> split(std::string_view path);

private:
    const vfs::PhysicalStore& store_;
    ProjectRegistry& registry_;
    const VirtualSegmentPredicate& predicate_;

    void classify_project_relative(VirtualPathClassification& result) const;
};

} // namespace bpfs::overlay
