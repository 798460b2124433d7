#pragma once

#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bpfs::project {

/// Marker that identifies a project root: <root>/.bpfs/project.lua
constexpr const char* MARKER_DIR = ".bpfs";
constexpr const char* MARKER_FILE = "project.lua";

/// How a configuration section follows its parent.
enum class InheritMode {
    Fixed,    ///< Keeps its own value, never updated from the parent
    Dynamic,  ///< Follows the parent (default)
    Excluded, ///< Not inherited at all
};

const char* inherit_mode_name(InheritMode mode);

/// Accepts "fix"/"fixed", "dynamic", "not"/"excluded" (case-insensitive).
std::optional<InheritMode> parse_inherit_mode(std::string_view value);

/// A discovered project: its directory and its declared configuration.
struct ProjectRoot {
    fs::path path;
    std::vector<std::string> templates; ///< Declaration order
    std::map<std::string, InheritMode, std::less<>> sections;

    /// Inherit mode of a named section; Dynamic when unspecified.
    InheritMode inherit_mode(std::string_view section) const;
};

fs::path marker_path(const fs::path& project_dir);

/// Source of project configuration. Implementations parse whatever
/// manifest format they own; the overlay only consumes the results.
class ProjectConfigProvider {
public:
    virtual ~ProjectConfigProvider() = default;

    /// Walk up from start until a directory carrying the marker is found.
    /// The walk never goes above boundary (when non-empty) or the
    /// filesystem root. Returns nullopt when no project is found or its
    /// manifest is unreadable.
    virtual std::optional<ProjectRoot> find_project(
        const fs::path& start, const fs::path& boundary = {}) const = 0;
};

} // namespace bpfs::project
