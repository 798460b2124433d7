#pragma once

#include "core/result.hpp"
#include "overlay/potential_tree.hpp"
#include "overlay/tree_builder.hpp"
#include "project/project_config.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace bpfs::vfs {
class PhysicalStore;
}

namespace bpfs::overlay {

/// Everything the overlay knows about one project for the lifetime of a
/// session. Immutable once built; a reload replaces the whole session.
struct ProjectSession {
    std::string name;
    project::ProjectRoot root;
    bool has_manifest = false;
    fs::path templates_root;
    std::vector<std::string> templates; ///< Effective list after inheritance
    PotentialTree tree;
    BuildReport report;
};

/// Lazily discovers projects under <store>/<collection> and caches one
/// session per project.
class ProjectRegistry {
public:
    struct Options {
        std::string collection = "projects";
        fs::path templates_root; ///< Empty = <project>/Templates
        std::vector<std::string> default_templates;
    };

    ProjectRegistry(const vfs::PhysicalStore& store,
                    const project::ProjectConfigProvider& provider,
                    Options options);

    const std::string& collection() const { return options_.collection; }

    /// Store-relative path of a project directory.
    std::string project_store_path(std::string_view project) const;

    /// Session of an existing project, loading it on first use. nullptr
    /// when no project directory of that name exists. The directory is
    /// checked on every call; a cached session whose directory is gone is
    /// dropped.
    std::shared_ptr<const ProjectSession> session(std::string_view project);

    /// Rebuild one project's session from its manifest and templates.
    std::shared_ptr<const ProjectSession> reload(std::string_view project);

    /// Drop every cached session; each is rebuilt on next use.
    void reload_all();

    /// Forget a project whose directory was removed.
    void forget(std::string_view project);

    /// Non-hidden project directories, sorted.
    Result<std::vector<std::string>> list_projects() const;

    size_t cached_count() const;

    /// Templates a project ends up with under its "templates" section
    /// inherit mode.
    static std::vector<std::string> effective_templates(
        const project::ProjectRoot& root,
        const std::vector<std::string>& defaults);

    /// Configured templates root, or <project_dir>/Templates.
    fs::path templates_root_for(const fs::path& project_dir) const;

private:
    const vfs::PhysicalStore& store_;
    const project::ProjectConfigProvider& provider_;
    Options options_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const ProjectSession>, std::less<>>
        sessions_;

    std::shared_ptr<const ProjectSession> load(std::string_view project) const;
};

} // namespace bpfs::overlay
