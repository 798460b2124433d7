#include "overlay/project_registry.hpp"
#include "vfs/physical_store.hpp"

#include <algorithm>
#include <mutex>
#include <spdlog/spdlog.h>

namespace bpfs::overlay {

/// Section of the manifest that controls template inheritance.
static constexpr const char* TEMPLATES_SECTION = "templates";

ProjectRegistry::ProjectRegistry(const vfs::PhysicalStore& store,
                                 const project::ProjectConfigProvider& provider,
                                 Options options)
    : store_(store), provider_(provider), options_(std::move(options)) {}

std::string ProjectRegistry::project_store_path(std::string_view project) const {
    return vfs::join_path(options_.collection, project);
}

fs::path ProjectRegistry::templates_root_for(const fs::path& project_dir) const {
    if (!options_.templates_root.empty()) return options_.templates_root;
    return project_dir / "Templates";
}

std::vector<std::string> ProjectRegistry::effective_templates(
    const project::ProjectRoot& root,
    const std::vector<std::string>& defaults) {
    std::vector<std::string> result;
    auto append_unique = [&result](const std::vector<std::string>& ids) {
        for (const auto& id : ids) {
            if (std::find(result.begin(), result.end(), id) == result.end()) {
                result.push_back(id);
            }
        }
    };

    switch (root.inherit_mode(TEMPLATES_SECTION)) {
    case project::InheritMode::Dynamic:
        append_unique(defaults);
        append_unique(root.templates);
        break;
    case project::InheritMode::Fixed:
        append_unique(root.templates);
        break;
    case project::InheritMode::Excluded:
        break;
    }
    return result;
}

std::shared_ptr<const ProjectSession> ProjectRegistry::load(
    std::string_view project) const {
    auto store_path = project_store_path(project);
    auto info = store_.get_file_info(store_path);
    if (!info || !info->is_folder) return nullptr;

    auto session = std::make_shared<ProjectSession>();
    session->name = std::string(project);
    fs::path dir = store_.resolve(store_path);

    // The boundary keeps the walk inside this project directory.
    auto root = provider_.find_project(dir, dir);
    if (root) {
        session->root = std::move(*root);
        session->has_manifest = true;
    } else {
        session->root.path = dir;
    }

    session->templates_root = templates_root_for(dir);
    if (session->has_manifest) {
        session->templates =
            effective_templates(session->root, options_.default_templates);
    } else {
        session->templates = options_.default_templates;
    }

    TreeBuilder builder(session->templates_root);
    session->tree = builder.build(session->templates, &session->report);

    spdlog::info("event=project_loaded project={} manifest={} templates={} "
                 "top_level={} missing={}",
                 session->name, session->has_manifest,
                 session->templates.size(), session->tree.size(),
                 session->report.missing.size());
    return session;
}

std::shared_ptr<const ProjectSession> ProjectRegistry::session(
    std::string_view project) {
    std::shared_ptr<const ProjectSession> cached;
    {
        std::shared_lock lock(mutex_);
        auto it = sessions_.find(project);
        if (it != sessions_.end()) cached = it->second;
    }
    if (cached) {
        // The session caches templates, never existence.
        auto info = store_.get_file_info(project_store_path(project));
        if (info && info->is_folder) return cached;
        forget(project);
        spdlog::info("event=project_forgotten project={} reason=missing",
                     project);
        return nullptr;
    }

    // Build outside the lock; a concurrent loader of the same project
    // produces an identical session and the first insert wins.
    auto loaded = load(project);
    if (!loaded) return nullptr;

    std::unique_lock lock(mutex_);
    auto [it, inserted] = sessions_.try_emplace(std::string(project), loaded);
    return it->second;
}

std::shared_ptr<const ProjectSession> ProjectRegistry::reload(
    std::string_view project) {
    auto loaded = load(project);

    std::unique_lock lock(mutex_);
    auto it = sessions_.find(project);
    if (!loaded) {
        if (it != sessions_.end()) sessions_.erase(it);
        return nullptr;
    }
    if (it != sessions_.end()) {
        it->second = loaded;
    } else {
        sessions_.emplace(std::string(project), loaded);
    }
    spdlog::info("event=project_reloaded project={}", project);
    return loaded;
}

void ProjectRegistry::reload_all() {
    std::unique_lock lock(mutex_);
    sessions_.clear();
}

void ProjectRegistry::forget(std::string_view project) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(project);
    if (it != sessions_.end()) sessions_.erase(it);
}

Result<std::vector<std::string>> ProjectRegistry::list_projects() const {
    auto entries = store_.list_directory(options_.collection);
    if (!entries) return entries.error();

    std::vector<std::string> projects;
    for (const auto& name : entries.value()) {
        if (name.empty() || name[0] == '.') continue;
        auto info = store_.get_file_info(vfs::join_path(options_.collection, name));
        if (info && info->is_folder) projects.push_back(name);
    }
    return projects;
}

size_t ProjectRegistry::cached_count() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

} // namespace bpfs::overlay
