#pragma once

#include "project/project_config.hpp"

namespace bpfs::lua {

/// Project configuration read from Lua manifests (.bpfs/project.lua).
/// Each manifest is executed in a fresh state so projects never see each
/// other's globals.
class LuaProjectConfig : public project::ProjectConfigProvider {
public:
    std::optional<project::ProjectRoot> find_project(
        const fs::path& start, const fs::path& boundary = {}) const override;

    /// Load the manifest of a directory known to be a project root.
    Result<project::ProjectRoot> load(const fs::path& project_dir) const;
};

} // namespace bpfs::lua
