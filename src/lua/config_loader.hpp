#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "overlay/permission_oracle.hpp"
#include "project/project_config.hpp"

extern "C" {
struct lua_State;
}

namespace bpfs::lua {

class LuaState;

/// Process-wide mount parameters.
struct MountConfig {
    fs::path store_root;     ///< Physical store root
    fs::path mount_point;
    fs::path templates_root; ///< Empty = <project root>/Templates
    std::string projects_dir = "projects"; ///< Project-collection name
    std::vector<std::string> default_templates;
    bool foreground = true;
    bool verbose = false;
    fs::path log_file;
    size_t memo_capacity = 4096;
    std::vector<overlay::PermissionRule> permissions;
    overlay::UserRoles users; ///< Empty = each user name is its own role

    /// Check the values are usable for a mount.
    Result<void> validate() const;
};

/// Reads configuration scripts. Scripts are plain Lua assigning globals;
/// values are read back after execution.
class ConfigLoader {
public:
    /// Execute a mount configuration file and overlay the globals it sets
    /// onto config. Globals the script leaves nil keep their current value.
    Result<void> load_mount_config(LuaState& state, const fs::path& file,
                                   MountConfig& config);

    /// Execute a project manifest (<project>/.bpfs/project.lua).
    Result<project::ProjectRoot> load_project_manifest(
        LuaState& state, const fs::path& project_dir);

private:
    /// Parse the permissions table at the top of the stack.
    Result<void> read_permission_table(lua_State* L,
                                       std::vector<overlay::PermissionRule>& out);

    /// Parse the users table ({ name = { role, ... } }) at the top of the
    /// stack.
    Result<void> read_user_table(lua_State* L, overlay::UserRoles& out);

    /// Parse the sections table at the top of the stack.
    Result<void> read_section_table(lua_State* L, project::ProjectRoot& root);
};

} // namespace bpfs::lua
