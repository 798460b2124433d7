#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"

#include <optional>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace bpfs::lua {

namespace {

Error type_error(const std::string& name, const char* expected) {
    return Error("'" + name + "' must be " + expected);
}

/// Read the string at the top of the stack; numbers are accepted.
std::optional<std::string> top_string(lua_State* L) {
    if (lua_type(L, -1) != LUA_TSTRING && lua_type(L, -1) != LUA_TNUMBER) {
        return std::nullopt;
    }
    return std::string(lua_tostring(L, -1));
}

/// Read an array of strings (or a single string) at the top of the stack.
Result<std::vector<std::string>> top_string_list(lua_State* L,
                                                 const std::string& name) {
    std::vector<std::string> values;
    if (auto single = top_string(L)) {
        values.push_back(std::move(*single));
        return values;
    }
    if (!lua_istable(L, -1)) {
        return type_error(name, "a string or an array of strings");
    }

    // Iterate the array: t[1], t[2], ...
    for (int i = 1;; i++) {
        lua_rawgeti(L, -1, i);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        auto value = top_string(L);
        lua_pop(L, 1);
        if (!value) {
            return type_error(name + "[" + std::to_string(i) + "]", "a string");
        }
        values.push_back(std::move(*value));
    }
    return values;
}

/// Push field `key` of the table at the top of the stack.
void push_field(lua_State* L, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, -2);
}

Result<std::optional<std::string>> global_string(lua_State* L,
                                                 const char* name) {
    lua_getglobal(L, name);
    if (lua_isnil(L, -1)) {
        lua_pop(L, 1);
        return std::optional<std::string>{};
    }
    auto value = top_string(L);
    lua_pop(L, 1);
    if (!value) return type_error(name, "a string");
    return std::optional<std::string>(std::move(*value));
}

Result<std::optional<bool>> global_bool(lua_State* L, const char* name) {
    lua_getglobal(L, name);
    if (lua_isnil(L, -1)) {
        lua_pop(L, 1);
        return std::optional<bool>{};
    }
    if (!lua_isboolean(L, -1)) {
        lua_pop(L, 1);
        return type_error(name, "a boolean");
    }
    bool value = lua_toboolean(L, -1) != 0;
    lua_pop(L, 1);
    return std::optional<bool>(value);
}

Result<std::optional<double>> global_number(lua_State* L, const char* name) {
    lua_getglobal(L, name);
    if (lua_isnil(L, -1)) {
        lua_pop(L, 1);
        return std::optional<double>{};
    }
    if (lua_type(L, -1) != LUA_TNUMBER) {
        lua_pop(L, 1);
        return type_error(name, "a number");
    }
    double value = lua_tonumber(L, -1);
    lua_pop(L, 1);
    return std::optional<double>(value);
}

Result<std::optional<std::vector<std::string>>> global_string_list(
    lua_State* L, const char* name) {
    lua_getglobal(L, name);
    if (lua_isnil(L, -1)) {
        lua_pop(L, 1);
        return std::optional<std::vector<std::string>>{};
    }
    auto values = top_string_list(L, name);
    lua_pop(L, 1);
    if (!values) return values.error();
    return std::optional<std::vector<std::string>>(std::move(values.value()));
}

} // namespace

Result<void> MountConfig::validate() const {
    if (store_root.empty()) {
        return Error("no physical store root configured (--store)");
    }
    if (projects_dir.empty() || projects_dir[0] == '.' ||
        projects_dir.find('/') != std::string::npos ||
        projects_dir.find("..") != std::string::npos) {
        return Error("invalid project collection name '" + projects_dir + "'");
    }
    if (memo_capacity == 0) {
        return Error("memo_capacity must be positive");
    }
    return {};
}

Result<void> ConfigLoader::load_mount_config(LuaState& state,
                                             const fs::path& file,
                                             MountConfig& config) {
    spdlog::info("Executing config file: {}", file.string());

    auto config_dir = file.parent_path().string();
    state.set_global_string("ConfigFileDir", config_dir.c_str());

    auto result = state.do_file(file);
    if (!result) {
        return Error(result.error().kind,
                     "Failed to execute config file: " + result.error().message,
                     result.error().sys_errno);
    }

    lua_State* L = state.raw();

    auto store = global_string(L, "store");
    if (!store) return store.error();
    if (store.value()) config.store_root = *store.value();

    auto mountpoint = global_string(L, "mountpoint");
    if (!mountpoint) return mountpoint.error();
    if (mountpoint.value()) config.mount_point = *mountpoint.value();

    auto templates = global_string(L, "templates");
    if (!templates) return templates.error();
    if (templates.value()) config.templates_root = *templates.value();

    auto projects_dir = global_string(L, "projects_dir");
    if (!projects_dir) return projects_dir.error();
    if (projects_dir.value()) config.projects_dir = *projects_dir.value();

    auto log_file = global_string(L, "log_file");
    if (!log_file) return log_file.error();
    if (log_file.value()) config.log_file = *log_file.value();

    auto defaults = global_string_list(L, "default_templates");
    if (!defaults) return defaults.error();
    if (defaults.value()) config.default_templates = *defaults.value();

    auto foreground = global_bool(L, "foreground");
    if (!foreground) return foreground.error();
    if (foreground.value()) config.foreground = *foreground.value();

    auto verbose = global_bool(L, "verbose");
    if (!verbose) return verbose.error();
    if (verbose.value()) config.verbose = *verbose.value();

    auto memo_capacity = global_number(L, "memo_capacity");
    if (!memo_capacity) return memo_capacity.error();
    if (memo_capacity.value()) {
        if (*memo_capacity.value() < 1) {
            return Error("memo_capacity must be positive");
        }
        config.memo_capacity = static_cast<size_t>(*memo_capacity.value());
    }

    lua_getglobal(L, "permissions");
    if (!lua_isnil(L, -1)) {
        std::vector<overlay::PermissionRule> rules;
        auto perm_result = read_permission_table(L, rules);
        if (!perm_result) {
            lua_pop(L, 1);
            return perm_result;
        }
        config.permissions = std::move(rules);
    }
    lua_pop(L, 1);

    lua_getglobal(L, "users");
    if (!lua_isnil(L, -1)) {
        overlay::UserRoles users;
        auto user_result = read_user_table(L, users);
        if (!user_result) {
            lua_pop(L, 1);
            return user_result;
        }
        config.users = std::move(users);
    }
    lua_pop(L, 1);

    return {};
}

Result<void> ConfigLoader::read_permission_table(
    lua_State* L, std::vector<overlay::PermissionRule>& out) {
    if (!lua_istable(L, -1)) {
        return type_error("permissions", "an array of tables");
    }

    for (int i = 1;; i++) {
        lua_rawgeti(L, -1, i);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        std::string entry_name = "permissions[" + std::to_string(i) + "]";
        if (!lua_istable(L, -1)) {
            lua_pop(L, 1);
            return type_error(entry_name, "a table");
        }

        overlay::PermissionRule rule;

        push_field(L, "role");
        auto role = top_string(L);
        lua_pop(L, 1);

        push_field(L, "path");
        auto path = top_string(L);
        lua_pop(L, 1);

        push_field(L, "rights");
        auto rights = top_string_list(L, entry_name + ".rights");
        lua_pop(L, 1);

        lua_pop(L, 1); // pop entry table

        if (!role) return type_error(entry_name + ".role", "a string");
        if (!rights) return rights.error();

        rule.role = std::move(*role);
        rule.path = path ? std::move(*path) : std::string("/*");
        rule.rights = std::move(rights.value());
        out.push_back(std::move(rule));
    }

    return {};
}

Result<void> ConfigLoader::read_user_table(lua_State* L,
                                           overlay::UserRoles& out) {
    if (!lua_istable(L, -1)) {
        return type_error("users", "a table of role lists");
    }

    lua_pushnil(L);
    while (lua_next(L, -2) != 0) {
        if (lua_type(L, -2) != LUA_TSTRING) {
            lua_pop(L, 2);
            return type_error("users", "keyed by user name");
        }
        std::string user = lua_tostring(L, -2);
        auto roles = top_string_list(L, "users." + user);
        lua_pop(L, 1);
        if (!roles) {
            lua_pop(L, 1); // key
            return roles.error();
        }
        out[user] = std::move(roles.value());
    }

    return {};
}

Result<project::ProjectRoot> ConfigLoader::load_project_manifest(
    LuaState& state, const fs::path& project_dir) {
    auto manifest = project::marker_path(project_dir);
    auto result = state.do_file(manifest);
    if (!result) {
        return Error(result.error().kind, "Failed to execute manifest " +
                                              manifest.string() + ": " +
                                              result.error().message);
    }

    lua_State* L = state.raw();
    project::ProjectRoot root;
    root.path = project_dir;

    auto templates = global_string_list(L, "templates");
    if (!templates) return templates.error();
    if (templates.value()) root.templates = std::move(*templates.value());

    lua_getglobal(L, "sections");
    if (!lua_isnil(L, -1)) {
        auto section_result = read_section_table(L, root);
        if (!section_result) {
            lua_pop(L, 1);
            return section_result.error();
        }
    }
    lua_pop(L, 1);

    return root;
}

Result<void> ConfigLoader::read_section_table(lua_State* L,
                                              project::ProjectRoot& root) {
    if (!lua_istable(L, -1)) {
        return type_error("sections", "a table");
    }

    lua_pushnil(L);
    while (lua_next(L, -2) != 0) {
        // key at -2, value at -1
        if (lua_type(L, -2) != LUA_TSTRING) {
            lua_pop(L, 1);
            continue;
        }
        std::string section = lua_tostring(L, -2);

        std::optional<std::string> inherit;
        if (lua_istable(L, -1)) {
            push_field(L, "inherit");
            inherit = top_string(L);
            lua_pop(L, 1);
        } else {
            // Shorthand: sections = { acl = "fix" }
            inherit = top_string(L);
        }
        lua_pop(L, 1); // pop value, keep key for lua_next

        if (!inherit) continue;
        auto mode = project::parse_inherit_mode(*inherit);
        if (!mode) {
            spdlog::warn("event=manifest_invalid project={} section={} "
                         "inherit='{}' using=dynamic",
                         root.path.string(), section, *inherit);
            continue;
        }
        root.sections[section] = *mode;
    }

    return {};
}

} // namespace bpfs::lua
