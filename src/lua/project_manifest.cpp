#include "lua/project_manifest.hpp"
#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"

#include <spdlog/spdlog.h>

namespace bpfs::lua {

Result<project::ProjectRoot> LuaProjectConfig::load(
    const fs::path& project_dir) const {
    LuaState state;
    ConfigLoader loader;
    return loader.load_project_manifest(state, project_dir);
}

static fs::path normalized_dir(const fs::path& path) {
    auto result = path.lexically_normal();
    if (!result.has_filename() && result.has_relative_path()) {
        result = result.parent_path(); // drop trailing separator
    }
    return result;
}

std::optional<project::ProjectRoot> LuaProjectConfig::find_project(
    const fs::path& start, const fs::path& boundary) const {
    std::error_code ec;
    fs::path dir = normalized_dir(start);
    fs::path stop = boundary.empty() ? fs::path{} : normalized_dir(boundary);

    while (!dir.empty()) {
        if (fs::is_regular_file(project::marker_path(dir), ec)) {
            auto root = load(dir);
            if (!root) {
                spdlog::warn("event=manifest_invalid project={} error=\"{}\"",
                             dir.string(), root.error().message);
                return std::nullopt;
            }
            return root.value();
        }

        if (!stop.empty() && dir == stop) break;
        auto parent = dir.parent_path();
        if (parent == dir) break; // filesystem root
        dir = parent;
    }
    return std::nullopt;
}

} // namespace bpfs::lua
