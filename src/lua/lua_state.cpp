#include "lua/lua_state.hpp"

#include <cerrno>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace bpfs::lua {

namespace {

/// Pop the error message a failed load or call left on the stack. Script
/// failures are IOFailure: the script could not be used.
Error script_error(lua_State* L, const char* phase, const char* chunk) {
    const char* msg = lua_tostring(L, -1);
    std::string text = std::string(phase) + " in " + chunk + ": " +
                       (msg ? msg : "unknown Lua error");
    lua_pop(L, 1);
    return Error(ErrorKind::IOFailure, std::move(text));
}

/// Whole-file read; errno decides the error kind.
Result<std::vector<char>> read_script(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Error::from_errno(errno, "cannot open script " + path.string());
    }

    std::vector<char> buffer;
    struct stat st {};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        buffer.reserve(static_cast<size_t>(st.st_size));
    }

    char chunk[4096];
    for (;;) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return Error::from_errno(err, "cannot read script " + path.string());
        }
        if (n == 0) break;
        buffer.insert(buffer.end(), chunk, chunk + n);
    }
    ::close(fd);
    return buffer;
}

} // namespace

LuaState::LuaState() {
    L_ = lua_open();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }

    // No io, os, or debug: scripts only assign values.
    luaopen_base(L_);
    luaopen_table(L_);
    luaopen_string(L_);
    luaopen_math(L_);
    lua_settop(L_, 0);
}

LuaState::~LuaState() {
    if (L_) {
        lua_close(L_);
    }
}

LuaState::LuaState(LuaState&& other) noexcept : L_(other.L_) {
    other.L_ = nullptr;
}

LuaState& LuaState::operator=(LuaState&& other) noexcept {
    if (this != &other) {
        if (L_) lua_close(L_);
        L_ = other.L_;
        other.L_ = nullptr;
    }
    return *this;
}

void LuaState::set_global_string(const char* name, const char* value) {
    lua_pushstring(L_, value);
    lua_setglobal(L_, name);
}

Result<void> LuaState::do_string(std::string_view code) {
    return do_buffer(code.data(), code.size(), "=string");
}

Result<void> LuaState::do_file(const fs::path& path) {
    auto script = read_script(path);
    if (!script) return script.error();

    const auto& buffer = script.value();
    return do_buffer(buffer.data(), buffer.size(),
                     ("@" + path.string()).c_str());
}

Result<void> LuaState::do_buffer(const char* buf, size_t len,
                                 const char* name) {
    if (!L_) {
        return Error(ErrorKind::IOFailure, "Lua state not available", ENOMEM);
    }

    // Editors on Windows save config scripts with a BOM
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }

    const char* chunk = name[0] == '@' || name[0] == '=' ? name + 1 : name;
    if (luaL_loadbuffer(L_, buf, len, name) != 0) {
        return script_error(L_, "syntax error", chunk);
    }
    if (lua_pcall(L_, 0, 0, 0) != 0) {
        return script_error(L_, "runtime error", chunk);
    }
    return {};
}

} // namespace bpfs::lua
