#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

struct lua_State;

namespace bpfs::lua {

/// RAII wrapper around a Lua 5.0 state. Only the base, table, string and
/// math libraries are opened: configuration scripts get no io or os access.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }

    /// Set a global string variable.
    void set_global_string(const char* name, const char* value);

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code);

    /// Execute a file from the real filesystem. A missing file is NotFound,
    /// other read failures carry their errno; syntax and runtime errors are
    /// IOFailure with the chunk name in the message.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

private:
    lua_State* L_ = nullptr;
};

} // namespace bpfs::lua
