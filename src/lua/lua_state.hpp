#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

struct lua_State;

namespace sky::lua {

/// RAII wrapper around a Lua 5.0 state.
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

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    /// Install LOG, WARN, SPEW and ALERT, forwarding to spdlog.
    void register_logging();

    /// Set a global string variable.
    void set_global_string(const char* name, const char* value);

    /// Set a global number.
    void set_global_number(const char* name, f64 value);

    /// True if the global is a function.
    bool has_function(const char* name) const;

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code);

    /// Execute a file from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

private:
    Result<void> run_chunk(int load_status);

    lua_State* L_ = nullptr;
};

} // namespace sky::lua
