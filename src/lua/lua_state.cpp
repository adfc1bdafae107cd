#include "lua/lua_state.hpp"
#include "core/log.hpp"

#include <fstream>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace sky::lua {

LuaState::LuaState() {
    L_ = lua_open();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }

    // Config and event scripts only need the pure libraries.
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

void LuaState::register_function(const char* name, int (*fn)(lua_State*)) {
    lua_register(L_, name, fn);
}

void LuaState::register_logging() {
    register_function("LOG", log::l_LOG);
    register_function("WARN", log::l_WARN);
    register_function("SPEW", log::l_SPEW);
    register_function("ALERT", log::l_ALERT);
}

void LuaState::set_global_string(const char* name, const char* value) {
    lua_pushstring(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_number(const char* name, f64 value) {
    lua_pushnumber(L_, value);
    lua_setglobal(L_, name);
}

bool LuaState::has_function(const char* name) const {
    lua_getglobal(L_, name);
    bool is_fn = lua_isfunction(L_, -1);
    lua_pop(L_, 1);
    return is_fn;
}

Result<void> LuaState::run_chunk(int load_status) {
    if (load_status != 0) {
        std::string err = lua_tostring(L_, -1);
        lua_pop(L_, 1);
        return Error(std::move(err));
    }

    int status = lua_pcall(L_, 0, 0, 0);
    if (status != 0) {
        std::string err = lua_isstring(L_, -1) ? lua_tostring(L_, -1)
                                               : "(non-string error)";
        lua_pop(L_, 1);
        return Error(std::move(err));
    }

    return {};
}

Result<void> LuaState::do_string(std::string_view code) {
    return run_chunk(luaL_loadbuffer(L_, code.data(), code.size(), "=string"));
}

Result<void> LuaState::do_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error("Failed to open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (!file.read(buffer.data(), size)) {
        return Error("Failed to read file: " + path.string());
    }

    return do_buffer(buffer.data(), buffer.size(),
                     ("@" + path.string()).c_str());
}

Result<void> LuaState::do_buffer(const char* buf, size_t len,
                                 const char* name) {
    // Strip UTF-8 BOM if present
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }

    return run_chunk(luaL_loadbuffer(L_, buf, len, name));
}

} // namespace sky::lua
