#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace sky::log {

void init(const std::filesystem::path& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            log_file.string(), true));
    }

    auto logger = std::make_shared<spdlog::logger>("skyward", sinks.begin(),
                                                   sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
    spdlog::info("Skyward simulation core v0.3.0");
}

void set_level(const std::string& level) {
    spdlog::set_level(spdlog::level::from_str(level));
}

void shutdown() {
    spdlog::shutdown();
}

/// Concatenate all Lua arguments into a single string. Non-string values are
/// rendered by type name so a handler can log tables without crashing.
static std::string lua_concat_args(lua_State* L) {
    int n = lua_gettop(L);
    std::string result;
    for (int i = 1; i <= n; i++) {
        if (lua_isstring(L, i)) {
            result += lua_tostring(L, i);
        } else if (lua_isnil(L, i)) {
            result += "nil";
        } else if (lua_isboolean(L, i)) {
            result += lua_toboolean(L, i) ? "true" : "false";
        } else {
            result += lua_typename(L, lua_type(L, i));
        }
        if (i < n) result += ' ';
    }
    return result;
}

int l_LOG(lua_State* L) {
    spdlog::info("[lua] {}", lua_concat_args(L));
    return 0;
}

int l_WARN(lua_State* L) {
    spdlog::warn("[lua] {}", lua_concat_args(L));
    return 0;
}

int l_SPEW(lua_State* L) {
    spdlog::debug("[lua] {}", lua_concat_args(L));
    return 0;
}

int l_ALERT(lua_State* L) {
    spdlog::error("[lua] {}", lua_concat_args(L));
    return 0;
}

} // namespace sky::log
