#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

// Forward declare lua_State to avoid pulling in Lua headers everywhere
struct lua_State;

namespace sky::log {

/// Initialize logging with a console sink and, when log_file is non-empty,
/// a truncating file sink.
void init(const std::filesystem::path& log_file = "skyward.log");

/// Change the level of the default logger ("trace", "debug", "info", ...).
void set_level(const std::string& level);

/// Flush and shutdown logging.
void shutdown();

// Lua-side logging functions (C functions registered into config and
// event scripts)
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);
int l_ALERT(lua_State* L);

} // namespace sky::log
