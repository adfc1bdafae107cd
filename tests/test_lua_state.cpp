#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "lua/lua_state.hpp"

#include <string>
#include <utility>

extern "C" {
#include <lua.h>
}

using namespace sky::lua;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("LuaState creation and basic execution", "[lua]") {
    LuaState state;
    REQUIRE(state.raw() != nullptr);

    auto result = state.do_string("x = 1 + 2");
    REQUIRE(result.ok());

    lua_getglobal(state.raw(), "x");
    CHECK(lua_tonumber(state.raw(), -1) == 3);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState register and call C function", "[lua]") {
    LuaState state;

    static int called = 0;
    state.register_function("test_fn", [](lua_State* L) -> int {
        called++;
        lua_pushnumber(L, 42);
        return 1;
    });

    called = 0;
    auto result = state.do_string("result = test_fn()");
    REQUIRE(result.ok());
    CHECK(called == 1);

    lua_getglobal(state.raw(), "result");
    CHECK(lua_tonumber(state.raw(), -1) == 42);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState globals are visible to scripts", "[lua]") {
    LuaState state;
    state.set_global_string("name", "skyward");
    state.set_global_number("rate", 60);

    auto result = state.do_string(R"(
        ok = (name == "skyward") and (rate == 60)
    )");
    REQUIRE(result.ok());

    lua_getglobal(state.raw(), "ok");
    CHECK(lua_toboolean(state.raw(), -1) == 1);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState has_function", "[lua]") {
    LuaState state;
    REQUIRE(state.do_string("function OnTick() end; NotAFunction = 3").ok());

    CHECK(state.has_function("OnTick"));
    CHECK_FALSE(state.has_function("NotAFunction"));
    CHECK_FALSE(state.has_function("Missing"));
    CHECK(lua_gettop(state.raw()) == 0);
}

TEST_CASE("LuaState reports syntax and runtime errors", "[lua]") {
    LuaState state;

    auto syntax = state.do_string("x = = 1");
    REQUIRE_FALSE(syntax.ok());
    CHECK_FALSE(syntax.error().message.empty());

    auto runtime = state.do_string("error('boom')");
    REQUIRE_FALSE(runtime.ok());
    CHECK_THAT(runtime.error().message, ContainsSubstring("boom"));

    // The state is still usable and the stack is clean.
    CHECK(lua_gettop(state.raw()) == 0);
    CHECK(state.do_string("y = 1").ok());
}

TEST_CASE("LuaState do_buffer strips a UTF-8 BOM", "[lua]") {
    LuaState state;
    const std::string code = "\xEF\xBB\xBFz = 5";

    auto result = state.do_buffer(code.data(), code.size(), "=bom");
    REQUIRE(result.ok());

    lua_getglobal(state.raw(), "z");
    CHECK(lua_tonumber(state.raw(), -1) == 5);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState do_file reports missing files", "[lua]") {
    LuaState state;
    auto result = state.do_file("/nonexistent/skyward/missing.lua");
    REQUIRE_FALSE(result.ok());
    CHECK_THAT(result.error().message, ContainsSubstring("Failed to open file"));
}

TEST_CASE("LuaState logging functions are callable", "[lua]") {
    LuaState state;
    state.register_logging();

    auto result = state.do_string(R"(
        LOG("hello", 1, true)
        SPEW("detail")
        WARN("careful", nil)
        ALERT("bad", {})
    )");
    CHECK(result.ok());
}

TEST_CASE("LuaState moves ownership", "[lua]") {
    LuaState a;
    REQUIRE(a.do_string("kept = 9").ok());
    lua_State* raw = a.raw();

    LuaState b(std::move(a));
    CHECK(a.raw() == nullptr);
    CHECK(b.raw() == raw);

    lua_getglobal(b.raw(), "kept");
    CHECK(lua_tonumber(b.raw(), -1) == 9);
    lua_pop(b.raw(), 1);
}
