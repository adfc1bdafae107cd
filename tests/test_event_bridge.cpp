#include <catch2/catch_test_macros.hpp>
#include "lua/event_bridge.hpp"
#include "lua/lua_state.hpp"
#include "sim/sim_events.hpp"

#include <cstring>
#include <string>
#include <vector>

extern "C" {
#include <lua.h>
}

using namespace sky;
using namespace sky::sim;
using sky::lua::EventBridge;
using sky::lua::LuaState;

namespace {

f64 global_number(LuaState& state, const char* name) {
    lua_getglobal(state.raw(), name);
    f64 v = lua_tonumber(state.raw(), -1);
    lua_pop(state.raw(), 1);
    return v;
}

std::string global_string(LuaState& state, const char* name) {
    lua_getglobal(state.raw(), name);
    std::string v = lua_isstring(state.raw(), -1) ? lua_tostring(state.raw(), -1) : "";
    lua_pop(state.raw(), 1);
    return v;
}

} // namespace

TEST_CASE("Handler names follow the event kinds", "[bridge]") {
    CHECK(std::strcmp(EventBridge::handler_name(EventKind::EnemyDestroyed),
                      "OnEnemyDestroyed") == 0);
    CHECK(std::strcmp(EventBridge::handler_name(EventKind::PhaseChanged),
                      "OnPhaseChanged") == 0);
    CHECK(std::strcmp(EventBridge::handler_name(EventKind::PlayerStatusChanged),
                      "OnPlayerStatusChanged") == 0);

    for (size_t i = 0; i < EVENT_KIND_COUNT; i++) {
        auto kind = static_cast<EventKind>(i);
        CHECK(std::string("On") + event_name(kind) ==
              EventBridge::handler_name(kind));
    }
}

TEST_CASE("Events reach their Lua handlers with arguments", "[bridge]") {
    LuaState state;
    state.register_logging();
    REQUIRE(state.do_string(R"(
        destroyed = 0
        function OnEnemyDestroyed(kind, stage, x, y, z)
            destroyed = destroyed + 1
            last_kind = kind
            last_stage = stage
            last_z = z
        end
        function OnPhaseChanged(phase, stage, wave)
            phase_name = phase
            phase_wave = wave
        end
        function OnScoreChanged(score, delta)
            score_total = score
            score_delta = delta
        end
        function OnPickupCollected(kind, value)
            pickup_kind = kind
            pickup_value = value
        end
        function OnPlayerStatusChanged(hull, shields)
            status_hull = hull
            status_shields = shields
        end
    )").ok());

    EventQueue queue;
    queue.enemy_destroyed(EnemyType::Fighter, 4, {1, 2, -80});
    queue.enemy_destroyed(EnemyType::Boss, 4, {0, 30, -120});
    queue.phase_changed(PhaseKind::Wave, 2, 4);
    queue.score_changed(12500, 5200);
    queue.pickup_collected(PickupKind::WeaponBoost, 30.0f);
    queue.player_status_changed(80.0f, 15.0f);
    queue.player_hit(5.0f); // no handler

    std::vector<SimEvent> events;
    queue.drain(events);

    EventBridge bridge(state);
    CHECK(bridge.dispatch(events) == 6);
    CHECK(bridge.delivered() == 6);
    CHECK(bridge.failures() == 0);

    CHECK(global_number(state, "destroyed") == 2);
    CHECK(global_string(state, "last_kind") == "boss");
    CHECK(global_number(state, "last_stage") == 4);
    CHECK(global_number(state, "last_z") == -120);
    CHECK(global_string(state, "phase_name") == "wave");
    CHECK(global_number(state, "phase_wave") == 3);
    CHECK(global_number(state, "score_total") == 12500);
    CHECK(global_number(state, "score_delta") == 5200);
    CHECK(global_string(state, "pickup_kind") == "weapon_boost");
    CHECK(global_number(state, "pickup_value") == 30);
    CHECK(global_number(state, "status_hull") == 80);
    CHECK(global_number(state, "status_shields") == 15);
    CHECK(lua_gettop(state.raw()) == 0);
}

TEST_CASE("A failing handler does not stop delivery", "[bridge]") {
    LuaState state;
    REQUIRE(state.do_string(R"(
        hits = 0
        function OnPlayerHit(amount)
            if amount > 50 then error("too much damage") end
            hits = hits + 1
        end
    )").ok());

    EventQueue queue;
    queue.player_hit(10.0f);
    queue.player_hit(99.0f);
    queue.player_hit(20.0f);

    EventBridge bridge(state);
    CHECK(bridge.dispatch(queue.events()) == 2);
    CHECK(bridge.failures() == 1);
    CHECK(global_number(state, "hits") == 2);
    CHECK(lua_gettop(state.raw()) == 0);

    // Counters accumulate across dispatches.
    bridge.dispatch(queue.events());
    CHECK(bridge.delivered() == 4);
    CHECK(bridge.failures() == 2);
}

TEST_CASE("Shipped event script accepts every event", "[bridge]") {
    LuaState state;
    state.register_logging();
    state.set_global_number("Seed", 1337);
    state.set_global_string("EquippedWeapon", "plasma_bolt");
    REQUIRE(state.do_file(std::string(SKY_SOURCE_DIR) + "/scripts/events.lua").ok());
    CHECK(state.has_function("OnPlayerDestroyed"));

    EventQueue queue;
    queue.phase_changed(PhaseKind::Intro, 0, 1);
    queue.enemy_destroyed(EnemyType::Drone, 1, {0, 0, -50});
    queue.enemy_damaged(EnemyType::Drone, 15.0f);
    queue.player_hit(10.0f);
    queue.score_changed(100, 100);
    queue.pickup_available(PickupKind::Health, {0, 0, -40});
    queue.pickup_collected(PickupKind::Health, 20.0f);
    queue.projectile_blocked({0, 0, -5});
    queue.player_status_changed(90.0f, 0.0f);
    queue.player_destroyed();

    EventBridge bridge(state);
    bridge.dispatch(queue.events());
    CHECK(bridge.failures() == 0);
    CHECK(bridge.delivered() > 0);
}
