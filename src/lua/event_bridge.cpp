#include "lua/event_bridge.hpp"
#include "lua/lua_state.hpp"

#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace sky::lua {

using sim::EventKind;

namespace {

void push_position(lua_State* L, const sim::Vector3& v) {
    lua_pushnumber(L, v.x);
    lua_pushnumber(L, v.y);
    lua_pushnumber(L, v.z);
}

} // namespace

const char* EventBridge::handler_name(EventKind kind) {
    switch (kind) {
    case EventKind::EnemyDestroyed: return "OnEnemyDestroyed";
    case EventKind::EnemyDamaged: return "OnEnemyDamaged";
    case EventKind::PlayerHit: return "OnPlayerHit";
    case EventKind::ScoreChanged: return "OnScoreChanged";
    case EventKind::PhaseChanged: return "OnPhaseChanged";
    case EventKind::PickupAvailable: return "OnPickupAvailable";
    case EventKind::PickupCollected: return "OnPickupCollected";
    case EventKind::ProjectileBlocked: return "OnProjectileBlocked";
    case EventKind::PlayerDestroyed: return "OnPlayerDestroyed";
    case EventKind::PlayerStatusChanged: return "OnPlayerStatusChanged";
    }
    return "";
}

size_t EventBridge::dispatch(const std::vector<sim::SimEvent>& events) {
    lua_State* L = state_.raw();
    if (!L) return 0;

    size_t ok = 0;
    for (const auto& e : events) {
        if (deliver(L, e)) ++ok;
    }
    delivered_ += ok;
    return ok;
}

bool EventBridge::deliver(lua_State* L, const sim::SimEvent& e) {
    const char* name = handler_name(e.kind);
    lua_getglobal(L, name);
    if (!lua_isfunction(L, -1)) {
        lua_pop(L, 1);
        return false;
    }

    int nargs = 0;
    switch (e.kind) {
    case EventKind::EnemyDestroyed:
        lua_pushstring(L, sim::enemy_type_name(e.enemy_type));
        lua_pushnumber(L, e.stage);
        push_position(L, e.position);
        nargs = 5;
        break;
    case EventKind::EnemyDamaged:
        lua_pushstring(L, sim::enemy_type_name(e.enemy_type));
        lua_pushnumber(L, e.amount);
        nargs = 2;
        break;
    case EventKind::PlayerHit:
        lua_pushnumber(L, e.amount);
        nargs = 1;
        break;
    case EventKind::ScoreChanged:
        lua_pushnumber(L, static_cast<lua_Number>(e.score));
        lua_pushnumber(L, static_cast<lua_Number>(e.delta));
        nargs = 2;
        break;
    case EventKind::PhaseChanged:
        lua_pushstring(L, sim::phase_kind_name(e.phase));
        lua_pushnumber(L, e.stage);
        lua_pushnumber(L, e.wave_index + 1);
        nargs = 3;
        break;
    case EventKind::PickupAvailable:
        lua_pushstring(L, sim::pickup_kind_name(e.pickup));
        push_position(L, e.position);
        nargs = 4;
        break;
    case EventKind::PickupCollected:
        lua_pushstring(L, sim::pickup_kind_name(e.pickup));
        lua_pushnumber(L, e.amount);
        nargs = 2;
        break;
    case EventKind::ProjectileBlocked:
        push_position(L, e.position);
        nargs = 3;
        break;
    case EventKind::PlayerDestroyed:
        break;
    case EventKind::PlayerStatusChanged:
        lua_pushnumber(L, e.amount);
        lua_pushnumber(L, e.value);
        nargs = 2;
        break;
    }

    if (lua_pcall(L, nargs, 0, 0) != 0) {
        const char* msg = lua_isstring(L, -1) ? lua_tostring(L, -1)
                                              : "(non-string error)";
        spdlog::warn("{} error: {}", name, msg);
        lua_pop(L, 1);
        ++failures_;
        return false;
    }
    return true;
}

} // namespace sky::lua
