#pragma once

#include "core/types.hpp"
#include "sim/sim_events.hpp"

#include <vector>

struct lua_State;

namespace sky::lua {

class LuaState;

/// Forwards drained simulation events to global Lua handlers named after
/// the event (OnEnemyDestroyed, OnPhaseChanged, ...). Events without a
/// handler are skipped. A handler that errors is logged and the remaining
/// events are still delivered.
class EventBridge {
public:
    explicit EventBridge(LuaState& state) : state_(state) {}

    /// Returns the number of handlers that ran without error.
    size_t dispatch(const std::vector<sim::SimEvent>& events);

    size_t delivered() const { return delivered_; }
    size_t failures() const { return failures_; }

    /// Global handler name for an event kind.
    static const char* handler_name(sim::EventKind kind);

private:
    bool deliver(lua_State* L, const sim::SimEvent& e);

    LuaState& state_;
    size_t delivered_ = 0;
    size_t failures_ = 0;
};

} // namespace sky::lua
