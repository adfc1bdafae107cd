#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sim/sim_config.hpp"

#include <string_view>

namespace sky::lua {

class LuaState;

/// Builds a SimConfig from a Lua file. The script sets any subset of the
/// globals Stages, Archetypes, Waves, Phases, Bounds, Combat, Player,
/// Weapons, Pools, Seed, MaxStage and EquippedWeapon; everything it leaves
/// out keeps the value from the base config.
///
/// Stages and Waves replace the base lists when present. Archetypes and
/// Weapons are merged by key, so a script can retune one type or add a new
/// weapon without restating the rest.
class ConfigLoader {
public:
    static Result<sim::SimConfig> load_file(
        const fs::path& path,
        sim::SimConfig base = sim::SimConfig::defaults());

    static Result<sim::SimConfig> load_string(
        std::string_view code,
        sim::SimConfig base = sim::SimConfig::defaults());

    /// Read the config globals out of an already executed state.
    static Result<void> apply(LuaState& state, sim::SimConfig& config);
};

} // namespace sky::lua
