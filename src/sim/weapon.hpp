#pragma once

#include "core/types.hpp"
#include "sim/entity.hpp"
#include "sim/sim_config.hpp"

namespace sky::sim {

struct SimSnapshot;

/// The player's equipped gun.
class Weapon {
public:
    Weapon(const SimConfig& config, const WeaponDef& def)
        : config_(config), def_(def) {}

    /// Per-tick: count down the cooldown and fire if the trigger is held.
    void update(SimSnapshot& s, f64 dt);

    const WeaponDef& def() const { return def_; }

    /// Seconds between shots at the current turbo state.
    f32 cooldown_for(bool turbo) const;

    /// Unit aim direction for a yaw/pitch pair. Yaw 0, pitch 0 looks down -z.
    static Vector3 aim_direction(f32 yaw, f32 pitch);

private:
    bool try_fire(SimSnapshot& s);
    void launch(SimSnapshot& s, const Vector3& origin, const Vector3& dir);

    const SimConfig& config_;
    const WeaponDef& def_;
};

} // namespace sky::sim
