#pragma once

#include "sim/sim_config.hpp"
#include "sim/weapon.hpp"

namespace sky::sim {

struct SimSnapshot;

/// Applies the tick's input snapshot to the player: look, movement,
/// regeneration, then the weapon.
class PlayerSystem {
public:
    explicit PlayerSystem(const SimConfig& config)
        : config_(config), weapon_(config, config.equipped()) {}

    void update(SimSnapshot& s, f64 dt);

    const Weapon& weapon() const { return weapon_; }

private:
    void apply_look(SimSnapshot& s);
    void apply_movement(SimSnapshot& s, f32 dt);
    void regenerate(SimSnapshot& s, f32 dt);

    const SimConfig& config_;
    Weapon weapon_;
};

} // namespace sky::sim
