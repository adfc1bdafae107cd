#pragma once

#include "sim/entity.hpp"
#include "sim/sim_config.hpp"

namespace sky::sim {

struct SimSnapshot;

/// HP, speed and spawn box an enemy type gets at a given stage.
struct ResolvedArchetype {
    f32 hp = 0;
    f32 speed = 0;
    SpawnRegion region;
};

/// Per-tick enemy behavior: death animation, kinematic movement rules,
/// bounds, despawn and enemy fire. Also owns spawning.
class EnemySystem {
public:
    explicit EnemySystem(const SimConfig& config) : config_(config) {}

    void update(SimSnapshot& s, f64 dt);

    /// Spawn at a random point of the type's spawn region.
    EnemyRecord* spawn(SimSnapshot& s, EnemyType type);

    /// Spawn at an exact position.
    EnemyRecord* spawn_at(SimSnapshot& s, EnemyType type, const Vector3& pos);

    /// The stage's archetype supplies its own type; everything else uses the
    /// base tuning scaled by the stage multipliers.
    ResolvedArchetype resolve(EnemyType type, u32 stage) const;

    /// Depth wall and floor, plus the boss closing-distance floor.
    void clamp_to_bounds(EnemyRecord& e) const;

    bool out_of_bounds(const EnemyRecord& e) const;

private:
    void update_dying(EnemyRecord& e, f32 dt);
    void move(const SimSnapshot& s, EnemyRecord& e, f32 dt);
    void try_fire(SimSnapshot& s, EnemyRecord& e);
    void compact(SimSnapshot& s);

    const SimConfig& config_;
};

} // namespace sky::sim
