#pragma once

#include "sim/sim_config.hpp"

namespace sky::sim {

struct SimSnapshot;
struct EnemyRecord;
struct ProjectileRecord;
class EnemySystem;

/// Spatial interaction pass, run after all motion for the tick:
///   (a) player vs enemy: push-out and ram damage
///   (b) player projectile vs enemy, with payload handling
///   (c) player projectile vs enemy projectile
///   (d) enemy projectile vs player
/// Pickup collection runs right after in PickupSystem.
class CollisionSystem {
public:
    CollisionSystem(const SimConfig& config, const EnemySystem& enemies)
        : config_(config), enemies_(enemies) {}

    void resolve(SimSnapshot& s, f64 dt);

    void player_vs_enemies(SimSnapshot& s, f32 dt);
    void projectiles_vs_enemies(SimSnapshot& s);
    void projectiles_vs_projectiles(SimSnapshot& s);
    void enemy_projectiles_vs_player(SimSnapshot& s);

private:
    /// Hit test radius for p against e, including any pulse extent.
    bool hits(const ProjectileRecord& p, const EnemyRecord& e) const;

    void on_hit(SimSnapshot& s, ProjectileRecord& p, EnemyRecord& e);
    void retarget_chain(SimSnapshot& s, ProjectileRecord& p);

    const SimConfig& config_;
    const EnemySystem& enemies_;
};

} // namespace sky::sim
