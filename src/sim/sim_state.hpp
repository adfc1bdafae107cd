#pragma once

#include "sim/collision.hpp"
#include "sim/enemy_system.hpp"
#include "sim/pickup.hpp"
#include "sim/player.hpp"
#include "sim/projectile.hpp"
#include "sim/sim_config.hpp"
#include "sim/sim_snapshot.hpp"
#include "sim/wave_manager.hpp"

namespace sky::sim {

/// Owns the configuration, the world snapshot and every system, and runs
/// them in a fixed order once per tick.
class SimState {
public:
    explicit SimState(SimConfig config);

    SimState(const SimState&) = delete;
    SimState& operator=(const SimState&) = delete;

    /// Advance the simulation by dt seconds:
    ///   player -> waves -> enemies -> projectiles -> collision -> pickups
    /// followed by the batched score and player status events.
    void tick(f64 dt);

    void set_input(const InputSnapshot& input) { snapshot_.input = input; }

    const SimSnapshot& snapshot() const { return snapshot_; }
    SimSnapshot& snapshot() { return snapshot_; }

    const SimConfig& config() const { return config_; }

    EnemySystem& enemies() { return enemies_; }
    WaveManager& waves() { return waves_; }
    ProjectileSystem& projectiles() { return projectiles_; }
    CollisionSystem& collision() { return collision_; }

    u64 tick_count() const { return snapshot_.tick_count; }
    Seconds elapsed() const { return snapshot_.elapsed; }
    bool game_over() const { return snapshot_.game_over; }

    static constexpr f64 SECONDS_PER_TICK = 1.0 / 60.0;

private:
    void begin_tick(f64 dt);
    void end_tick();

    // Declaration order matters: systems keep references to config_.
    const SimConfig config_;
    SimSnapshot snapshot_;
    PlayerSystem player_;
    EnemySystem enemies_;
    WaveManager waves_;
    ProjectileSystem projectiles_;
    CollisionSystem collision_;
    PickupSystem pickups_;
};

} // namespace sky::sim
