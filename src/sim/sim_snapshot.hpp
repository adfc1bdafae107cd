#pragma once

#include "sim/entity.hpp"
#include "sim/entity_pool.hpp"
#include "sim/pickup.hpp"
#include "sim/projectile.hpp"
#include "sim/sim_config.hpp"
#include "sim/sim_events.hpp"

#include <random>
#include <vector>

namespace sky::sim {

/// Device-independent input for one tick. Axes are in [-1, 1] for movement
/// and raw pointer deltas for look.
struct InputSnapshot {
    f32 move_x = 0;
    f32 move_y = 0;
    f32 look_x = 0;
    f32 look_y = 0;
    bool boost = false;
    bool fire = false;
};

struct PlayerState {
    Vector3 position;
    Vector3 prev_position;
    f32 yaw = 0;
    f32 pitch = 0;
    Quaternion orientation;
    f32 hp = 100;
    f32 max_hp = 100;
    f32 shields = 100;
    f32 max_shields = 100;
    f32 energy = 100;
    f32 max_energy = 100;
    bool is_boosting = false;
    bool is_firing = false;
    f32 weapon_cooldown = 0;
    f32 turbo_timer = 0;
};

struct WaveState {
    PhaseKind phase = PhaseKind::Intro;
    u32 wave_index = 0;
    Seconds phase_elapsed = 0;
    u32 spawned = 0;
    Seconds last_spawn_time = -1.0e9;
    bool elite_spawned = false;
    bool boss_spawned = false;
    bool bonus_awarded = false;
    u32 stage = 1;
    u32 cycles_completed = 0;
};

/// The canonical mutable world state. Systems mutate it in place, in order,
/// once per tick; presentation reads it between ticks.
struct SimSnapshot {
    explicit SimSnapshot(const SimConfig& config);

    SimSnapshot(const SimSnapshot&) = delete;
    SimSnapshot& operator=(const SimSnapshot&) = delete;

    PlayerState player;
    InputSnapshot input;

    EntityPool<EnemyRecord> enemy_pool;
    EntityPool<ProjectileRecord> projectile_pool;
    EntityPool<PickupRecord> pickup_pool;

    std::vector<EnemyRecord*> enemies;
    std::vector<ProjectileRecord*> projectiles;
    std::vector<PickupRecord*> pickups;

    u64 score = 0;
    Seconds elapsed = 0;
    f64 delta = 0;
    u64 tick_count = 0;

    WaveState wave;
    EventQueue events;
    std::mt19937 rng;
    u32 next_entity_id = 1;
    bool game_over = false;

    u32 pending_projectile_removals = 0;
    u32 kills = 0;

    // Values at tick start, compared at tick end for the batched events.
    u64 tick_start_score = 0;
    f32 tick_start_hp = 0;
    f32 tick_start_shields = 0;

    u32 next_id() { return next_entity_id++; }

    /// Uniform draw in [0, 1) from the snapshot's RNG.
    f32 random01();

    /// Active records of the given type, dying ones included. Always
    /// computed from the live list.
    size_t live_count(EnemyType type) const;

    /// Deactivate every enemy, projectile and pickup and return them to
    /// their pools.
    void clear_entities();

    const char* phase_name() const { return phase_kind_name(wave.phase); }
};

} // namespace sky::sim
