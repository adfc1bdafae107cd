#pragma once

#include "core/types.hpp"
#include "sim/enemy_types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sky::sim {

/// Projectile behavior variant.
enum class PayloadType : u8 {
    Standard,
    Piercing,
    Chain,
    Area,
    Spread,
    DelayedBurst,
    Spiral,
    Grid,
};

const char* payload_name(PayloadType payload);
std::optional<PayloadType> payload_from_string(std::string_view name);

/// Box an enemy spawns in:
///   x = (r - 0.5) * x_spread
///   y = (r - 0.5) * y_spread + y_offset
///   z = z_near - r * (z_near - z_far)
struct SpawnRegion {
    f32 x_spread = 80.0f;
    f32 y_spread = 20.0f;
    f32 y_offset = 20.0f;
    f32 z_near = -300.0f;
    f32 z_far = -400.0f;
};

/// Per-stage archetype. The archetype type uses hp/speed/region directly;
/// every other type is scaled by the multipliers.
struct StageArchetype {
    EnemyType type = EnemyType::Drone;
    f32 hp = 60.0f;
    f32 speed = 40.0f;
    SpawnRegion region;
    f32 hp_multiplier = 1.0f;
    f32 speed_multiplier = 1.0f;
};

struct EnemyGun {
    bool enabled = false;
    f32 cooldown = 0;
    f32 speed = 0;
    f32 damage = 0;
    f32 range = 0;
};

/// Base tuning for one enemy type, used outside its own archetype stage.
struct TypeTuning {
    f32 base_hp = 60.0f;
    f32 base_speed = 40.0f;
    SpawnRegion region;
    f32 hit_radius = 15.0f;
    f32 contact_radius = 15.0f;
    u32 score = 100;
    f32 ram_damage = 10.0f;
    EnemyGun gun;
};

/// One wave of the spawn sequence. An empty type means "the current stage's
/// archetype".
struct WaveDef {
    std::optional<EnemyType> type;
    u32 quota = 8;
    Seconds spawn_interval = 1.5;
    u32 max_concurrent = 4;
};

struct PhaseTimers {
    Seconds intro_duration = 3.0;
    Seconds elite_settle_delay = 2.0;
    Seconds elite_min_elapsed = 3.0;
    Seconds boss_approach_duration = 4.0;
    Seconds victory_duration = 5.0;
    u32 boss_victory_bonus = 10000;
};

struct Bounds {
    f32 wall_z = -35.0f;
    f32 floor_y = -10.0f;
    f32 despawn_near_z = 50.0f;
    f32 despawn_far_z = -1000.0f;
    f32 lateral_cap = 200.0f;
    f32 boss_floor_z = -120.0f;
    f32 projectile_max_range = 500.0f;
};

struct CombatTuning {
    f32 disintegration_duration = 0.8f;
    f32 player_radius = 8.0f;
    f32 push_force = 50.0f;
    Seconds contact_interval = 1.0;
    f32 player_hit_radius = 3.0f;
    f32 intercept_radius = 2.0f;
    f32 enemy_projectile_lifetime = 4.0f;
};

struct DropTable {
    f32 health_chance = 0.20f;
    f32 shield_chance = 0.15f;
    f32 boost_chance = 0.05f;
    u32 min_stage = 2;
    f32 health_value = 20.0f;
    f32 shield_value = 20.0f;
    f32 boost_seconds = 30.0f;
    f32 pickup_radius = 20.0f;
    f32 drift_y = 5.0f;
    f32 drift_z = 20.0f;
    f32 expire_z = 50.0f;
    Seconds lifetime = 10.0;
};

struct PlayerTuning {
    f32 max_hp = 100.0f;
    f32 max_shields = 100.0f;
    f32 max_energy = 100.0f;
    f32 shield_regen = 2.0f;
    f32 energy_regen = 15.0f;
    f32 speed = 40.0f;
    f32 boost_multiplier = 2.0f;
    f32 boost_drain = 25.0f;
    f32 move_limit_x = 60.0f;
    f32 move_limit_y = 30.0f;
    f32 look_sensitivity = 0.0015f;
    f32 pitch_limit = 0.33f * 3.14159265f;
    f32 gun_offset_x = 2.2f;
};

/// Player weapon definition. Only the fields for the weapon's payload are
/// read; the rest keep their defaults.
struct WeaponDef {
    std::string id;
    PayloadType payload = PayloadType::Standard;
    f32 speed = 150.0f;
    f32 damage = 15.0f;
    f32 energy_cost = 5.0f;
    f32 fire_rate = 2.0f;
    f32 lifetime = 2.0f;

    u32 pierce_count = 0;

    u32 max_bounces = 0;
    f32 bounce_range = 0;
    f32 damage_decay = 0;

    f32 start_radius = 0;
    f32 max_radius = 0;
    f32 expand_rate = 0;

    u32 pellet_count = 0;
    f32 spread_angle = 0; // degrees

    f32 stick_duration = 0;
    f32 explosion_radius = 0;
    f32 explosion_damage = 0;

    f32 spiral_radius = 0;
    f32 spiral_speed = 0;
    u32 hits_per_target = 0;
};

struct PoolSizes {
    size_t enemy_initial = 100;
    size_t enemy_soft_cap = 200;
    size_t projectile_initial = 500;
    size_t projectile_soft_cap = 1000;
    size_t pickup_initial = 32;
    size_t pickup_soft_cap = 64;
};

/// All tunables of the simulation. Systems hold a const reference; nothing
/// here changes while a run is in progress.
struct SimConfig {
    std::vector<StageArchetype> stages;
    std::array<TypeTuning, ENEMY_TYPE_COUNT> types{};
    std::vector<WaveDef> waves;
    PhaseTimers phases;
    Bounds bounds;
    CombatTuning combat;
    DropTable drops;
    PlayerTuning player;
    std::vector<WeaponDef> weapons;
    std::string equipped_weapon = "plasma_bolt";
    PoolSizes pools;
    u32 seed = 1337;
    u32 max_stage = 20;

    static SimConfig defaults();

    /// Stage entry for a 1-based stage; stages past the table reuse the last.
    const StageArchetype& stage_entry(u32 stage) const;

    const TypeTuning& tuning(EnemyType type) const { return types[index_of(type)]; }
    TypeTuning& tuning(EnemyType type) { return types[index_of(type)]; }

    const WeaponDef* find_weapon(std::string_view id) const;
    WeaponDef* find_weapon(std::string_view id);

    /// The equipped weapon, falling back to the first entry.
    const WeaponDef& equipped() const;
};

} // namespace sky::sim
