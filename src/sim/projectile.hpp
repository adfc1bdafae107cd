#pragma once

#include "sim/entity.hpp"
#include "sim/sim_config.hpp"

#include <array>
#include <variant>

namespace sky::sim {

struct SimSnapshot;

/// Fixed-capacity set of enemy ids a projectile already damaged. When full,
/// the oldest entry is overwritten.
struct HitList {
    static constexpr size_t CAPACITY = 32;

    std::array<u32, CAPACITY> ids{};
    u32 count = 0;
    u32 next = 0;

    bool contains(u32 id) const {
        for (u32 i = 0; i < count; ++i) {
            if (ids[i] == id) return true;
        }
        return false;
    }

    void add(u32 id) {
        ids[next] = id;
        next = (next + 1) % CAPACITY;
        if (count < CAPACITY) ++count;
    }
};

struct PierceState {
    u32 remaining = 0;
    HitList hits;
};

struct ChainState {
    u32 bounces_remaining = 0;
    f32 bounce_range = 0;
    f32 damage_decay = 0;
    HitList hits;
};

struct AreaState {
    f32 radius = 0;
    f32 max_radius = 0;
    f32 expand_rate = 0;
    HitList hits;
};

struct BurstState {
    bool stuck = false;
    u32 stuck_target = 0;              // enemy id, 0 when none
    const EnemyRecord* target = nullptr;
    f32 stick_timer = 0;
    f32 stick_duration = 0;
    f32 explosion_radius = 0;
    f32 explosion_damage = 0;
};

struct SpiralState {
    Vector3 center;
    f32 phase = 0;
    f32 radius = 0;
    f32 speed = 0;
    u32 hits_remaining = 0;
    f32 rehit_timer = 0;

    static constexpr f32 REHIT_DELAY = 0.1f;
};

struct GridState {
    f32 half_size = 0;
    f32 max_half_size = 0;
    f32 expand_rate = 0;
    HitList hits;
};

using PayloadState = std::variant<std::monostate, PierceState, ChainState,
                                  AreaState, BurstState, SpiralState,
                                  GridState>;

struct ProjectileRecord {
    u32 id = 0;
    bool active = false;
    Vector3 position;
    Vector3 prev_position;
    Vector3 velocity;
    Quaternion orientation;
    f32 damage = 0;
    Owner owner = Owner::Player;
    PayloadType payload = PayloadType::Standard;
    PayloadState state;
    f64 lifetime = 0;
    Seconds created_at = 0;
    u32 pool_slot = 0;
};

/// Payload the projectile actually behaves as. A payload whose sub-state is
/// missing or malformed behaves as Standard.
PayloadType effective_payload(const ProjectileRecord& p);

/// Parameters for launching one projectile. When weapon is set, the payload
/// sub-state is built from it.
struct ProjectileSpawn {
    Owner owner = Owner::Player;
    Vector3 position;
    Vector3 velocity;
    f32 damage = 0;
    f64 lifetime = 2.0;
    PayloadType payload = PayloadType::Standard;
    const WeaponDef* weapon = nullptr;
};

/// Acquire, initialize and list a projectile.
ProjectileRecord* spawn_projectile(SimSnapshot& s, const ProjectileSpawn& spawn);

/// Deactivate a projectile; it leaves the live list at the next compaction.
/// Removing an already inactive projectile does nothing.
void remove_projectile(SimSnapshot& s, ProjectileRecord& p);

class ProjectileSystem {
public:
    explicit ProjectileSystem(const SimConfig& config) : config_(config) {}

    /// Integrate, advance payload sub-state, expire, then compact.
    void update(SimSnapshot& s, f64 dt);

    /// Drop inactive projectiles from the live list and release them. Runs
    /// only when removals are pending.
    void compact(SimSnapshot& s);

    static constexpr f64 LIFETIME_EPSILON = 1e-9;

private:
    void advance_payload(SimSnapshot& s, ProjectileRecord& p, f32 dt);
    void detonate(SimSnapshot& s, ProjectileRecord& p, const BurstState& burst);

    const SimConfig& config_;
};

} // namespace sky::sim
