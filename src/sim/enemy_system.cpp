#include "sim/enemy_system.hpp"
#include "sim/projectile.hpp"
#include "sim/sim_snapshot.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace sky::sim {

namespace {

constexpr f32 TWO_PI = 6.2831853f;

// Hover band the strafing types are pulled back into.
constexpr f32 HOVER_X_LIMIT = 60.0f;
constexpr f32 HOVER_Y_MIN = 10.0f;
constexpr f32 HOVER_Y_MAX = 40.0f;
constexpr f32 HOVER_BACKOFF = 10.0f;
constexpr f32 HOVER_BOB = 5.0f;

// Each rule is a function of (seed, elapsed, dt, position) only.

void approach(const EnemyTraits& tr, f32 speed, f32 t, f32 dt, Vector3& pos) {
    pos.z += speed * dt;
    pos.x += std::sin(t * tr.freq_x) * tr.jitter_x * dt;
    pos.y += std::cos(t * tr.freq_y) * tr.jitter_y * dt;
}

void hover_strafe(const EnemyTraits& tr, f32 speed, f32 t, f32 dt,
                  Vector3& pos) {
    if (pos.z < tr.hover_z) {
        pos.z = std::min(tr.hover_z, pos.z + speed * dt);
    } else if (pos.z > tr.hover_z + HOVER_BACKOFF) {
        pos.z -= speed * 0.5f * dt;
    } else {
        pos.z += std::sin(t * 1.3f) * HOVER_BOB * dt;
    }

    pos.x += std::sin(t * tr.freq_x) * tr.jitter_x * dt;
    pos.y += std::cos(t * tr.freq_y) * tr.jitter_y * dt;

    f32 recenter = speed * 0.5f * dt;
    if (pos.x > HOVER_X_LIMIT) pos.x -= recenter;
    else if (pos.x < -HOVER_X_LIMIT) pos.x += recenter;
    if (pos.y < HOVER_Y_MIN) pos.y += recenter;
    else if (pos.y > HOVER_Y_MAX) pos.y -= recenter;
}

void jitter(const EnemyTraits& tr, f32 speed, f32 t, f32 dt, Vector3& pos) {
    pos.z += speed * dt;
    pos.x += std::sin(t * tr.freq_x) * tr.jitter_x * dt;
    pos.y += std::sin(t * tr.freq_y + 1.7f) * tr.jitter_y * dt;
}

void boss_approach(const EnemyTraits& tr, f32 speed, f32 t, f32 dt,
                   f32 floor_z, Vector3& pos) {
    pos.z = std::min(floor_z, pos.z + speed * dt);
    pos.x += std::sin(t * tr.freq_x) * tr.jitter_x * dt;
    pos.y += std::sin(t * tr.freq_y) * tr.jitter_y * dt;
}

void orbit(const EnemyTraits& tr, f32 speed, f32 seed, f32 elapsed, f32 dt,
           Vector3& pos) {
    pos.z += speed * 0.5f * dt;
    f32 theta = elapsed * tr.freq_x + seed * TWO_PI;
    pos.x = std::sin(theta) * tr.jitter_x;
}

} // namespace

ResolvedArchetype EnemySystem::resolve(EnemyType type, u32 stage) const {
    const auto& st = config_.stage_entry(stage);
    if (st.type == type) {
        return {st.hp, st.speed, st.region};
    }
    const auto& tune = config_.tuning(type);
    return {tune.base_hp * st.hp_multiplier,
            tune.base_speed * st.speed_multiplier, tune.region};
}

EnemyRecord* EnemySystem::spawn(SimSnapshot& s, EnemyType type) {
    auto region = resolve(type, s.wave.stage).region;
    Vector3 pos;
    pos.x = (s.random01() - 0.5f) * region.x_spread;
    pos.y = (s.random01() - 0.5f) * region.y_spread + region.y_offset;
    pos.z = region.z_near - s.random01() * (region.z_near - region.z_far);
    return spawn_at(s, type, pos);
}

EnemyRecord* EnemySystem::spawn_at(SimSnapshot& s, EnemyType type,
                                   const Vector3& pos) {
    auto arch = resolve(type, s.wave.stage);

    auto* e = s.enemy_pool.acquire();
    e->id = s.next_id();
    e->active = true;
    e->type = type;
    e->owner = Owner::Enemy;
    e->position = pos;
    e->prev_position = pos;
    e->created_at = s.elapsed;
    e->seed = s.random01();
    e->stage = s.wave.stage;
    e->hp = e->max_hp = std::max(1.0f, arch.hp);
    e->speed = arch.speed;
    e->damage = config_.tuning(type).ram_damage;
    e->last_fire_time = s.elapsed;
    s.enemies.push_back(e);

    spdlog::debug("Spawned {} #{} at ({:.1f}, {:.1f}, {:.1f}) hp={:.0f}",
                  enemy_type_name(type), e->id, pos.x, pos.y, pos.z, e->hp);
    return e;
}

void EnemySystem::update(SimSnapshot& s, f64 dt) {
    auto fdt = static_cast<f32>(dt);

    for (auto* e : s.enemies) {
        if (!e->active) continue;

        if (e->is_dying) {
            update_dying(*e, fdt);
            continue;
        }

        move(s, *e, fdt);
        clamp_to_bounds(*e);

        if (out_of_bounds(*e)) {
            spdlog::debug("Despawned {} #{} at ({:.1f}, {:.1f}, {:.1f})",
                          enemy_type_name(e->type), e->id, e->position.x,
                          e->position.y, e->position.z);
            e->active = false;
            continue;
        }

        try_fire(s, *e);
    }

    compact(s);
}

void EnemySystem::update_dying(EnemyRecord& e, f32 dt) {
    e.death_timer += dt;
    rotate(e.orientation, {1, 0, 0}, (5.0f + 10.0f * e.death_timer) * dt);
    if (e.death_timer > config_.combat.disintegration_duration) {
        e.active = false;
    }
}

void EnemySystem::move(const SimSnapshot& s, EnemyRecord& e, f32 dt) {
    const auto& tr = traits_of(e.type);
    auto elapsed = static_cast<f32>(s.elapsed);
    // Per-entity phase so a squad does not move in lockstep.
    f32 t = elapsed + e.seed * 100.0f;
    Vector3 before = e.position;

    switch (tr.rule) {
    case MovementRule::Approach:
        approach(tr, e.speed, t, dt, e.position);
        break;
    case MovementRule::HoverStrafe:
        hover_strafe(tr, e.speed, t, dt, e.position);
        break;
    case MovementRule::Jitter:
        jitter(tr, e.speed, t, dt, e.position);
        break;
    case MovementRule::BossApproach:
        boss_approach(tr, e.speed, t, dt, config_.bounds.boss_floor_z,
                      e.position);
        break;
    case MovementRule::Orbit:
        orbit(tr, e.speed, e.seed, elapsed, dt, e.position);
        break;
    }

    if (dt > 0) e.velocity = (e.position - before) * (1.0f / dt);

    Vector3 spin_axis{1.0f, e.seed, 0.5f};
    rotate(e.orientation, spin_axis, tr.spin_rate * dt);
}

void EnemySystem::clamp_to_bounds(EnemyRecord& e) const {
    const auto& b = config_.bounds;
    e.position.z = std::min(e.position.z, b.wall_z);
    e.position.y = std::max(e.position.y, b.floor_y);
    if (e.type == EnemyType::Boss) {
        e.position.z = std::min(e.position.z, b.boss_floor_z);
    }
}

bool EnemySystem::out_of_bounds(const EnemyRecord& e) const {
    const auto& b = config_.bounds;
    return e.position.z > b.despawn_near_z || e.position.z < b.despawn_far_z ||
           std::abs(e.position.x) > b.lateral_cap;
}

void EnemySystem::try_fire(SimSnapshot& s, EnemyRecord& e) {
    const auto& gun = config_.tuning(e.type).gun;
    if (!gun.enabled || s.game_over) return;
    if (s.elapsed - e.last_fire_time < gun.cooldown) return;
    if (distance_sq(e.position, s.player.position) >= gun.range * gun.range)
        return;

    ProjectileSpawn spawn;
    spawn.owner = Owner::Enemy;
    spawn.position = e.position;
    spawn.velocity = normalized(s.player.position - e.position) * gun.speed;
    spawn.damage = gun.damage;
    spawn.lifetime = config_.combat.enemy_projectile_lifetime;
    spawn_projectile(s, spawn);
    e.last_fire_time = s.elapsed;
}

void EnemySystem::compact(SimSnapshot& s) {
    auto it = std::remove_if(s.enemies.begin(), s.enemies.end(),
                             [&](EnemyRecord* e) {
                                 if (e->active) return false;
                                 s.enemy_pool.release(e);
                                 return true;
                             });
    s.enemies.erase(it, s.enemies.end());
}

} // namespace sky::sim
