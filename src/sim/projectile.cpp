#include "sim/projectile.hpp"
#include "sim/combat.hpp"
#include "sim/sim_snapshot.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace sky::sim {

PayloadType effective_payload(const ProjectileRecord& p) {
    switch (p.payload) {
    case PayloadType::Standard:
    case PayloadType::Spread:
        return p.payload;
    case PayloadType::Piercing:
        if (auto* st = std::get_if<PierceState>(&p.state)) {
            if (st->remaining > 0) return p.payload;
        }
        break;
    case PayloadType::Chain:
        if (auto* st = std::get_if<ChainState>(&p.state)) {
            if (st->bounces_remaining > 0 && st->bounce_range > 0 &&
                st->damage_decay >= 0 && st->damage_decay < 1)
                return p.payload;
        }
        break;
    case PayloadType::Area:
        if (auto* st = std::get_if<AreaState>(&p.state)) {
            if (st->max_radius > 0 && st->radius >= 0 && st->expand_rate >= 0)
                return p.payload;
        }
        break;
    case PayloadType::DelayedBurst:
        if (auto* st = std::get_if<BurstState>(&p.state)) {
            if (st->stick_duration > 0 && st->explosion_radius > 0)
                return p.payload;
        }
        break;
    case PayloadType::Spiral:
        if (auto* st = std::get_if<SpiralState>(&p.state)) {
            if (st->radius > 0 && st->hits_remaining > 0) return p.payload;
        }
        break;
    case PayloadType::Grid:
        if (auto* st = std::get_if<GridState>(&p.state)) {
            if (st->max_half_size > 0 && st->half_size >= 0 &&
                st->expand_rate >= 0)
                return p.payload;
        }
        break;
    }
    return PayloadType::Standard;
}

namespace {

PayloadState build_state(const ProjectileSpawn& spawn) {
    const WeaponDef* w = spawn.weapon;
    if (!w) return std::monostate{};

    switch (spawn.payload) {
    case PayloadType::Piercing: {
        PierceState st;
        st.remaining = w->pierce_count;
        return st;
    }
    case PayloadType::Chain: {
        ChainState st;
        st.bounces_remaining = w->max_bounces;
        st.bounce_range = w->bounce_range;
        st.damage_decay = w->damage_decay;
        return st;
    }
    case PayloadType::Area: {
        AreaState st;
        st.radius = w->start_radius;
        st.max_radius = w->max_radius;
        st.expand_rate = w->expand_rate;
        return st;
    }
    case PayloadType::DelayedBurst: {
        BurstState st;
        st.stick_duration = w->stick_duration;
        st.stick_timer = w->stick_duration;
        st.explosion_radius = w->explosion_radius;
        st.explosion_damage = w->explosion_damage;
        return st;
    }
    case PayloadType::Spiral: {
        SpiralState st;
        st.center = spawn.position;
        st.radius = w->spiral_radius;
        st.speed = w->spiral_speed;
        st.hits_remaining = w->hits_per_target;
        return st;
    }
    case PayloadType::Grid: {
        GridState st;
        st.half_size = w->start_radius;
        st.max_half_size = w->max_radius;
        st.expand_rate = w->expand_rate;
        return st;
    }
    case PayloadType::Standard:
    case PayloadType::Spread:
        break;
    }
    return std::monostate{};
}

} // namespace

ProjectileRecord* spawn_projectile(SimSnapshot& s,
                                   const ProjectileSpawn& spawn) {
    auto* p = s.projectile_pool.acquire();
    p->id = s.next_id();
    p->active = true;
    p->position = spawn.position;
    p->prev_position = spawn.position;
    p->velocity = spawn.velocity;
    p->damage = spawn.damage;
    p->owner = spawn.owner;
    p->payload = spawn.payload;
    p->state = build_state(spawn);
    p->lifetime = spawn.lifetime;
    p->created_at = s.elapsed;

    if (effective_payload(*p) != p->payload) {
        spdlog::warn("Projectile #{}: malformed {} payload, firing as standard",
                     p->id, payload_name(p->payload));
    }

    s.projectiles.push_back(p);
    return p;
}

void remove_projectile(SimSnapshot& s, ProjectileRecord& p) {
    if (!p.active) return;
    p.active = false;
    ++s.pending_projectile_removals;
}

void ProjectileSystem::update(SimSnapshot& s, f64 dt) {
    auto fdt = static_cast<f32>(dt);
    f32 max_range_sq =
        config_.bounds.projectile_max_range * config_.bounds.projectile_max_range;

    for (auto* p : s.projectiles) {
        if (!p->active) continue;

        if (effective_payload(*p) == PayloadType::Spiral) {
            auto& st = std::get<SpiralState>(p->state);
            st.center = st.center + p->velocity * fdt;
            st.phase += st.speed * fdt;
            p->position = st.center + Vector3{std::cos(st.phase) * st.radius,
                                              std::sin(st.phase) * st.radius,
                                              0.0f};
        } else {
            p->position = p->position + p->velocity * fdt;
        }
        p->lifetime -= dt;

        advance_payload(s, *p, fdt);
        if (!p->active) continue;

        if (p->lifetime <= LIFETIME_EPSILON ||
            length_sq(p->position) > max_range_sq) {
            // A stuck burst that runs out of time still goes off.
            if (auto* burst = std::get_if<BurstState>(&p->state);
                burst && burst->stuck &&
                effective_payload(*p) == PayloadType::DelayedBurst) {
                detonate(s, *p, *burst);
            }
            remove_projectile(s, *p);
        }
    }

    compact(s);
}

void ProjectileSystem::advance_payload(SimSnapshot& s, ProjectileRecord& p,
                                       f32 dt) {
    switch (effective_payload(p)) {
    case PayloadType::Area: {
        auto& st = std::get<AreaState>(p.state);
        st.radius += st.expand_rate * dt;
        if (st.radius >= st.max_radius) remove_projectile(s, p);
        break;
    }
    case PayloadType::Grid: {
        auto& st = std::get<GridState>(p.state);
        st.half_size += st.expand_rate * dt;
        if (st.half_size >= st.max_half_size) remove_projectile(s, p);
        break;
    }
    case PayloadType::DelayedBurst: {
        auto& st = std::get<BurstState>(p.state);
        if (!st.stuck) break;
        if (st.target && st.target->active && st.target->id == st.stuck_target) {
            p.position = st.target->position;
        }
        st.stick_timer -= dt;
        if (st.stick_timer <= 0) {
            detonate(s, p, st);
            remove_projectile(s, p);
        }
        break;
    }
    case PayloadType::Spiral: {
        auto& st = std::get<SpiralState>(p.state);
        st.rehit_timer = std::max(0.0f, st.rehit_timer - dt);
        break;
    }
    case PayloadType::Standard:
    case PayloadType::Piercing:
    case PayloadType::Chain:
    case PayloadType::Spread:
        break;
    }
}

void ProjectileSystem::detonate(SimSnapshot& s, ProjectileRecord& p,
                                const BurstState& burst) {
    f32 r2 = burst.explosion_radius * burst.explosion_radius;
    u32 hit = 0;
    for (auto* e : s.enemies) {
        if (!e->active || e->is_dying) continue;
        if (distance_sq(e->position, p.position) <= r2) {
            combat::apply_enemy_damage(s, config_, *e, burst.explosion_damage);
            ++hit;
        }
    }
    spdlog::debug("Burst #{} detonated, {} enemies caught", p.id, hit);
}

void ProjectileSystem::compact(SimSnapshot& s) {
    if (s.pending_projectile_removals == 0) return;

    auto it = std::remove_if(s.projectiles.begin(), s.projectiles.end(),
                             [&](ProjectileRecord* p) {
                                 if (p->active) return false;
                                 s.projectile_pool.release(p);
                                 return true;
                             });
    s.projectiles.erase(it, s.projectiles.end());
    s.pending_projectile_removals = 0;
}

} // namespace sky::sim
