#include "sim/collision.hpp"
#include "sim/combat.hpp"
#include "sim/enemy_system.hpp"
#include "sim/sim_snapshot.hpp"

#include <cmath>

namespace sky::sim {

void CollisionSystem::resolve(SimSnapshot& s, f64 dt) {
    player_vs_enemies(s, static_cast<f32>(dt));
    projectiles_vs_enemies(s);
    projectiles_vs_projectiles(s);
    enemy_projectiles_vs_player(s);
}

void CollisionSystem::player_vs_enemies(SimSnapshot& s, f32 dt) {
    const auto& c = config_.combat;
    const Vector3& player = s.player.position;

    for (auto* e : s.enemies) {
        if (!e->active || e->is_dying) continue;

        f32 min = c.player_radius + config_.tuning(e->type).contact_radius;
        Vector3 offset = e->position - player;
        f32 d2 = length_sq(offset);
        if (d2 >= min * min) continue;

        // The push needs the real distance.
        f32 d = std::sqrt(d2);
        if (d > 0.1f) {
            e->position = e->position + offset * ((min - d) * c.push_force * dt / d);
            enemies_.clamp_to_bounds(*e);
        }

        if (s.game_over) continue;
        if (d < min * 0.5f &&
            s.elapsed - e->last_contact_time >= c.contact_interval) {
            e->last_contact_time = s.elapsed;
            s.events.player_hit(e->damage);
            combat::apply_player_damage(s, e->damage);
        }
    }
}

bool CollisionSystem::hits(const ProjectileRecord& p,
                           const EnemyRecord& e) const {
    f32 r = config_.tuning(e.type).hit_radius;
    Vector3 d = e.position - p.position;

    switch (effective_payload(p)) {
    case PayloadType::Area: {
        f32 reach = r + std::get<AreaState>(p.state).radius;
        return length_sq(d) < reach * reach;
    }
    case PayloadType::Grid: {
        f32 reach = r + std::get<GridState>(p.state).half_size;
        return std::abs(d.x) <= reach && std::abs(d.y) <= reach &&
               std::abs(d.z) <= r;
    }
    default:
        return length_sq(d) < r * r;
    }
}

void CollisionSystem::projectiles_vs_enemies(SimSnapshot& s) {
    for (auto* p : s.projectiles) {
        if (!p->active || p->owner != Owner::Player) continue;

        for (auto* e : s.enemies) {
            if (!p->active) break;
            if (!e->active || e->is_dying) continue;

            // Payloads that remember or pace their hits.
            switch (effective_payload(*p)) {
            case PayloadType::Piercing:
                if (std::get<PierceState>(p->state).hits.contains(e->id)) continue;
                break;
            case PayloadType::Chain:
                if (std::get<ChainState>(p->state).hits.contains(e->id)) continue;
                break;
            case PayloadType::Area:
                if (std::get<AreaState>(p->state).hits.contains(e->id)) continue;
                break;
            case PayloadType::Grid:
                if (std::get<GridState>(p->state).hits.contains(e->id)) continue;
                break;
            case PayloadType::DelayedBurst:
                if (std::get<BurstState>(p->state).stuck) continue;
                break;
            case PayloadType::Spiral:
                if (std::get<SpiralState>(p->state).rehit_timer > 0) continue;
                break;
            case PayloadType::Standard:
            case PayloadType::Spread:
                break;
            }

            if (hits(*p, *e)) on_hit(s, *p, *e);
        }
    }
}

void CollisionSystem::on_hit(SimSnapshot& s, ProjectileRecord& p,
                             EnemyRecord& e) {
    combat::apply_enemy_damage(s, config_, e, p.damage);

    switch (effective_payload(p)) {
    case PayloadType::Standard:
    case PayloadType::Spread:
        remove_projectile(s, p);
        break;
    case PayloadType::Piercing: {
        auto& st = std::get<PierceState>(p.state);
        st.hits.add(e.id);
        if (--st.remaining == 0) remove_projectile(s, p);
        break;
    }
    case PayloadType::Chain: {
        auto& st = std::get<ChainState>(p.state);
        st.hits.add(e.id);
        if (--st.bounces_remaining == 0) {
            remove_projectile(s, p);
        } else {
            p.damage *= 1.0f - st.damage_decay;
            retarget_chain(s, p);
        }
        break;
    }
    case PayloadType::Area:
        std::get<AreaState>(p.state).hits.add(e.id);
        break;
    case PayloadType::Grid:
        std::get<GridState>(p.state).hits.add(e.id);
        break;
    case PayloadType::DelayedBurst: {
        auto& st = std::get<BurstState>(p.state);
        st.stuck = true;
        st.stuck_target = e.id;
        st.target = &e;
        st.stick_timer = st.stick_duration;
        p.velocity = {};
        break;
    }
    case PayloadType::Spiral: {
        auto& st = std::get<SpiralState>(p.state);
        st.rehit_timer = SpiralState::REHIT_DELAY;
        if (--st.hits_remaining == 0) remove_projectile(s, p);
        break;
    }
    }
}

void CollisionSystem::retarget_chain(SimSnapshot& s, ProjectileRecord& p) {
    const auto& st = std::get<ChainState>(p.state);
    f32 best = st.bounce_range * st.bounce_range;
    const EnemyRecord* target = nullptr;

    for (const auto* e : s.enemies) {
        if (!e->active || e->is_dying || st.hits.contains(e->id)) continue;
        f32 d2 = distance_sq(e->position, p.position);
        if (d2 <= best) {
            best = d2;
            target = e;
        }
    }

    if (!target) {
        remove_projectile(s, p);
        return;
    }

    f32 speed = std::sqrt(length_sq(p.velocity));
    p.velocity = normalized(target->position - p.position) * speed;
}

void CollisionSystem::projectiles_vs_projectiles(SimSnapshot& s) {
    f32 r2 = config_.combat.intercept_radius * config_.combat.intercept_radius;

    for (auto* p : s.projectiles) {
        if (!p->active || p->owner != Owner::Player) continue;
        for (auto* q : s.projectiles) {
            if (!q->active || q->owner != Owner::Enemy) continue;
            if (distance_sq(p->position, q->position) < r2) {
                s.events.projectile_blocked(q->position);
                remove_projectile(s, *p);
                remove_projectile(s, *q);
                break;
            }
        }
    }
}

void CollisionSystem::enemy_projectiles_vs_player(SimSnapshot& s) {
    f32 r2 = config_.combat.player_hit_radius * config_.combat.player_hit_radius;

    for (auto* p : s.projectiles) {
        if (!p->active || p->owner != Owner::Enemy) continue;
        if (distance_sq(p->position, s.player.position) >= r2) continue;

        remove_projectile(s, *p);
        if (s.game_over) continue;
        s.events.player_hit(p->damage);
        combat::apply_player_damage(s, p->damage);
    }
}

} // namespace sky::sim
