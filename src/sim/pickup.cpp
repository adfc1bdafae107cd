#include "sim/pickup.hpp"
#include "sim/sim_snapshot.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace sky::sim {

PickupRecord* spawn_pickup(SimSnapshot& s, const DropTable& drops,
                           PickupKind kind, const Vector3& pos) {
    auto* p = s.pickup_pool.acquire();
    p->id = s.next_id();
    p->active = true;
    p->kind = kind;
    p->position = pos;
    p->prev_position = pos;
    p->created_at = s.elapsed;
    switch (kind) {
    case PickupKind::Health: p->value = drops.health_value; break;
    case PickupKind::Shield: p->value = drops.shield_value; break;
    case PickupKind::WeaponBoost: p->value = drops.boost_seconds; break;
    }
    s.pickups.push_back(p);
    s.events.pickup_available(kind, pos);
    spdlog::debug("Pickup #{} ({}) dropped", p->id, pickup_kind_name(kind));
    return p;
}

void PickupSystem::update(SimSnapshot& s, f64 dt) {
    const auto& drops = config_.drops;
    auto fdt = static_cast<f32>(dt);
    f32 radius_sq = drops.pickup_radius * drops.pickup_radius;

    for (auto* p : s.pickups) {
        if (!p->active) continue;
        p->position.y += drops.drift_y * fdt;
        p->position.z += drops.drift_z * fdt;

        if (distance_sq(p->position, s.player.position) < radius_sq) {
            collect(s, *p);
            continue;
        }
        if (p->position.z > drops.expire_z ||
            s.elapsed - p->created_at > drops.lifetime) {
            p->active = false;
        }
    }

    auto it = std::remove_if(s.pickups.begin(), s.pickups.end(),
                             [&](PickupRecord* p) {
                                 if (p->active) return false;
                                 s.pickup_pool.release(p);
                                 return true;
                             });
    s.pickups.erase(it, s.pickups.end());
}

void PickupSystem::collect(SimSnapshot& s, PickupRecord& pickup) {
    auto& pl = s.player;
    switch (pickup.kind) {
    case PickupKind::Health:
        pl.hp = std::min(pl.max_hp, pl.hp + pickup.value);
        break;
    case PickupKind::Shield:
        pl.shields = std::min(pl.max_shields, pl.shields + pickup.value);
        break;
    case PickupKind::WeaponBoost:
        pl.turbo_timer = std::max(pl.turbo_timer, pickup.value);
        break;
    }
    pickup.active = false;
    s.events.pickup_collected(pickup.kind, pickup.value);
}

} // namespace sky::sim
