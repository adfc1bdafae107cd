#include "sim/weapon.hpp"
#include "sim/projectile.hpp"
#include "sim/sim_snapshot.hpp"

#include <algorithm>
#include <cmath>

namespace sky::sim {

namespace {
constexpr f32 DEG_TO_RAD = 3.14159265f / 180.0f;
}

Vector3 Weapon::aim_direction(f32 yaw, f32 pitch) {
    f32 cp = std::cos(pitch);
    return {-std::sin(yaw) * cp, std::sin(pitch), -std::cos(yaw) * cp};
}

f32 Weapon::cooldown_for(bool turbo) const {
    f32 rate = def_.fire_rate * (turbo ? 2.0f : 1.0f);
    return rate > 0 ? 1.0f / rate : 1.0f;
}

void Weapon::update(SimSnapshot& s, f64 dt) {
    auto& p = s.player;
    p.weapon_cooldown = std::max(0.0f, p.weapon_cooldown - static_cast<f32>(dt));
    p.is_firing = s.input.fire;
    if (s.input.fire) try_fire(s);
}

bool Weapon::try_fire(SimSnapshot& s) {
    auto& p = s.player;
    if (p.weapon_cooldown > 0) return false;
    if (p.energy < def_.energy_cost) return false;

    p.energy -= def_.energy_cost;
    p.weapon_cooldown = cooldown_for(p.turbo_timer > 0);

    Vector3 dir = aim_direction(p.yaw, p.pitch);

    switch (def_.payload) {
    case PayloadType::Standard: {
        // Twin guns either side of the hull.
        Vector3 right{std::cos(p.yaw), 0.0f, -std::sin(p.yaw)};
        f32 off = config_.player.gun_offset_x;
        launch(s, p.position - right * off, dir);
        launch(s, p.position + right * off, dir);
        break;
    }
    case PayloadType::Spread: {
        u32 n = std::max<u32>(def_.pellet_count, 1);
        f32 fan = def_.spread_angle * DEG_TO_RAD;
        for (u32 i = 0; i < n; ++i) {
            f32 t = n > 1 ? static_cast<f32>(i) / static_cast<f32>(n - 1) : 0.5f;
            f32 offset = (t - 0.5f) * fan;
            launch(s, p.position, aim_direction(p.yaw + offset, p.pitch));
        }
        break;
    }
    default:
        launch(s, p.position, dir);
        break;
    }
    return true;
}

void Weapon::launch(SimSnapshot& s, const Vector3& origin, const Vector3& dir) {
    ProjectileSpawn spawn;
    spawn.owner = Owner::Player;
    spawn.position = origin;
    spawn.velocity = dir * def_.speed;
    spawn.damage = def_.damage;
    spawn.lifetime = def_.lifetime;
    spawn.payload = def_.payload;
    spawn.weapon = &def_;
    auto* proj = spawn_projectile(s, spawn);
    proj->orientation = s.player.orientation;
}

} // namespace sky::sim
