#include "sim/sim_snapshot.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

namespace sky::sim {

SimSnapshot::SimSnapshot(const SimConfig& config)
    : enemy_pool([](EnemyRecord& e) { e = EnemyRecord{}; },
                 config.pools.enemy_initial, config.pools.enemy_soft_cap,
                 "enemies"),
      projectile_pool([](ProjectileRecord& p) { p = ProjectileRecord{}; },
                      config.pools.projectile_initial,
                      config.pools.projectile_soft_cap, "projectiles"),
      pickup_pool([](PickupRecord& p) { p = PickupRecord{}; },
                  config.pools.pickup_initial, config.pools.pickup_soft_cap,
                  "pickups"),
      rng(config.seed) {
    enemies.reserve(config.pools.enemy_soft_cap);
    projectiles.reserve(config.pools.projectile_soft_cap);
    pickups.reserve(config.pools.pickup_soft_cap);

    const auto& pt = config.player;
    player.hp = player.max_hp = pt.max_hp;
    player.shields = player.max_shields = pt.max_shields;
    player.energy = player.max_energy = pt.max_energy;
    tick_start_hp = player.hp;
    tick_start_shields = player.shields;
}

f32 SimSnapshot::random01() {
    std::uniform_real_distribution<f64> dist(0.0, 1.0);
    auto r = static_cast<f32>(dist(rng));
    return r < 1.0f ? r : std::nextafter(1.0f, 0.0f);
}

size_t SimSnapshot::live_count(EnemyType type) const {
    size_t n = 0;
    for (const auto* e : enemies) {
        if (e->active && e->type == type) ++n;
    }
    return n;
}

void SimSnapshot::clear_entities() {
    spdlog::debug("Clearing {} enemies, {} projectiles, {} pickups",
                  enemies.size(), projectiles.size(), pickups.size());
    for (auto* e : enemies) {
        e->active = false;
        enemy_pool.release(e);
    }
    for (auto* p : projectiles) {
        p->active = false;
        projectile_pool.release(p);
    }
    for (auto* p : pickups) {
        p->active = false;
        pickup_pool.release(p);
    }
    enemies.clear();
    projectiles.clear();
    pickups.clear();
    pending_projectile_removals = 0;
}

} // namespace sky::sim
