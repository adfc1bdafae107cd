#include "sim/combat.hpp"
#include "sim/pickup.hpp"
#include "sim/sim_snapshot.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace sky::sim::combat {

bool apply_enemy_damage(SimSnapshot& s, const SimConfig& config,
                        EnemyRecord& enemy, f32 damage) {
    if (!enemy.active || enemy.is_dying || damage <= 0) return false;

    f32 dealt = std::min(enemy.hp, damage);
    enemy.hp = std::max(0.0f, enemy.hp - damage);
    enemy.last_hit_time = s.elapsed;
    s.events.enemy_damaged(enemy.type, dealt);

    if (enemy.hp > 0) return false;

    enemy.is_dying = true;
    enemy.death_timer = 0;
    enemy.velocity = {};
    ++s.kills;
    award_score(s, config.tuning(enemy.type).score);
    s.events.enemy_destroyed(enemy.type, enemy.stage, enemy.position);
    spdlog::debug("Enemy #{} ({}) destroyed at ({:.1f}, {:.1f}, {:.1f})",
                  enemy.id, enemy_type_name(enemy.type), enemy.position.x,
                  enemy.position.y, enemy.position.z);

    roll_drop(s, config.drops, enemy.stage, enemy.position);
    return true;
}

void apply_player_damage(SimSnapshot& s, f32 damage) {
    if (s.game_over || damage <= 0) return;
    auto& p = s.player;

    if (p.shields > 0) {
        p.shields = std::max(0.0f, p.shields - damage);
    } else {
        p.hp = std::max(0.0f, p.hp - damage);
    }

    if (p.hp <= 0) {
        s.game_over = true;
        s.events.player_destroyed();
        spdlog::info("Player destroyed at t={:.2f}s, score {}", s.elapsed,
                     s.score);
    }
}

void award_score(SimSnapshot& s, u64 points) {
    s.score += points;
}

bool roll_drop(SimSnapshot& s, const DropTable& drops, u32 stage,
               const Vector3& pos) {
    if (stage < drops.min_stage) return false;

    // One draw partitions [0,1) into health, shield, boost, nothing.
    f32 r = s.random01();
    PickupKind kind;
    if (r < drops.health_chance) {
        kind = PickupKind::Health;
    } else if (r < drops.health_chance + drops.shield_chance) {
        kind = PickupKind::Shield;
    } else if (r < drops.health_chance + drops.shield_chance +
                       drops.boost_chance) {
        kind = PickupKind::WeaponBoost;
    } else {
        return false;
    }

    return spawn_pickup(s, drops, kind, pos) != nullptr;
}

} // namespace sky::sim::combat
