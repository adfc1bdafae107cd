#pragma once

#include "sim/entity.hpp"
#include "sim/sim_config.hpp"

namespace sky::sim {

struct SimSnapshot;

namespace combat {

/// Damage an enemy. Inactive and dying records are ignored. Returns true if
/// this hit killed it.
///
/// hp drops to max(0, hp - damage). At zero the record starts dying, its
/// score value is awarded, EnemyDestroyed is emitted and, past stage 1, a
/// pickup drop is rolled.
bool apply_enemy_damage(SimSnapshot& s, const SimConfig& config,
                        EnemyRecord& enemy, f32 damage);

/// Damage the player. Shields absorb while above zero; otherwise the hull
/// takes it. A hull at zero ends the run.
void apply_player_damage(SimSnapshot& s, f32 damage);

void award_score(SimSnapshot& s, u64 points);

/// Roll the drop table for a kill at pos. Returns true if a pickup spawned.
bool roll_drop(SimSnapshot& s, const DropTable& drops, u32 stage,
               const Vector3& pos);

} // namespace combat
} // namespace sky::sim
