#pragma once

#include "sim/sim_config.hpp"
#include "sim/sim_events.hpp"

namespace sky::sim {

struct SimSnapshot;
class EnemySystem;

/// Spawn sequencing state machine:
///
///   Intro -> Wave[0..n-1] -> Elite -> BossApproach -> BossFight -> Victory
///         -> Wave[0] of the next stage
///
/// Every exit condition is evaluated against the live list on the tick it
/// is checked; nothing about live enemies is cached between ticks.
class WaveManager {
public:
    WaveManager(const SimConfig& config, EnemySystem& enemies)
        : config_(config), enemies_(enemies) {}

    /// Reset the wave state to stage 1 and enter Intro.
    void start(SimSnapshot& s);

    void update(SimSnapshot& s, f64 dt);

    /// Enemy type a wave spawns at the snapshot's current stage.
    EnemyType wave_type(const SimSnapshot& s, u32 wave_index) const;

private:
    void enter(SimSnapshot& s, PhaseKind phase, u32 wave_index = 0);
    void enter_first_wave(SimSnapshot& s);

    void update_intro(SimSnapshot& s);
    void update_wave(SimSnapshot& s);
    void update_elite(SimSnapshot& s);
    void update_boss_approach(SimSnapshot& s);
    void update_boss_fight(SimSnapshot& s);
    void update_victory(SimSnapshot& s);

    const SimConfig& config_;
    EnemySystem& enemies_;
};

} // namespace sky::sim
