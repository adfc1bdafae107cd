#include "sim/wave_manager.hpp"
#include "sim/combat.hpp"
#include "sim/enemy_system.hpp"
#include "sim/sim_snapshot.hpp"

#include <spdlog/spdlog.h>

namespace sky::sim {

void WaveManager::start(SimSnapshot& s) {
    s.wave = WaveState{};
    enter(s, PhaseKind::Intro);
}

EnemyType WaveManager::wave_type(const SimSnapshot& s, u32 wave_index) const {
    if (wave_index >= config_.waves.size()) {
        return config_.stage_entry(s.wave.stage).type;
    }
    const auto& w = config_.waves[wave_index];
    return w.type ? *w.type : config_.stage_entry(s.wave.stage).type;
}

void WaveManager::update(SimSnapshot& s, f64 dt) {
    s.wave.phase_elapsed += dt;

    switch (s.wave.phase) {
    case PhaseKind::Intro: update_intro(s); break;
    case PhaseKind::Wave: update_wave(s); break;
    case PhaseKind::Elite: update_elite(s); break;
    case PhaseKind::BossApproach: update_boss_approach(s); break;
    case PhaseKind::BossFight: update_boss_fight(s); break;
    case PhaseKind::Victory: update_victory(s); break;
    }
}

void WaveManager::enter(SimSnapshot& s, PhaseKind phase, u32 wave_index) {
    auto& w = s.wave;
    w.phase = phase;
    w.wave_index = wave_index;
    w.phase_elapsed = 0;
    w.spawned = 0;
    w.last_spawn_time = -1.0e9;

    if (phase == PhaseKind::Elite) {
        w.elite_spawned = false;
    } else if (phase == PhaseKind::BossApproach) {
        w.boss_spawned = false;
        w.bonus_awarded = false;
    }

    s.events.phase_changed(phase, wave_index, w.stage);
    if (phase == PhaseKind::Wave) {
        spdlog::info("Stage {}: wave {} ({})", w.stage, wave_index + 1,
                     enemy_type_name(wave_type(s, wave_index)));
    } else {
        spdlog::info("Stage {}: {}", w.stage, phase_kind_name(phase));
    }
}

void WaveManager::enter_first_wave(SimSnapshot& s) {
    if (config_.waves.empty()) {
        enter(s, PhaseKind::Elite);
    } else {
        enter(s, PhaseKind::Wave, 0);
    }
}

void WaveManager::update_intro(SimSnapshot& s) {
    if (s.wave.phase_elapsed >= config_.phases.intro_duration) {
        enter_first_wave(s);
    }
}

void WaveManager::update_wave(SimSnapshot& s) {
    auto& w = s.wave;
    if (w.wave_index >= config_.waves.size()) {
        enter(s, PhaseKind::Elite);
        return;
    }

    const auto& def = config_.waves[w.wave_index];
    EnemyType type = wave_type(s, w.wave_index);

    if (w.spawned < def.quota &&
        s.elapsed - w.last_spawn_time >= def.spawn_interval &&
        s.live_count(type) < def.max_concurrent) {
        enemies_.spawn(s, type);
        ++w.spawned;
        w.last_spawn_time = s.elapsed;
    }

    // Re-query after the spawn step: a record spawned this tick counts.
    if (w.spawned >= def.quota && s.live_count(type) == 0) {
        if (w.wave_index + 1 < config_.waves.size()) {
            enter(s, PhaseKind::Wave, w.wave_index + 1);
        } else {
            enter(s, PhaseKind::Elite);
        }
    }
}

void WaveManager::update_elite(SimSnapshot& s) {
    auto& w = s.wave;
    const auto& ph = config_.phases;

    if (!w.elite_spawned && w.phase_elapsed >= ph.elite_settle_delay) {
        enemies_.spawn(s, EnemyType::Elite);
        w.elite_spawned = true;
    }

    if (w.elite_spawned && s.live_count(EnemyType::Elite) == 0 &&
        w.phase_elapsed >= ph.elite_min_elapsed) {
        enter(s, PhaseKind::BossApproach);
    }
}

void WaveManager::update_boss_approach(SimSnapshot& s) {
    if (s.wave.phase_elapsed < config_.phases.boss_approach_duration) return;

    auto* boss = enemies_.spawn(s, EnemyType::Boss);
    spdlog::info("Boss #{} inbound, hp={:.0f}", boss->id, boss->hp);
    enter(s, PhaseKind::BossFight);
    s.wave.boss_spawned = true;
}

void WaveManager::update_boss_fight(SimSnapshot& s) {
    auto& w = s.wave;
    if (s.live_count(EnemyType::Boss) > 0) return;

    if (!w.bonus_awarded) {
        combat::award_score(s, config_.phases.boss_victory_bonus);
        w.bonus_awarded = true;
        spdlog::info("Boss defeated, +{} bonus", config_.phases.boss_victory_bonus);
    }
    enter(s, PhaseKind::Victory);
}

void WaveManager::update_victory(SimSnapshot& s) {
    auto& w = s.wave;
    if (w.phase_elapsed < config_.phases.victory_duration) return;

    u32 previous = w.stage;
    w.stage = w.stage >= config_.max_stage ? 1 : w.stage + 1;
    ++w.cycles_completed;
    s.clear_entities();
    spdlog::info("Stage {} cleared, advancing to stage {}", previous, w.stage);

    enter_first_wave(s);
}

} // namespace sky::sim
