#include "sim/sim_state.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace sky::sim {

SimState::SimState(SimConfig config)
    : config_(std::move(config)),
      snapshot_(config_),
      player_(config_),
      enemies_(config_),
      waves_(config_, enemies_),
      projectiles_(config_),
      collision_(config_, enemies_),
      pickups_(config_) {
    spdlog::info("Simulation ready: seed={}, {} stages, {} waves, weapon '{}'",
                 config_.seed, config_.stages.size(), config_.waves.size(),
                 config_.equipped().id);
    waves_.start(snapshot_);
}

void SimState::tick(f64 dt) {
    begin_tick(dt);

    player_.update(snapshot_, dt);
    waves_.update(snapshot_, dt);
    enemies_.update(snapshot_, dt);
    projectiles_.update(snapshot_, dt);
    collision_.resolve(snapshot_, dt);
    pickups_.update(snapshot_, dt);
    projectiles_.compact(snapshot_);

    end_tick();
}

void SimState::begin_tick(f64 dt) {
    auto& s = snapshot_;
    s.elapsed += dt;
    s.delta = dt;
    ++s.tick_count;

    s.player.prev_position = s.player.position;
    for (auto* e : s.enemies) e->prev_position = e->position;
    for (auto* p : s.projectiles) p->prev_position = p->position;
    for (auto* p : s.pickups) p->prev_position = p->position;

    s.tick_start_score = s.score;
    s.tick_start_hp = s.player.hp;
    s.tick_start_shields = s.player.shields;
}

void SimState::end_tick() {
    auto& s = snapshot_;
    if (s.score != s.tick_start_score) {
        s.events.score_changed(
            s.score, static_cast<i64>(s.score) - static_cast<i64>(s.tick_start_score));
    }
    if (s.player.hp != s.tick_start_hp ||
        s.player.shields != s.tick_start_shields) {
        s.events.player_status_changed(s.player.hp, s.player.shields);
    }
}

} // namespace sky::sim
