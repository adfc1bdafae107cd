#include "sim/sim_events.hpp"

#include <algorithm>
#include <array>

namespace sky::sim {

const char* event_name(EventKind kind) {
    static constexpr std::array<const char*, EVENT_KIND_COUNT> NAMES = {
        "EnemyDestroyed",  "EnemyDamaged",    "PlayerHit",
        "ScoreChanged",    "PhaseChanged",    "PickupAvailable",
        "PickupCollected", "ProjectileBlocked", "PlayerDestroyed",
        "PlayerStatusChanged",
    };
    return NAMES[static_cast<size_t>(kind)];
}

const char* phase_kind_name(PhaseKind phase) {
    switch (phase) {
    case PhaseKind::Intro: return "intro";
    case PhaseKind::Wave: return "wave";
    case PhaseKind::Elite: return "elite";
    case PhaseKind::BossApproach: return "boss_approach";
    case PhaseKind::BossFight: return "boss_fight";
    case PhaseKind::Victory: return "victory";
    }
    return "unknown";
}

const char* pickup_kind_name(PickupKind kind) {
    switch (kind) {
    case PickupKind::Health: return "health";
    case PickupKind::Shield: return "shield";
    case PickupKind::WeaponBoost: return "weapon_boost";
    }
    return "unknown";
}

void EventQueue::enemy_destroyed(EnemyType type, u32 stage,
                                 const Vector3& pos) {
    SimEvent e{EventKind::EnemyDestroyed};
    e.enemy_type = type;
    e.stage = stage;
    e.position = pos;
    push(e);
}

void EventQueue::enemy_damaged(EnemyType type, f32 amount) {
    SimEvent e{EventKind::EnemyDamaged};
    e.enemy_type = type;
    e.amount = amount;
    push(e);
}

void EventQueue::player_hit(f32 amount) {
    SimEvent e{EventKind::PlayerHit};
    e.amount = amount;
    push(e);
}

void EventQueue::score_changed(u64 score, i64 delta) {
    SimEvent e{EventKind::ScoreChanged};
    e.score = score;
    e.delta = delta;
    push(e);
}

void EventQueue::phase_changed(PhaseKind phase, u32 wave_index, u32 stage) {
    SimEvent e{EventKind::PhaseChanged};
    e.phase = phase;
    e.wave_index = wave_index;
    e.stage = stage;
    push(e);
}

void EventQueue::pickup_available(PickupKind kind, const Vector3& pos) {
    SimEvent e{EventKind::PickupAvailable};
    e.pickup = kind;
    e.position = pos;
    push(e);
}

void EventQueue::pickup_collected(PickupKind kind, f32 value) {
    SimEvent e{EventKind::PickupCollected};
    e.pickup = kind;
    e.amount = value;
    push(e);
}

void EventQueue::projectile_blocked(const Vector3& pos) {
    SimEvent e{EventKind::ProjectileBlocked};
    e.position = pos;
    push(e);
}

void EventQueue::player_destroyed() {
    push(SimEvent{EventKind::PlayerDestroyed});
}

void EventQueue::player_status_changed(f32 hull, f32 shields) {
    SimEvent e{EventKind::PlayerStatusChanged};
    e.amount = hull;
    e.value = shields;
    push(e);
}

size_t EventQueue::count(EventKind kind) const {
    return static_cast<size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [kind](const SimEvent& e) { return e.kind == kind; }));
}

void EventQueue::drain(std::vector<SimEvent>& out) {
    out.insert(out.end(), events_.begin(), events_.end());
    events_.clear();
}

} // namespace sky::sim
