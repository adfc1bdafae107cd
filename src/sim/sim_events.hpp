#pragma once

#include "core/types.hpp"
#include "sim/entity.hpp"

#include <vector>

namespace sky::sim {

enum class EventKind : u8 {
    EnemyDestroyed,
    EnemyDamaged,
    PlayerHit,
    ScoreChanged,
    PhaseChanged,
    PickupAvailable,
    PickupCollected,
    ProjectileBlocked,
    PlayerDestroyed,
    PlayerStatusChanged,
};

constexpr size_t EVENT_KIND_COUNT =
    static_cast<size_t>(EventKind::PlayerStatusChanged) + 1;

const char* event_name(EventKind kind);

enum class PhaseKind : u8 { Intro, Wave, Elite, BossApproach, BossFight, Victory };

enum class PickupKind : u8 { Health, Shield, WeaponBoost };

const char* phase_kind_name(PhaseKind phase);
const char* pickup_kind_name(PickupKind kind);

/// Flat event record. Which fields are meaningful depends on kind:
///   EnemyDestroyed      enemy_type, stage, position
///   EnemyDamaged        enemy_type, amount
///   PlayerHit           amount
///   ScoreChanged        score, delta
///   PhaseChanged        phase, wave_index, stage
///   PickupAvailable     pickup, position
///   PickupCollected     pickup, amount
///   ProjectileBlocked   position
///   PlayerStatusChanged amount = hull, value = shields
struct SimEvent {
    EventKind kind;
    EnemyType enemy_type = EnemyType::Drone;
    PhaseKind phase = PhaseKind::Intro;
    PickupKind pickup = PickupKind::Health;
    u32 stage = 0;
    u32 wave_index = 0;
    u64 score = 0;
    i64 delta = 0;
    f32 amount = 0;
    f32 value = 0;
    Vector3 position;
};

/// Per-run event buffer. Systems push during the tick; consumers drain
/// between ticks. Storage is reserved once and reused.
class EventQueue {
public:
    explicit EventQueue(size_t reserve = 256) { events_.reserve(reserve); }

    void push(const SimEvent& e) { events_.push_back(e); }

    void enemy_destroyed(EnemyType type, u32 stage, const Vector3& pos);
    void enemy_damaged(EnemyType type, f32 amount);
    void player_hit(f32 amount);
    void score_changed(u64 score, i64 delta);
    void phase_changed(PhaseKind phase, u32 wave_index, u32 stage);
    void pickup_available(PickupKind kind, const Vector3& pos);
    void pickup_collected(PickupKind kind, f32 value);
    void projectile_blocked(const Vector3& pos);
    void player_destroyed();
    void player_status_changed(f32 hull, f32 shields);

    const std::vector<SimEvent>& events() const { return events_; }
    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }
    size_t count(EventKind kind) const;

    /// Move pending events into out (appending) and clear the queue while
    /// keeping its capacity.
    void drain(std::vector<SimEvent>& out);
    void clear() { events_.clear(); }

private:
    std::vector<SimEvent> events_;
};

} // namespace sky::sim
