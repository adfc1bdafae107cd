#pragma once

#include "sim/entity.hpp"
#include "sim/sim_config.hpp"
#include "sim/sim_events.hpp"

namespace sky::sim {

struct SimSnapshot;

struct PickupRecord {
    u32 id = 0;
    bool active = false;
    PickupKind kind = PickupKind::Health;
    Vector3 position;
    Vector3 prev_position;
    Seconds created_at = 0;
    f32 value = 0;
    u32 pool_slot = 0;
};

/// Spawn a pickup at pos with the value the drop table assigns to kind.
PickupRecord* spawn_pickup(SimSnapshot& s, const DropTable& drops,
                           PickupKind kind, const Vector3& pos);

/// Drift, collection and expiry of pickups.
class PickupSystem {
public:
    explicit PickupSystem(const SimConfig& config) : config_(config) {}

    void update(SimSnapshot& s, f64 dt);

private:
    void collect(SimSnapshot& s, PickupRecord& pickup);

    const SimConfig& config_;
};

} // namespace sky::sim
