#pragma once

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace sky::sim {

enum class EnemyType : u8 {
    Asteroid,
    Drone,
    Scout,
    Fighter,
    Heavy,
    Speeder,
    Charger,
    Sniper,
    Swarmer,
    Orbit,
    Titan,
    Elite,
    Boss,
};

constexpr size_t ENEMY_TYPE_COUNT = static_cast<size_t>(EnemyType::Boss) + 1;

constexpr size_t index_of(EnemyType t) { return static_cast<size_t>(t); }

/// Kinematic rule family an enemy type moves by.
enum class MovementRule : u8 {
    Approach,     // straight depth approach
    HoverStrafe,  // approach to a hover depth, then strafe and re-center
    Jitter,       // fast approach with high-frequency lateral jitter
    BossApproach, // slow imposing approach with a closing-distance floor
    Orbit,        // polar sweep around the player origin
};

/// Fixed per-type movement parameters. Tunable gameplay values (HP, speed,
/// radii, score) live in SimConfig; these shape the motion itself.
struct EnemyTraits {
    MovementRule rule;
    f32 hover_z;      // HoverStrafe: depth where approach stops
    f32 jitter_x;     // lateral amplitude (units/s)
    f32 jitter_y;     // vertical amplitude (units/s)
    f32 freq_x;       // lateral frequency (rad/s)
    f32 freq_y;       // vertical frequency (rad/s)
    f32 spin_rate;    // idle spin (rad/s)
};

const EnemyTraits& traits_of(EnemyType type);

const char* enemy_type_name(EnemyType type);
std::optional<EnemyType> enemy_type_from_string(std::string_view name);

} // namespace sky::sim
