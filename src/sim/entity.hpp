#pragma once

#include "core/types.hpp"
#include "sim/enemy_types.hpp"

#include <algorithm>
#include <cmath>

namespace sky::sim {

struct Vector3 {
    f32 x = 0, y = 0, z = 0;
};

inline Vector3 operator+(const Vector3& a, const Vector3& b) {
    return {a.x + b.x, a.y + b.y, a.z + b.z};
}
inline Vector3 operator-(const Vector3& a, const Vector3& b) {
    return {a.x - b.x, a.y - b.y, a.z - b.z};
}
inline Vector3 operator*(const Vector3& v, f32 s) {
    return {v.x * s, v.y * s, v.z * s};
}

inline f32 length_sq(const Vector3& v) {
    return v.x * v.x + v.y * v.y + v.z * v.z;
}
inline f32 distance_sq(const Vector3& a, const Vector3& b) {
    return length_sq(a - b);
}
inline Vector3 normalized(const Vector3& v) {
    f32 len2 = length_sq(v);
    if (len2 <= 0.0f) return {};
    f32 inv = 1.0f / std::sqrt(len2);
    return v * inv;
}

/// Linear blend used by presentation; alpha in [0,1].
inline Vector3 interpolate(const Vector3& from, const Vector3& to, f32 alpha) {
    return {from.x + (to.x - from.x) * alpha,
            from.y + (to.y - from.y) * alpha,
            from.z + (to.z - from.z) * alpha};
}

struct Quaternion {
    f32 x = 0, y = 0, z = 0, w = 1;
};

inline Quaternion operator*(const Quaternion& a, const Quaternion& b) {
    return {a.w * b.x + a.x * b.w + a.y * b.z - a.z * b.y,
            a.w * b.y - a.x * b.z + a.y * b.w + a.z * b.x,
            a.w * b.z + a.x * b.y - a.y * b.x + a.z * b.w,
            a.w * b.w - a.x * b.x - a.y * b.y - a.z * b.z};
}

/// Axis need not be unit length; a zero axis yields identity.
inline Quaternion from_axis_angle(const Vector3& axis, f32 angle) {
    Vector3 n = normalized(axis);
    f32 s = std::sin(angle * 0.5f);
    if (length_sq(n) == 0.0f) return {};
    return {n.x * s, n.y * s, n.z * s, std::cos(angle * 0.5f)};
}

/// Incremental local-space rotation: q = q * rot(axis, angle).
inline void rotate(Quaternion& q, const Vector3& axis, f32 angle) {
    q = q * from_axis_angle(axis, angle);
}

enum class Owner : u8 { Player, Enemy };

/// Pooled enemy record. Fields survive release until the pool's reset
/// function runs on the next acquire.
struct EnemyRecord {
    u32 id = 0;
    bool active = false;
    EnemyType type = EnemyType::Drone;
    Owner owner = Owner::Enemy;

    Vector3 position;
    Vector3 prev_position;
    Quaternion orientation;
    Vector3 scale{1.0f, 1.0f, 1.0f};
    Vector3 velocity;

    f32 hp = 0;
    f32 max_hp = 0;
    f32 damage = 0;
    f32 speed = 0;

    Seconds created_at = 0;
    f32 seed = 0;
    u32 stage = 1;

    bool is_dying = false;
    f32 death_timer = 0;
    Seconds last_hit_time = -1.0;
    Seconds last_contact_time = -1.0e9;
    Seconds last_fire_time = -1.0e9;

    u32 pool_slot = 0;

    /// HP fraction for color-coding; 0 once dead.
    f32 hp_ratio() const { return max_hp > 0 ? hp / max_hp : 0.0f; }

    /// Dissolve progress in [0,1] while dying, 0 otherwise.
    f32 death_progress(f32 disintegration) const {
        if (!is_dying || disintegration <= 0) return 0.0f;
        return std::clamp(death_timer / disintegration, 0.0f, 1.0f);
    }
};

} // namespace sky::sim
