#include "sim/player.hpp"
#include "sim/sim_snapshot.hpp"

#include <algorithm>

namespace sky::sim {

void PlayerSystem::update(SimSnapshot& s, f64 dt) {
    auto fdt = static_cast<f32>(dt);
    apply_look(s);
    apply_movement(s, fdt);
    regenerate(s, fdt);
    weapon_.update(s, dt);
}

void PlayerSystem::apply_look(SimSnapshot& s) {
    const auto& pt = config_.player;
    auto& p = s.player;

    p.yaw -= s.input.look_x * pt.look_sensitivity;
    p.pitch -= s.input.look_y * pt.look_sensitivity;
    p.pitch = std::clamp(p.pitch, -pt.pitch_limit, pt.pitch_limit);

    p.orientation = from_axis_angle({0, 1, 0}, p.yaw) *
                    from_axis_angle({1, 0, 0}, p.pitch);
}

void PlayerSystem::apply_movement(SimSnapshot& s, f32 dt) {
    const auto& pt = config_.player;
    auto& p = s.player;

    p.is_boosting = s.input.boost && p.energy > 0;
    f32 speed = pt.speed * (p.is_boosting ? pt.boost_multiplier : 1.0f);

    f32 mx = std::clamp(s.input.move_x, -1.0f, 1.0f);
    f32 my = std::clamp(s.input.move_y, -1.0f, 1.0f);
    p.position.x = std::clamp(p.position.x + mx * speed * dt,
                              -pt.move_limit_x, pt.move_limit_x);
    p.position.y = std::clamp(p.position.y + my * speed * dt,
                              -pt.move_limit_y, pt.move_limit_y);
    p.position.z = 0;
}

void PlayerSystem::regenerate(SimSnapshot& s, f32 dt) {
    const auto& pt = config_.player;
    auto& p = s.player;

    p.shields = std::min(p.max_shields, p.shields + pt.shield_regen * dt);

    if (p.is_boosting) {
        p.energy = std::max(0.0f, p.energy - pt.boost_drain * dt);
    } else {
        p.energy = std::min(p.max_energy, p.energy + pt.energy_regen * dt);
    }

    p.turbo_timer = std::max(0.0f, p.turbo_timer - dt);
}

} // namespace sky::sim
