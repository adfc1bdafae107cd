#include "sim/enemy_types.hpp"

namespace sky::sim {

namespace {

// Indexed by EnemyType. Jitter amplitudes are units/s, frequencies rad/s.
constexpr std::array<EnemyTraits, ENEMY_TYPE_COUNT> TRAITS = {{
    // rule                      hover_z  jit_x  jit_y  fq_x  fq_y  spin
    {MovementRule::Approach,       0.0f,   6.0f,  6.0f, 0.35f, 0.45f, 0.4f}, // asteroid
    {MovementRule::HoverStrafe,  -50.0f,  30.0f, 15.0f, 2.0f,  1.5f,  1.5f}, // drone
    {MovementRule::Jitter,         0.0f,  25.0f, 15.0f, 4.0f,  3.0f,  2.0f}, // scout
    {MovementRule::HoverStrafe,  -70.0f,  24.0f, 10.0f, 2.1f,  1.6f,  1.0f}, // fighter
    {MovementRule::Approach,       0.0f,   0.0f,  0.0f, 0.0f,  0.0f,  0.5f}, // heavy
    {MovementRule::Jitter,         0.0f,  40.0f,  0.0f, 5.0f,  0.0f,  5.0f}, // speeder
    {MovementRule::Approach,       0.0f,   0.0f,  0.0f, 0.0f,  0.0f,  0.8f}, // charger
    {MovementRule::HoverStrafe, -200.0f,   0.0f,  5.0f, 0.0f,  1.0f,  0.3f}, // sniper
    {MovementRule::Jitter,         0.0f,  10.0f, 10.0f, 6.0f,  5.0f,  3.0f}, // swarmer
    {MovementRule::Orbit,          0.0f, 100.0f,  0.0f, 0.5f,  0.0f,  1.0f}, // orbit
    {MovementRule::Approach,       0.0f,   0.0f,  0.0f, 0.0f,  0.0f,  0.2f}, // titan
    {MovementRule::HoverStrafe,  -90.0f,  18.0f,  8.0f, 1.3f,  1.2f,  0.6f}, // elite
    {MovementRule::BossApproach,   0.0f,   2.0f,  1.0f, 0.3f,  0.2f,  0.1f}, // boss
}};

constexpr std::array<const char*, ENEMY_TYPE_COUNT> NAMES = {
    "asteroid", "drone",   "scout",   "fighter", "heavy", "speeder", "charger",
    "sniper",   "swarmer", "orbit",   "titan",   "elite", "boss",
};

} // namespace

const EnemyTraits& traits_of(EnemyType type) {
    return TRAITS[index_of(type)];
}

const char* enemy_type_name(EnemyType type) {
    return NAMES[index_of(type)];
}

std::optional<EnemyType> enemy_type_from_string(std::string_view name) {
    for (size_t i = 0; i < NAMES.size(); ++i) {
        if (name == NAMES[i]) return static_cast<EnemyType>(i);
    }
    return std::nullopt;
}

} // namespace sky::sim
