#include "sim/sim_config.hpp"

namespace sky::sim {

namespace {

constexpr std::array<const char*, 8> PAYLOAD_NAMES = {
    "standard", "piercing", "chain", "area",
    "spread",   "delayed_burst", "spiral", "grid",
};

SpawnRegion region(f32 x_spread, f32 y_spread, f32 y_offset, f32 z_near,
                   f32 z_far) {
    return {x_spread, y_spread, y_offset, z_near, z_far};
}

void set_type(SimConfig& cfg, EnemyType type, f32 hp, f32 speed,
              SpawnRegion spawn, f32 hit_radius, f32 contact_radius,
              u32 score, f32 ram_damage) {
    auto& t = cfg.tuning(type);
    t.base_hp = hp;
    t.base_speed = speed;
    t.region = spawn;
    t.hit_radius = hit_radius;
    t.contact_radius = contact_radius;
    t.score = score;
    t.ram_damage = ram_damage;
}

void set_gun(SimConfig& cfg, EnemyType type, f32 cooldown, f32 speed,
             f32 damage, f32 range) {
    cfg.tuning(type).gun = {true, cooldown, speed, damage, range};
}

} // namespace

const char* payload_name(PayloadType payload) {
    return PAYLOAD_NAMES[static_cast<size_t>(payload)];
}

std::optional<PayloadType> payload_from_string(std::string_view name) {
    for (size_t i = 0; i < PAYLOAD_NAMES.size(); ++i) {
        if (name == PAYLOAD_NAMES[i]) return static_cast<PayloadType>(i);
    }
    return std::nullopt;
}

SimConfig SimConfig::defaults() {
    SimConfig cfg;

    // Stage table: one archetype per stage, later stages toughen everything
    // else through the multipliers.
    auto stage = [&](EnemyType type, f32 hp, f32 speed, SpawnRegion r) {
        auto n = static_cast<f32>(cfg.stages.size());
        cfg.stages.push_back({type, hp, speed, r, 1.0f + 0.15f * n,
                              1.0f + 0.05f * n});
    };
    stage(EnemyType::Drone, 60, 40, region(80, 20, 20, -300, -400));
    stage(EnemyType::Scout, 150, 80, region(120, 40, 15, -350, -450));
    stage(EnemyType::Heavy, 400, 20, region(60, 20, 10, -400, -500));
    stage(EnemyType::Speeder, 40, 120, region(160, 30, 20, -450, -550));
    stage(EnemyType::Charger, 200, 60, region(100, 30, 15, -350, -450));
    stage(EnemyType::Sniper, 100, 30, region(140, 40, 25, -500, -600));
    stage(EnemyType::Swarmer, 30, 50, region(60, 60, 20, -300, -350));
    stage(EnemyType::Orbit, 250, 40, region(40, 20, 20, -400, -500));
    stage(EnemyType::Titan, 2000, 15, region(20, 10, 10, -600, -700));

    //                           hp    speed  spawn                             hit  contact score ram
    set_type(cfg, EnemyType::Asteroid, 15, 30, region(120, 60, 20, -250, -350), 20, 15, 50, 5);
    set_type(cfg, EnemyType::Drone, 60, 40, region(80, 20, 20, -300, -400), 12, 10, 100, 10);
    set_type(cfg, EnemyType::Scout, 150, 80, region(120, 40, 15, -350, -450), 20, 15, 300, 10);
    set_type(cfg, EnemyType::Fighter, 60, 50, region(100, 30, 20, -300, -400), 18, 15, 200, 10);
    set_type(cfg, EnemyType::Heavy, 400, 20, region(60, 20, 10, -400, -500), 25, 20, 400, 10);
    set_type(cfg, EnemyType::Speeder, 40, 120, region(160, 30, 20, -450, -550), 12, 10, 200, 10);
    set_type(cfg, EnemyType::Charger, 200, 60, region(100, 30, 15, -350, -450), 18, 15, 250, 10);
    set_type(cfg, EnemyType::Sniper, 100, 30, region(140, 40, 25, -500, -600), 15, 12, 350, 10);
    set_type(cfg, EnemyType::Swarmer, 30, 50, region(60, 60, 20, -300, -350), 8, 8, 100, 10);
    set_type(cfg, EnemyType::Orbit, 250, 40, region(40, 20, 20, -400, -500), 25, 20, 500, 10);
    set_type(cfg, EnemyType::Titan, 2000, 15, region(20, 10, 10, -600, -700), 60, 50, 2000, 10);
    set_type(cfg, EnemyType::Elite, 200, 45, region(60, 20, 20, -350, -400), 35, 30, 1000, 10);
    set_type(cfg, EnemyType::Boss, 1200, 1.5f, region(0, 0, 30, -600, -600), 80, 50, 5000, 20);

    //                                  cooldown speed damage range
    set_gun(cfg, EnemyType::Drone, 2.5f, 60, 5, 150);
    set_gun(cfg, EnemyType::Fighter, 1.8f, 80, 8, 200);
    set_gun(cfg, EnemyType::Elite, 1.2f, 100, 12, 250);
    set_gun(cfg, EnemyType::Boss, 0.8f, 70, 15, 300);
    set_gun(cfg, EnemyType::Scout, 3.0f, 50, 4, 120);

    cfg.waves = {
        {EnemyType::Asteroid, 10, 1.0, 5},
        {std::nullopt, 8, 1.5, 4},
        {EnemyType::Fighter, 6, 2.0, 3},
    };

    WeaponDef plasma;
    plasma.id = "plasma_bolt";
    plasma.payload = PayloadType::Standard;
    plasma.speed = 150;
    plasma.damage = 15;
    plasma.energy_cost = 5;
    plasma.fire_rate = 2;
    cfg.weapons.push_back(plasma);

    WeaponDef ripple;
    ripple.id = "ripple_cannon";
    ripple.payload = PayloadType::Area;
    ripple.speed = 130;
    ripple.damage = 12;
    ripple.energy_cost = 18;
    ripple.fire_rate = 1.8f;
    ripple.start_radius = 2;
    ripple.max_radius = 40;
    ripple.expand_rate = 80;
    cfg.weapons.push_back(ripple);

    WeaponDef chain;
    chain.id = "chain_lightning";
    chain.payload = PayloadType::Chain;
    chain.speed = 170;
    chain.damage = 18;
    chain.energy_cost = 22;
    chain.fire_rate = 1.5f;
    chain.max_bounces = 4;
    chain.bounce_range = 60;
    chain.damage_decay = 0.25f;
    cfg.weapons.push_back(chain);

    WeaponDef rail;
    rail.id = "ballistic_railgun";
    rail.payload = PayloadType::Piercing;
    rail.speed = 450;
    rail.damage = 45;
    rail.energy_cost = 35;
    rail.fire_rate = 0.6f;
    rail.pierce_count = 999;
    cfg.weapons.push_back(rail);

    WeaponDef scatter;
    scatter.id = "plasma_scatter";
    scatter.payload = PayloadType::Spread;
    scatter.speed = 210;
    scatter.damage = 8;
    scatter.energy_cost = 16;
    scatter.fire_rate = 3.2f;
    scatter.lifetime = 0.8f;
    scatter.pellet_count = 7;
    scatter.spread_angle = 25;
    cfg.weapons.push_back(scatter);

    WeaponDef lattice;
    lattice.id = "photon_lattice";
    lattice.payload = PayloadType::Grid;
    lattice.speed = 150;
    lattice.damage = 10;
    lattice.energy_cost = 24;
    lattice.fire_rate = 1.2f;
    lattice.start_radius = 2;
    lattice.max_radius = 30;  // half of the 60-unit grid
    lattice.expand_rate = 30;
    cfg.weapons.push_back(lattice);

    WeaponDef nova;
    nova.id = "nova_spike";
    nova.payload = PayloadType::DelayedBurst;
    nova.speed = 180;
    nova.damage = 25;
    nova.energy_cost = 20;
    nova.fire_rate = 1.4f;
    nova.stick_duration = 0.5f;
    nova.explosion_radius = 60;
    nova.explosion_damage = 35;
    cfg.weapons.push_back(nova);

    WeaponDef winder;
    winder.id = "phase_winder";
    winder.payload = PayloadType::Spiral;
    winder.speed = 240;
    winder.damage = 14;
    winder.energy_cost = 19;
    winder.fire_rate = 2;
    winder.spiral_radius = 8;
    winder.spiral_speed = 15;
    winder.hits_per_target = 2;
    cfg.weapons.push_back(winder);

    return cfg;
}

const StageArchetype& SimConfig::stage_entry(u32 stage) const {
    static const StageArchetype fallback{};
    if (stages.empty()) return fallback;
    size_t idx = stage == 0 ? 0 : stage - 1;
    if (idx >= stages.size()) idx = stages.size() - 1;
    return stages[idx];
}

const WeaponDef* SimConfig::find_weapon(std::string_view id) const {
    for (const auto& w : weapons) {
        if (w.id == id) return &w;
    }
    return nullptr;
}

WeaponDef* SimConfig::find_weapon(std::string_view id) {
    for (auto& w : weapons) {
        if (w.id == id) return &w;
    }
    return nullptr;
}

const WeaponDef& SimConfig::equipped() const {
    static const WeaponDef fallback{"plasma_bolt"};
    if (const auto* w = find_weapon(equipped_weapon)) return *w;
    return weapons.empty() ? fallback : weapons.front();
}

} // namespace sky::sim
