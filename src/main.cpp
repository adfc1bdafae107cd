#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/config_loader.hpp"
#include "lua/event_bridge.hpp"
#include "lua/lua_state.hpp"
#include "sim/game_loop.hpp"
#include "sim/sim_state.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace {

struct DriverOptions {
    sky::fs::path config_path;
    sky::fs::path script_path;
    sky::f64 seconds = 60.0;
    std::optional<sky::u32> seed;
    std::string weapon;
    std::string log_level;
    bool fire = true;
    bool variable_frames = false;
};

void print_usage() {
    std::cout << "Skyward v0.3.0\n"
              << "Headless driver for the arcade space-combat simulation core\n\n"
              << "Usage:\n"
              << "  skyward [options]\n\n"
              << "Options:\n"
              << "  --config <path>     Lua file overriding the default tuning\n"
              << "  --script <path>     Lua file defining On<Event> handlers\n"
              << "  --seconds <n>       Simulated seconds to run (default: 60)\n"
              << "  --seed <n>          RNG seed (overrides the config)\n"
              << "  --weapon <id>       Equip a weapon by id (e.g. chain_lightning)\n"
              << "  --no-fire           Autopilot never pulls the trigger\n"
              << "  --variable-frames   Alternate 1/144 s and 1/30 s host frames\n"
              << "  --log-level <lvl>   trace, debug, info, warn, error\n"
              << "  --help              Show this help message\n";
}

DriverOptions parse_args(int argc, char* argv[]) {
    DriverOptions opts;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--script") == 0 && i + 1 < argc) {
            opts.script_path = argv[++i];
        } else if (std::strcmp(argv[i], "--seconds") == 0 && i + 1 < argc) {
            opts.seconds = std::max(0.0, std::atof(argv[++i]));
        } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            opts.seed = static_cast<sky::u32>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--weapon") == 0 && i + 1 < argc) {
            opts.weapon = argv[++i];
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            opts.log_level = argv[++i];
        } else if (std::strcmp(argv[i], "--no-fire") == 0) {
            opts.fire = false;
        } else if (std::strcmp(argv[i], "--variable-frames") == 0) {
            opts.variable_frames = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            spdlog::warn("Ignoring unknown argument: {}", argv[i]);
        }
    }

    return opts;
}

/// Steer the crosshair toward the nearest live enemy, or sweep slowly when
/// the field is empty.
sky::sim::InputSnapshot autopilot(const sky::sim::SimSnapshot& s,
                                  const sky::sim::SimConfig& config,
                                  bool fire) {
    using namespace sky::sim;
    InputSnapshot in;
    in.fire = fire;
    in.move_x = std::sin(static_cast<sky::f32>(s.elapsed) * 0.3f) * 0.5f;

    const EnemyRecord* target = nullptr;
    sky::f32 best = 0;
    for (const auto* e : s.enemies) {
        if (!e->active || e->is_dying) continue;
        sky::f32 d2 = distance_sq(e->position, s.player.position);
        if (!target || d2 < best) {
            target = e;
            best = d2;
        }
    }

    sky::f32 sens = config.player.look_sensitivity;
    if (!target || sens <= 0) {
        in.look_x = std::sin(static_cast<sky::f32>(s.elapsed) * 0.5f) * 20.0f;
        return in;
    }

    Vector3 d = target->position - s.player.position;
    sky::f32 want_yaw = std::atan2(-d.x, -d.z);
    sky::f32 want_pitch = std::atan2(d.y, std::sqrt(d.x * d.x + d.z * d.z));
    in.look_x = std::clamp((s.player.yaw - want_yaw) / sens, -400.0f, 400.0f);
    in.look_y = std::clamp((s.player.pitch - want_pitch) / sens, -400.0f, 400.0f);
    return in;
}

/// Load the event script with the run's seed and weapon visible as globals.
sky::Result<std::unique_ptr<sky::lua::LuaState>>
load_event_script(const sky::fs::path& path, const sky::sim::SimConfig& config) {
    auto script = std::make_unique<sky::lua::LuaState>();
    script->register_logging();
    script->set_global_number("Seed", config.seed);
    script->set_global_string("EquippedWeapon", config.equipped_weapon.c_str());

    auto result = script->do_file(path);
    if (!result) return sky::Error(result.error().message);

    size_t handlers = 0;
    for (size_t i = 0; i < sky::sim::EVENT_KIND_COUNT; i++) {
        auto kind = static_cast<sky::sim::EventKind>(i);
        if (script->has_function(sky::lua::EventBridge::handler_name(kind))) {
            ++handlers;
        }
    }
    if (handlers == 0) {
        spdlog::warn("Event script {} defines no On<Event> handlers",
                     path.string());
    }
    spdlog::info("Event script: {} ({} handlers)", path.string(), handlers);
    return script;
}

int run(const DriverOptions& opts) {
    using namespace sky::sim;

    // Configuration
    SimConfig config = SimConfig::defaults();
    if (!opts.config_path.empty()) {
        auto loaded = sky::lua::ConfigLoader::load_file(opts.config_path);
        if (!loaded) {
            spdlog::error("Config load failed: {}", loaded.error().message);
            return 1;
        }
        config = loaded.take();
    }
    if (opts.seed) config.seed = *opts.seed;
    if (!opts.weapon.empty()) {
        if (!config.find_weapon(opts.weapon)) {
            spdlog::error("Unknown weapon: {}", opts.weapon);
            return 1;
        }
        config.equipped_weapon = opts.weapon;
    }

    // Event script
    std::unique_ptr<sky::lua::LuaState> script;
    std::unique_ptr<sky::lua::EventBridge> bridge;
    if (!opts.script_path.empty()) {
        auto loaded = load_event_script(opts.script_path, config);
        if (!loaded) {
            spdlog::error("Event script failed: {}", loaded.error().message);
            return 1;
        }
        script = loaded.take();
        bridge = std::make_unique<sky::lua::EventBridge>(*script);
    }

    SimState sim(std::move(config));
    FixedStepLoop loop(sim);

    std::vector<SimEvent> events;
    events.reserve(1024);
    std::array<size_t, EVENT_KIND_COUNT> per_kind{};

    const sky::f64 frames[2] = {1.0 / 144.0, 1.0 / 30.0};
    size_t frame_index = 0;
    sky::f64 fed = 0.0;
    sky::u64 next_sample = 60;

    while (fed < opts.seconds && !sim.game_over()) {
        sky::f64 frame = opts.variable_frames ? frames[frame_index++ % 2]
                                              : SimState::SECONDS_PER_TICK;
        sim.set_input(autopilot(sim.snapshot(), sim.config(), opts.fire));
        loop.advance(frame);
        fed += frame;

        // Once per simulated second, what a renderer would draw this frame.
        if (sim.tick_count() >= next_sample) {
            const auto& p = sim.snapshot().player;
            auto shown = interpolate(p.prev_position, p.position,
                                     static_cast<sky::f32>(loop.alpha()));
            spdlog::debug("t={:.1f}s player at ({:.1f}, {:.1f}) alpha {:.2f}",
                          sim.elapsed(), shown.x, shown.y, loop.alpha());
            next_sample += 60;
        }

        sim.snapshot().events.drain(events);
        for (const auto& e : events) ++per_kind[static_cast<size_t>(e.kind)];
        if (bridge) bridge->dispatch(events);
        events.clear();
    }

    const auto& s = sim.snapshot();
    spdlog::info("Run finished after {} ticks ({:.2f}s simulated)",
                 s.tick_count, s.elapsed);
    spdlog::info("  Stage {} ({} cycles), phase {}, score {}, kills {}",
                 s.wave.stage, s.wave.cycles_completed, s.phase_name(),
                 s.score, s.kills);
    spdlog::info("  Player hull {:.0f}/{:.0f}, shields {:.0f}/{:.0f}{}",
                 s.player.hp, s.player.max_hp, s.player.shields,
                 s.player.max_shields, s.game_over ? " (destroyed)" : "");

    const EnemyRecord* weakest = nullptr;
    for (const auto* e : s.enemies) {
        if (!e->active || e->is_dying) continue;
        if (!weakest || e->hp_ratio() < weakest->hp_ratio()) weakest = e;
    }
    if (weakest) {
        spdlog::info("  Field: {} enemies, weakest {} at {:.0f}% hull",
                     s.enemies.size(), enemy_type_name(weakest->type),
                     weakest->hp_ratio() * 100.0f);
    }

    spdlog::info("  Pools: enemies {}, projectiles {}, pickups {}",
                 s.enemy_pool.capacity(), s.projectile_pool.capacity(),
                 s.pickup_pool.capacity());
    for (size_t i = 0; i < EVENT_KIND_COUNT; i++) {
        if (per_kind[i] == 0) continue;
        spdlog::info("  Events: {} x{}", event_name(static_cast<EventKind>(i)),
                     per_kind[i]);
    }
    if (bridge) {
        spdlog::info("  Script: {} handlers run, {} failed",
                     bridge->delivered(), bridge->failures());
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    sky::log::init();

    auto opts = parse_args(argc, argv);
    if (!opts.log_level.empty()) {
        sky::log::set_level(opts.log_level);
    }

    int code = run(opts);
    sky::log::shutdown();
    return code;
}

