#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <type_traits>

#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace sky::lua {

using sim::SimConfig;

namespace {

constexpr f64 INF = std::numeric_limits<f64>::infinity();

/// Read a string field from the table at the given stack index.
/// Returns empty string if field doesn't exist or isn't a string.
std::string read_string_field(lua_State* L, int table_idx, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    std::string result;
    if (lua_isstring(L, -1)) {
        result = lua_tostring(L, -1);
    }
    lua_pop(L, 1);
    return result;
}

/// Store v into field when it is finite, inside [lo, hi] and representable
/// by T. Integral fields also reject fractions. Returns false after warning.
template <typename T>
bool accept_number(const std::string& where, f64 v, T& field, f64 lo = -INF,
                   f64 hi = INF) {
    lo = std::max(lo, static_cast<f64>(std::numeric_limits<T>::lowest()));
    if constexpr (std::is_integral_v<T>) {
        // 2^digits is the first value T cannot hold; step just below it.
        f64 past = std::ldexp(1.0, std::numeric_limits<T>::digits);
        hi = std::min(hi, std::nextafter(past, 0.0));
    } else {
        hi = std::min(hi, static_cast<f64>(std::numeric_limits<T>::max()));
    }
    if (std::isnan(v) || v < lo || v > hi) {
        spdlog::warn("Config {} = {} is out of range [{}, {}], keeping {}",
                     where, v, lo, hi, static_cast<f64>(field));
        return false;
    }
    if constexpr (std::is_integral_v<T>) {
        if (v != std::floor(v)) {
            spdlog::warn("Config {} = {} is not a whole number, keeping {}",
                         where, v, static_cast<f64>(field));
            return false;
        }
    }
    field = static_cast<T>(v);
    return true;
}

/// Overwrite field with t[key] when it is an acceptable number. A missing
/// key leaves field alone; anything else is warned about.
template <typename T>
void overlay_number(lua_State* L, int table_idx, const std::string& section,
                    const char* key, T& field, f64 lo = -INF, f64 hi = INF) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    if (lua_isnil(L, -1)) {
        lua_pop(L, 1);
        return;
    }
    if (!lua_isnumber(L, -1)) {
        spdlog::warn("Config {}.{}: expected a number, keeping {}", section,
                     key, static_cast<f64>(field));
        lua_pop(L, 1);
        return;
    }
    f64 v = lua_tonumber(L, -1);
    lua_pop(L, 1);
    accept_number(section + "." + key, v, field, lo, hi);
}

/// Push t[key] if it is a table and return its absolute index, else 0 with
/// the stack unchanged.
int push_table_field(lua_State* L, int table_idx, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    if (lua_istable(L, -1)) return lua_gettop(L);
    lua_pop(L, 1);
    return 0;
}

enum class GlobalKind { Missing, Table, WrongType };

/// Push a global if it is a table. Leaves nothing on the stack otherwise.
GlobalKind push_global_table(lua_State* L, const char* name) {
    lua_getglobal(L, name);
    if (lua_istable(L, -1)) return GlobalKind::Table;
    GlobalKind kind = lua_isnil(L, -1) ? GlobalKind::Missing
                                       : GlobalKind::WrongType;
    lua_pop(L, 1);
    return kind;
}

void read_region(lua_State* L, int idx, const std::string& section,
                 sim::SpawnRegion& region) {
    int r = push_table_field(L, idx, "region");
    if (!r) return;
    std::string where = section + ".region";
    overlay_number(L, r, where, "x_spread", region.x_spread, 0.0);
    overlay_number(L, r, where, "y_spread", region.y_spread, 0.0);
    overlay_number(L, r, where, "y_offset", region.y_offset);
    overlay_number(L, r, where, "z_near", region.z_near);
    overlay_number(L, r, where, "z_far", region.z_far);
    lua_pop(L, 1);
}

void read_bounds(lua_State* L, int idx, sim::Bounds& b) {
    const std::string s = "Bounds";
    overlay_number(L, idx, s, "wall_z", b.wall_z);
    overlay_number(L, idx, s, "floor_y", b.floor_y);
    overlay_number(L, idx, s, "despawn_near_z", b.despawn_near_z);
    overlay_number(L, idx, s, "despawn_far_z", b.despawn_far_z);
    overlay_number(L, idx, s, "lateral_cap", b.lateral_cap, 0.0);
    overlay_number(L, idx, s, "boss_floor_z", b.boss_floor_z);
    overlay_number(L, idx, s, "projectile_max_range", b.projectile_max_range, 0.0);
}

void read_drops(lua_State* L, int idx, sim::DropTable& d) {
    const std::string s = "Combat.drops";
    overlay_number(L, idx, s, "health_chance", d.health_chance, 0.0, 1.0);
    overlay_number(L, idx, s, "shield_chance", d.shield_chance, 0.0, 1.0);
    overlay_number(L, idx, s, "boost_chance", d.boost_chance, 0.0, 1.0);
    overlay_number(L, idx, s, "min_stage", d.min_stage, 1.0);
    overlay_number(L, idx, s, "health_value", d.health_value, 0.0);
    overlay_number(L, idx, s, "shield_value", d.shield_value, 0.0);
    overlay_number(L, idx, s, "boost_seconds", d.boost_seconds, 0.0);
    overlay_number(L, idx, s, "pickup_radius", d.pickup_radius, 0.0);
    overlay_number(L, idx, s, "drift_y", d.drift_y);
    overlay_number(L, idx, s, "drift_z", d.drift_z);
    overlay_number(L, idx, s, "expire_z", d.expire_z);
    overlay_number(L, idx, s, "lifetime", d.lifetime, 0.0);

    if (d.health_chance + d.shield_chance + d.boost_chance > 1.0f) {
        spdlog::warn("Config {}: drop chances sum past 1, later kinds are "
                     "starved", s);
    }
}

void read_combat(lua_State* L, int idx, SimConfig& cfg) {
    const std::string s = "Combat";
    auto& c = cfg.combat;
    overlay_number(L, idx, s, "disintegration_duration",
                   c.disintegration_duration, 0.0);
    overlay_number(L, idx, s, "player_radius", c.player_radius, 0.0);
    overlay_number(L, idx, s, "push_force", c.push_force, 0.0);
    overlay_number(L, idx, s, "contact_interval", c.contact_interval, 0.0);
    overlay_number(L, idx, s, "player_hit_radius", c.player_hit_radius, 0.0);
    overlay_number(L, idx, s, "intercept_radius", c.intercept_radius, 0.0);
    overlay_number(L, idx, s, "enemy_projectile_lifetime",
                   c.enemy_projectile_lifetime, 0.0);

    if (int d = push_table_field(L, idx, "drops")) {
        read_drops(L, d, cfg.drops);
        lua_pop(L, 1);
    }
}

void read_phases(lua_State* L, int idx, sim::PhaseTimers& p) {
    const std::string s = "Phases";
    overlay_number(L, idx, s, "intro_duration", p.intro_duration, 0.0);
    overlay_number(L, idx, s, "elite_settle_delay", p.elite_settle_delay, 0.0);
    overlay_number(L, idx, s, "elite_min_elapsed", p.elite_min_elapsed, 0.0);
    overlay_number(L, idx, s, "boss_approach_duration",
                   p.boss_approach_duration, 0.0);
    overlay_number(L, idx, s, "victory_duration", p.victory_duration, 0.0);
    overlay_number(L, idx, s, "boss_victory_bonus", p.boss_victory_bonus, 0.0);
}

void read_player(lua_State* L, int idx, sim::PlayerTuning& p) {
    const std::string s = "Player";
    overlay_number(L, idx, s, "max_hp", p.max_hp, 1.0);
    overlay_number(L, idx, s, "max_shields", p.max_shields, 0.0);
    overlay_number(L, idx, s, "max_energy", p.max_energy, 0.0);
    overlay_number(L, idx, s, "shield_regen", p.shield_regen, 0.0);
    overlay_number(L, idx, s, "energy_regen", p.energy_regen, 0.0);
    overlay_number(L, idx, s, "speed", p.speed, 0.0);
    overlay_number(L, idx, s, "boost_multiplier", p.boost_multiplier, 1.0);
    overlay_number(L, idx, s, "boost_drain", p.boost_drain, 0.0);
    overlay_number(L, idx, s, "move_limit_x", p.move_limit_x, 0.0);
    overlay_number(L, idx, s, "move_limit_y", p.move_limit_y, 0.0);
    overlay_number(L, idx, s, "look_sensitivity", p.look_sensitivity, 0.0);
    overlay_number(L, idx, s, "pitch_limit", p.pitch_limit, 0.0, 1.5707963);
    overlay_number(L, idx, s, "gun_offset_x", p.gun_offset_x, 0.0);
}

void read_pools(lua_State* L, int idx, sim::PoolSizes& p) {
    const std::string s = "Pools";
    overlay_number(L, idx, s, "enemy_initial", p.enemy_initial, 0.0);
    overlay_number(L, idx, s, "enemy_soft_cap", p.enemy_soft_cap, 1.0);
    overlay_number(L, idx, s, "projectile_initial", p.projectile_initial, 0.0);
    overlay_number(L, idx, s, "projectile_soft_cap", p.projectile_soft_cap, 1.0);
    overlay_number(L, idx, s, "pickup_initial", p.pickup_initial, 0.0);
    overlay_number(L, idx, s, "pickup_soft_cap", p.pickup_soft_cap, 1.0);
}

void read_stages(lua_State* L, int idx, SimConfig& cfg) {
    std::vector<sim::StageArchetype> stages;
    int entries = 0;

    for (int i = 1; ; i++) {
        lua_pushnumber(L, i);
        lua_gettable(L, idx);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        ++entries;
        std::string where = "Stages[" + std::to_string(i) + "]";
        if (!lua_istable(L, -1)) {
            spdlog::warn("Config {}: expected a table, skipped", where);
            lua_pop(L, 1);
            continue;
        }
        int entry = lua_gettop(L);

        std::string type_name = read_string_field(L, entry, "type");
        auto type = sim::enemy_type_from_string(type_name);
        if (!type) {
            spdlog::warn("Config {}: unknown enemy type '{}', skipped", where,
                         type_name);
            lua_pop(L, 1);
            continue;
        }

        const auto& tune = cfg.tuning(*type);
        sim::StageArchetype st;
        st.type = *type;
        st.hp = tune.base_hp;
        st.speed = tune.base_speed;
        st.region = tune.region;
        overlay_number(L, entry, where, "hp", st.hp, 1.0);
        overlay_number(L, entry, where, "speed", st.speed, 0.0);
        overlay_number(L, entry, where, "hp_multiplier", st.hp_multiplier, 0.0);
        overlay_number(L, entry, where, "speed_multiplier", st.speed_multiplier,
                       0.0);
        read_region(L, entry, where, st.region);
        stages.push_back(st);
        lua_pop(L, 1);
    }

    if (stages.empty()) {
        if (entries > 0) {
            spdlog::warn("Config Stages: no usable entries, keeping {} defaults",
                         cfg.stages.size());
        }
        return;
    }
    cfg.stages = std::move(stages);
}

void read_gun(lua_State* L, int idx, const std::string& where,
              sim::EnemyGun& gun) {
    lua_pushstring(L, "gun");
    lua_gettable(L, idx);
    if (lua_isboolean(L, -1)) {
        if (!lua_toboolean(L, -1)) gun.enabled = false;
        lua_pop(L, 1);
        return;
    }
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return;
    }
    int g = lua_gettop(L);
    std::string section = where + ".gun";
    gun.enabled = true;
    overlay_number(L, g, section, "cooldown", gun.cooldown, 0.0);
    overlay_number(L, g, section, "speed", gun.speed, 0.0);
    overlay_number(L, g, section, "damage", gun.damage, 0.0);
    overlay_number(L, g, section, "range", gun.range, 0.0);
    lua_pop(L, 1);
}

void read_archetypes(lua_State* L, int idx, SimConfig& cfg) {
    lua_pushnil(L);
    while (lua_next(L, idx) != 0) {
        // key at -2, value at -1
        if (lua_type(L, -2) != LUA_TSTRING) {
            spdlog::warn("Config Archetypes: non-string key, skipped");
            lua_pop(L, 1);
            continue;
        }
        std::string name = lua_tostring(L, -2);
        std::string where = "Archetypes." + name;
        auto type = sim::enemy_type_from_string(name);
        if (!type) {
            spdlog::warn("Config {}: unknown enemy type, skipped", where);
            lua_pop(L, 1);
            continue;
        }
        if (!lua_istable(L, -1)) {
            spdlog::warn("Config {}: expected a table, skipped", where);
            lua_pop(L, 1);
            continue;
        }
        int entry = lua_gettop(L);
        auto& tune = cfg.tuning(*type);
        overlay_number(L, entry, where, "hp", tune.base_hp, 1.0);
        overlay_number(L, entry, where, "speed", tune.base_speed, 0.0);
        overlay_number(L, entry, where, "hit_radius", tune.hit_radius, 0.0);
        overlay_number(L, entry, where, "contact_radius", tune.contact_radius, 0.0);
        overlay_number(L, entry, where, "score", tune.score, 0.0);
        overlay_number(L, entry, where, "ram_damage", tune.ram_damage, 0.0);
        read_region(L, entry, where, tune.region);
        read_gun(L, entry, where, tune.gun);
        lua_pop(L, 1);
    }
}

void read_waves(lua_State* L, int idx, SimConfig& cfg) {
    std::vector<sim::WaveDef> waves;
    int entries = 0;

    for (int i = 1; ; i++) {
        lua_pushnumber(L, i);
        lua_gettable(L, idx);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        ++entries;
        std::string where = "Waves[" + std::to_string(i) + "]";
        if (!lua_istable(L, -1)) {
            spdlog::warn("Config {}: expected a table, skipped", where);
            lua_pop(L, 1);
            continue;
        }
        int entry = lua_gettop(L);

        sim::WaveDef wave;
        std::string type_name = read_string_field(L, entry, "type");
        if (type_name != "archetype") {
            wave.type = sim::enemy_type_from_string(type_name);
            if (!wave.type) {
                spdlog::warn("Config {}: unknown enemy type '{}', skipped",
                             where, type_name);
                lua_pop(L, 1);
                continue;
            }
        }
        overlay_number(L, entry, where, "quota", wave.quota, 0.0);
        overlay_number(L, entry, where, "interval", wave.spawn_interval, 0.0);
        overlay_number(L, entry, where, "max_concurrent", wave.max_concurrent, 1.0);
        waves.push_back(wave);
        lua_pop(L, 1);
    }

    if (waves.empty() && entries > 0) {
        spdlog::warn("Config Waves: no usable entries, keeping {} defaults",
                     cfg.waves.size());
        return;
    }
    cfg.waves = std::move(waves);
}

void read_weapon(lua_State* L, int idx, const std::string& where,
                 sim::WeaponDef& w) {
    std::string payload = read_string_field(L, idx, "payload");
    if (!payload.empty()) {
        if (auto p = sim::payload_from_string(payload)) {
            w.payload = *p;
        } else {
            spdlog::warn("Config {}: unknown payload '{}', keeping {}", where,
                         payload, sim::payload_name(w.payload));
        }
    }
    overlay_number(L, idx, where, "speed", w.speed, 0.0);
    overlay_number(L, idx, where, "damage", w.damage, 0.0);
    overlay_number(L, idx, where, "energy_cost", w.energy_cost, 0.0);
    overlay_number(L, idx, where, "fire_rate", w.fire_rate, 0.001);
    overlay_number(L, idx, where, "lifetime", w.lifetime, 0.001);
    overlay_number(L, idx, where, "pierce_count", w.pierce_count, 0.0);
    overlay_number(L, idx, where, "max_bounces", w.max_bounces, 0.0);
    overlay_number(L, idx, where, "bounce_range", w.bounce_range, 0.0);
    overlay_number(L, idx, where, "damage_decay", w.damage_decay, 0.0, 0.999);
    overlay_number(L, idx, where, "start_radius", w.start_radius, 0.0);
    overlay_number(L, idx, where, "max_radius", w.max_radius, 0.0);
    overlay_number(L, idx, where, "expand_rate", w.expand_rate, 0.0);
    overlay_number(L, idx, where, "pellet_count", w.pellet_count, 1.0);
    overlay_number(L, idx, where, "spread_angle", w.spread_angle, 0.0, 360.0);
    overlay_number(L, idx, where, "stick_duration", w.stick_duration, 0.0);
    overlay_number(L, idx, where, "explosion_radius", w.explosion_radius, 0.0);
    overlay_number(L, idx, where, "explosion_damage", w.explosion_damage, 0.0);
    overlay_number(L, idx, where, "spiral_radius", w.spiral_radius, 0.0);
    overlay_number(L, idx, where, "spiral_speed", w.spiral_speed);
    overlay_number(L, idx, where, "hits_per_target", w.hits_per_target, 0.0);
}

void read_weapons(lua_State* L, int idx, SimConfig& cfg) {
    lua_pushnil(L);
    while (lua_next(L, idx) != 0) {
        if (lua_type(L, -2) != LUA_TSTRING || !lua_istable(L, -1)) {
            spdlog::warn("Config Weapons: entries must be id = {{...}}, skipped");
            lua_pop(L, 1);
            continue;
        }
        std::string id = lua_tostring(L, -2);
        int entry = lua_gettop(L);

        auto* existing = cfg.find_weapon(id);
        if (!existing) {
            sim::WeaponDef def;
            def.id = id;
            cfg.weapons.push_back(def);
            existing = &cfg.weapons.back();
            spdlog::debug("Config Weapons: added '{}'", id);
        }
        read_weapon(L, entry, "Weapons." + id, *existing);
        lua_pop(L, 1);
    }
}

using SectionReader = void (*)(lua_State*, int, SimConfig&);

Result<void> read_section(lua_State* L, const char* name, SectionReader reader,
                          SimConfig& cfg) {
    switch (push_global_table(L, name)) {
    case GlobalKind::Missing:
        return {};
    case GlobalKind::WrongType:
        return Error(std::string(name) + " must be a table");
    case GlobalKind::Table:
        break;
    }
    reader(L, lua_gettop(L), cfg);
    lua_pop(L, 1);
    return {};
}

} // namespace

Result<void> ConfigLoader::apply(LuaState& state, SimConfig& cfg) {
    lua_State* L = state.raw();
    int top = lua_gettop(L);

    // Archetypes before Stages so stage entries default to retuned types.
    static const std::pair<const char*, SectionReader> sections[] = {
        {"Bounds", [](lua_State* Ls, int i, SimConfig& c) { read_bounds(Ls, i, c.bounds); }},
        {"Combat", read_combat},
        {"Phases", [](lua_State* Ls, int i, SimConfig& c) { read_phases(Ls, i, c.phases); }},
        {"Player", [](lua_State* Ls, int i, SimConfig& c) { read_player(Ls, i, c.player); }},
        {"Pools", [](lua_State* Ls, int i, SimConfig& c) { read_pools(Ls, i, c.pools); }},
        {"Archetypes", read_archetypes},
        {"Stages", read_stages},
        {"Waves", read_waves},
        {"Weapons", read_weapons},
    };
    for (const auto& [name, reader] : sections) {
        auto result = read_section(L, name, reader, cfg);
        if (!result.ok()) {
            lua_settop(L, top);
            return result;
        }
    }

    lua_getglobal(L, "Seed");
    if (lua_isnumber(L, -1)) {
        accept_number("Seed", lua_tonumber(L, -1), cfg.seed);
    } else if (!lua_isnil(L, -1)) {
        lua_settop(L, top);
        return Error("Seed must be a number");
    }
    lua_pop(L, 1);

    lua_getglobal(L, "MaxStage");
    if (lua_isnumber(L, -1)) {
        accept_number("MaxStage", lua_tonumber(L, -1), cfg.max_stage, 1.0);
    } else if (!lua_isnil(L, -1)) {
        lua_settop(L, top);
        return Error("MaxStage must be a number");
    }
    lua_pop(L, 1);

    lua_getglobal(L, "EquippedWeapon");
    if (lua_isstring(L, -1)) {
        std::string id = lua_tostring(L, -1);
        if (cfg.find_weapon(id)) {
            cfg.equipped_weapon = id;
        } else {
            spdlog::warn("Config EquippedWeapon: no weapon '{}', keeping '{}'",
                         id, cfg.equipped_weapon);
        }
    }
    lua_pop(L, 1);

    lua_settop(L, top);
    return {};
}

Result<SimConfig> ConfigLoader::load_file(const fs::path& path,
                                          SimConfig base) {
    spdlog::info("Loading config: {}", path.string());

    LuaState state;
    state.register_logging();
    auto exec = state.do_file(path);
    if (!exec.ok()) {
        return Error("Failed to execute config: " + exec.error().message);
    }

    auto applied = apply(state, base);
    if (!applied.ok()) {
        return Error(path.string() + ": " + applied.error().message);
    }
    return base;
}

Result<SimConfig> ConfigLoader::load_string(std::string_view code,
                                            SimConfig base) {
    LuaState state;
    state.register_logging();
    auto exec = state.do_string(code);
    if (!exec.ok()) {
        return Error("Failed to execute config: " + exec.error().message);
    }

    auto applied = apply(state, base);
    if (!applied.ok()) {
        return applied.error();
    }
    return base;
}

} // namespace sky::lua
