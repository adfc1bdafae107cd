#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "lua/config_loader.hpp"

#include <string>

using namespace sky;
using namespace sky::sim;
using sky::lua::ConfigLoader;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using Catch::Matchers::WithinAbs;

TEST_CASE("Empty config keeps every default", "[config]") {
    auto result = ConfigLoader::load_string("");
    REQUIRE(result.ok());

    const auto& cfg = result.value();
    auto defaults = SimConfig::defaults();
    CHECK(cfg.seed == defaults.seed);
    CHECK(cfg.max_stage == defaults.max_stage);
    CHECK(cfg.stages.size() == defaults.stages.size());
    CHECK(cfg.waves.size() == defaults.waves.size());
    CHECK(cfg.weapons.size() == defaults.weapons.size());
    CHECK(cfg.equipped_weapon == "plasma_bolt");
    CHECK(cfg.bounds.wall_z == defaults.bounds.wall_z);
}

TEST_CASE("Scalar sections override individual fields", "[config]") {
    auto result = ConfigLoader::load_string(R"(
        Seed = 42
        MaxStage = 5
        Bounds = { wall_z = -50, lateral_cap = 150 }
        Combat = {
            contact_interval = 0.5,
            drops = { health_chance = 0.5, min_stage = 3 },
        }
        Phases = { intro_duration = 1, boss_victory_bonus = 250 }
        Player = { speed = 55, max_hp = 80 }
        Pools = { enemy_initial = 16 }
    )");
    REQUIRE(result.ok());

    const auto& cfg = result.value();
    CHECK(cfg.seed == 42);
    CHECK(cfg.max_stage == 5);
    CHECK(cfg.bounds.wall_z == -50.0f);
    CHECK(cfg.bounds.lateral_cap == 150.0f);
    CHECK(cfg.bounds.floor_y == -10.0f);
    CHECK(cfg.combat.contact_interval == 0.5);
    CHECK(cfg.drops.health_chance == 0.5f);
    CHECK(cfg.drops.min_stage == 3);
    CHECK(cfg.drops.shield_chance == 0.15f);
    CHECK(cfg.phases.intro_duration == 1.0);
    CHECK(cfg.phases.boss_victory_bonus == 250);
    CHECK(cfg.player.speed == 55.0f);
    CHECK(cfg.player.max_hp == 80.0f);
    CHECK(cfg.pools.enemy_initial == 16);
}

TEST_CASE("Stages replace the stage table", "[config]") {
    auto result = ConfigLoader::load_string(R"(
        Stages = {
            { type = "heavy", hp = 500, hp_multiplier = 2 },
            { type = "swarmer", region = { z_near = -100, z_far = -150 } },
        }
    )");
    REQUIRE(result.ok());

    const auto& stages = result.value().stages;
    REQUIRE(stages.size() == 2);
    CHECK(stages[0].type == EnemyType::Heavy);
    CHECK(stages[0].hp == 500.0f);
    CHECK(stages[0].speed == 20.0f);
    CHECK(stages[0].hp_multiplier == 2.0f);
    CHECK(stages[1].type == EnemyType::Swarmer);
    CHECK(stages[1].hp == 30.0f);
    CHECK(stages[1].region.z_near == -100.0f);
    CHECK(stages[1].region.x_spread == 60.0f);
}

TEST_CASE("Unusable stage entries are skipped", "[config]") {
    auto result = ConfigLoader::load_string(R"(
        Stages = { { type = "dragon" }, 12 }
    )");
    REQUIRE(result.ok());
    CHECK(result.value().stages.size() == SimConfig::defaults().stages.size());
}

TEST_CASE("Archetypes are merged by type", "[config]") {
    auto result = ConfigLoader::load_string(R"(
        Archetypes = {
            boss = { hp = 3000, gun = false },
            asteroid = { score = 75, gun = { cooldown = 4, speed = 20, damage = 2, range = 90 } },
            unicorn = { hp = 1 },
        }
    )");
    REQUIRE(result.ok());

    const auto& cfg = result.value();
    CHECK(cfg.tuning(EnemyType::Boss).base_hp == 3000.0f);
    CHECK_FALSE(cfg.tuning(EnemyType::Boss).gun.enabled);
    CHECK(cfg.tuning(EnemyType::Boss).score == 5000);

    const auto& rock = cfg.tuning(EnemyType::Asteroid);
    CHECK(rock.score == 75);
    CHECK(rock.gun.enabled);
    CHECK(rock.gun.range == 90.0f);

    CHECK(cfg.tuning(EnemyType::Drone).base_hp == 60.0f);
    CHECK(cfg.tuning(EnemyType::Drone).gun.enabled);
}

TEST_CASE("Waves replace the wave list", "[config]") {
    auto result = ConfigLoader::load_string(R"(
        Waves = {
            { type = "archetype", quota = 3 },
            { type = "fighter", interval = 0.5 },
            { type = "ghost" },
        }
    )");
    REQUIRE(result.ok());

    const auto& waves = result.value().waves;
    REQUIRE(waves.size() == 2);
    CHECK_FALSE(waves[0].type.has_value());
    CHECK(waves[0].quota == 3);
    REQUIRE(waves[1].type.has_value());
    CHECK(*waves[1].type == EnemyType::Fighter);
    CHECK(waves[1].spawn_interval == 0.5);
    CHECK(waves[1].quota == 8);

    auto none = ConfigLoader::load_string("Waves = {}");
    REQUIRE(none.ok());
    CHECK(none.value().waves.empty());
}

TEST_CASE("Weapons are merged by id and can be equipped", "[config]") {
    auto result = ConfigLoader::load_string(R"(
        Weapons = {
            plasma_bolt = { damage = 20 },
            hailstorm = { payload = "area", damage = 9, start_radius = 1,
                          max_radius = 10, expand_rate = 5 },
        }
        EquippedWeapon = "hailstorm"
    )");
    REQUIRE(result.ok());

    const auto& cfg = result.value();
    const auto* plasma = cfg.find_weapon("plasma_bolt");
    REQUIRE(plasma);
    CHECK(plasma->damage == 20.0f);
    CHECK(plasma->fire_rate == 2.0f);

    const auto* hail = cfg.find_weapon("hailstorm");
    REQUIRE(hail);
    CHECK(hail->payload == PayloadType::Area);
    CHECK(hail->max_radius == 10.0f);
    CHECK(cfg.weapons.size() == SimConfig::defaults().weapons.size() + 1);
    CHECK(cfg.equipped_weapon == "hailstorm");
    CHECK(cfg.equipped().id == "hailstorm");
}

TEST_CASE("Bad values are warned about and ignored", "[config]") {
    auto result = ConfigLoader::load_string(R"(
        Seed = -4
        MaxStage = 0
        EquippedWeapon = "peashooter"
        Combat = { drops = { health_chance = 3 } }
        Player = { max_hp = "lots", pitch_limit = 4 }
        Weapons = { plasma_bolt = { payload = "laser" } }
    )");
    REQUIRE(result.ok());

    const auto& cfg = result.value();
    auto defaults = SimConfig::defaults();
    CHECK(cfg.seed == defaults.seed);
    CHECK(cfg.max_stage == defaults.max_stage);
    CHECK(cfg.equipped_weapon == "plasma_bolt");
    CHECK(cfg.drops.health_chance == defaults.drops.health_chance);
    CHECK(cfg.player.max_hp == defaults.player.max_hp);
    CHECK(cfg.player.pitch_limit == defaults.player.pitch_limit);
    CHECK(cfg.find_weapon("plasma_bolt")->payload == PayloadType::Standard);
}

TEST_CASE("Numbers a field cannot hold are ignored", "[config]") {
    auto result = ConfigLoader::load_string(R"(
        Seed = 4294967296
        MaxStage = 2.5
        Bounds = { wall_z = 0/0, floor_y = 1/0 }
        Pools = { enemy_initial = 1e300 }
        Waves = {
            { type = "drone", quota = 1e10 },
            { type = "drone", quota = 2.5 },
            { type = "drone", quota = 4 },
        }
    )");
    REQUIRE(result.ok());

    const auto& cfg = result.value();
    auto defaults = SimConfig::defaults();
    CHECK(cfg.seed == defaults.seed);
    CHECK(cfg.max_stage == defaults.max_stage);
    CHECK(cfg.bounds.wall_z == defaults.bounds.wall_z);
    CHECK(cfg.bounds.floor_y == defaults.bounds.floor_y);
    CHECK(cfg.pools.enemy_initial == defaults.pools.enemy_initial);
    REQUIRE(cfg.waves.size() == 3);
    CHECK(cfg.waves[0].quota == 8);
    CHECK(cfg.waves[1].quota == 8);
    CHECK(cfg.waves[2].quota == 4);
}

TEST_CASE("Wrongly typed sections are errors", "[config]") {
    auto bounds = ConfigLoader::load_string("Bounds = 5");
    REQUIRE_FALSE(bounds.ok());
    CHECK_THAT(bounds.error().message, ContainsSubstring("Bounds must be a table"));

    auto seed = ConfigLoader::load_string("Seed = 'abc'");
    REQUIRE_FALSE(seed.ok());
    CHECK_THAT(seed.error().message, ContainsSubstring("Seed must be a number"));

    auto max_stage = ConfigLoader::load_string("MaxStage = {}");
    REQUIRE_FALSE(max_stage.ok());
}

TEST_CASE("Script errors are reported", "[config]") {
    auto syntax = ConfigLoader::load_string("Bounds = {");
    REQUIRE_FALSE(syntax.ok());
    CHECK_THAT(syntax.error().message, StartsWith("Failed to execute config"));

    auto runtime = ConfigLoader::load_string("error('no config for you')");
    REQUIRE_FALSE(runtime.ok());
    CHECK_THAT(runtime.error().message, ContainsSubstring("no config for you"));
}

TEST_CASE("Config overlays a caller-supplied base", "[config]") {
    auto base = SimConfig::defaults();
    base.seed = 7;
    base.waves.clear();

    auto result = ConfigLoader::load_string("MaxStage = 3", base);
    REQUIRE(result.ok());
    CHECK(result.value().seed == 7);
    CHECK(result.value().max_stage == 3);
    CHECK(result.value().waves.empty());
}

TEST_CASE("Shipped config file loads", "[config]") {
    auto result = ConfigLoader::load_file(std::string(SKY_SOURCE_DIR) +
                                          "/config/sim_config.lua");
    REQUIRE(result.ok());

    const auto& cfg = result.value();
    CHECK(cfg.seed == 1337);
    CHECK(cfg.stages.size() == 9);
    CHECK(cfg.waves.size() == 3);
    CHECK_FALSE(cfg.tuning(EnemyType::Asteroid).gun.enabled);
    CHECK(cfg.find_weapon("ballistic_railgun")->pierce_count == 999);
    CHECK_THAT(cfg.stages[8].hp_multiplier, WithinAbs(2.2, 1e-5));
}

TEST_CASE("Missing config file is an error", "[config]") {
    auto result = ConfigLoader::load_file("/nonexistent/skyward.lua");
    REQUIRE_FALSE(result.ok());
    CHECK_THAT(result.error().message, ContainsSubstring("Failed to open file"));
}
