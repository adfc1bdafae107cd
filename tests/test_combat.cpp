#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "sim/combat.hpp"
#include "sim/pickup.hpp"
#include "sim_fixture.hpp"

using namespace sky;
using namespace sky::sim;
using Catch::Matchers::WithinAbs;

TEST_CASE("Enemy HP is monotonic under damage", "[combat]") {
    test::SimFixture f;
    auto* e = f.enemy_at(EnemyType::Drone, {0, 20, -200});

    f32 last = e->hp;
    for (int i = 0; i < 10; i++) {
        combat::apply_enemy_damage(f.snap, f.config, *e, 7.0f);
        CHECK(e->hp <= last);
        CHECK(e->hp >= 0.0f);
        last = e->hp;
    }
    CHECK(e->hp == 0.0f);
    CHECK(f.snap.kills == 1);

    // Zero and negative damage are not hits.
    auto* other = f.enemy_at(EnemyType::Drone, {0, 20, -250});
    CHECK_FALSE(combat::apply_enemy_damage(f.snap, f.config, *other, 0.0f));
    CHECK_FALSE(combat::apply_enemy_damage(f.snap, f.config, *other, -5.0f));
    CHECK(other->hp == 60.0f);
    CHECK(other->last_hit_time < 0.0);
}

TEST_CASE("HP ratio tracks damage against the spawn HP", "[combat]") {
    test::SimFixture f;
    f.snap.wave.stage = 3;
    auto* e = f.enemy_at(EnemyType::Fighter, {0, 20, -200});
    // Stage scaling raises max_hp along with hp.
    REQUIRE(e->max_hp > 60.0f);
    CHECK(e->hp_ratio() == 1.0f);

    combat::apply_enemy_damage(f.snap, f.config, *e, e->max_hp / 4.0f);
    CHECK_THAT(e->hp_ratio(), WithinAbs(0.75, 1e-6));

    combat::apply_enemy_damage(f.snap, f.config, *e, e->max_hp);
    CHECK(e->hp_ratio() == 0.0f);
}

TEST_CASE("Shields absorb damage before the hull", "[combat]") {
    test::SimFixture f;
    auto& p = f.snap.player;

    combat::apply_player_damage(f.snap, 30.0f);
    CHECK(p.shields == 70.0f);
    CHECK(p.hp == 100.0f);

    // A hit bigger than the remaining shields does not spill over.
    combat::apply_player_damage(f.snap, 90.0f);
    CHECK(p.shields == 0.0f);
    CHECK(p.hp == 100.0f);

    combat::apply_player_damage(f.snap, 25.0f);
    CHECK(p.hp == 75.0f);
}

TEST_CASE("Hull at zero ends the run once", "[combat]") {
    test::SimFixture f;
    auto& p = f.snap.player;
    p.shields = 0.0f;

    combat::apply_player_damage(f.snap, 150.0f);
    CHECK(p.hp == 0.0f);
    CHECK(f.snap.game_over);
    CHECK(f.snap.events.count(EventKind::PlayerDestroyed) == 1);

    combat::apply_player_damage(f.snap, 10.0f);
    CHECK(f.snap.events.count(EventKind::PlayerDestroyed) == 1);
}

TEST_CASE("Pickup drops are gated by stage", "[combat][pickup]") {
    auto cfg = test::quiet_config();
    cfg.drops.min_stage = 2;
    cfg.drops.health_chance = 1.0f;
    cfg.drops.shield_chance = 0.0f;
    cfg.drops.boost_chance = 0.0f;
    test::SimFixture f(cfg);

    SECTION("stage 1 kills never drop") {
        for (int i = 0; i < 20; i++) {
            auto* e = f.enemy_at(EnemyType::Drone, {0, 20, -200});
            combat::apply_enemy_damage(f.snap, f.config, *e, 1000.0f);
        }
        CHECK(f.snap.pickups.empty());
        CHECK(f.snap.events.count(EventKind::PickupAvailable) == 0);
    }

    SECTION("later stages roll the table") {
        f.snap.wave.stage = 2;
        auto* e = f.enemy_at(EnemyType::Drone, {5, 20, -200});
        combat::apply_enemy_damage(f.snap, f.config, *e, 1000.0f);

        REQUIRE(f.snap.pickups.size() == 1);
        CHECK(f.snap.pickups[0]->kind == PickupKind::Health);
        CHECK(f.snap.pickups[0]->value == 20.0f);
        CHECK(f.snap.pickups[0]->position.x == 5.0f);
        CHECK(f.snap.events.count(EventKind::PickupAvailable) == 1);
    }
}

TEST_CASE("One draw partitions the drop table", "[combat][pickup]") {
    auto cfg = test::quiet_config();
    cfg.drops.min_stage = 1;
    test::SimFixture f(cfg);

    size_t spawned = 0;
    for (int i = 0; i < 400; i++) {
        if (combat::roll_drop(f.snap, f.config.drops, 3, {0, 0, -100})) {
            ++spawned;
        }
    }
    // 40% total drop chance.
    CHECK(spawned > 100);
    CHECK(spawned < 220);
    CHECK(f.snap.pickups.size() == spawned);
}

TEST_CASE("Pickups heal on collection and expire otherwise", "[pickup]") {
    test::SimFixture f;
    PickupSystem pickups(f.config);
    auto& player = f.snap.player;
    player.hp = 50.0f;
    player.shields = 95.0f;

    spawn_pickup(f.snap, f.config.drops, PickupKind::Health, {0, 0, -5});
    spawn_pickup(f.snap, f.config.drops, PickupKind::Shield, {0, 5, -5});
    spawn_pickup(f.snap, f.config.drops, PickupKind::WeaponBoost, {0, 0, -10});
    auto* away = spawn_pickup(f.snap, f.config.drops, PickupKind::Health,
                              {0, 0, -400});

    f.advance_clock();
    pickups.update(f.snap, test::TICK);

    CHECK(player.hp == 70.0f);
    CHECK(player.shields == 100.0f);
    CHECK(player.turbo_timer == 30.0f);
    CHECK(f.snap.events.count(EventKind::PickupCollected) == 3);
    REQUIRE(f.snap.pickups.size() == 1);
    CHECK(f.snap.pickups[0] == away);

    // Drift toward the camera; gone after its lifetime.
    for (int i = 0; i < 660; i++) {
        f.advance_clock();
        pickups.update(f.snap, test::TICK);
    }
    CHECK(f.snap.pickups.empty());
    CHECK(f.snap.pickup_pool.active_count() == 0);
    CHECK(player.hp == 70.0f);
}
