#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "sim/player.hpp"
#include "sim/weapon.hpp"
#include "sim_fixture.hpp"

#include <cmath>

using namespace sky;
using namespace sky::sim;
using Catch::Matchers::WithinAbs;

TEST_CASE("Aim direction looks down -z at rest", "[player]") {
    Vector3 d = Weapon::aim_direction(0.0f, 0.0f);
    CHECK_THAT(d.x, WithinAbs(0.0, 1e-6));
    CHECK_THAT(d.y, WithinAbs(0.0, 1e-6));
    CHECK_THAT(d.z, WithinAbs(-1.0, 1e-6));

    Vector3 up = Weapon::aim_direction(0.0f, 0.5f);
    CHECK(up.y > 0.0f);
    CHECK_THAT(length_sq(up), WithinAbs(1.0, 1e-5));
}

TEST_CASE("Player movement is clamped to the flight box", "[player]") {
    test::SimFixture f;
    PlayerSystem player(f.config);
    f.snap.input.move_x = 1.0f;
    f.snap.input.move_y = -1.0f;

    for (int i = 0; i < 600; i++) player.update(f.snap, test::TICK);

    CHECK(f.snap.player.position.x == f.config.player.move_limit_x);
    CHECK(f.snap.player.position.y == -f.config.player.move_limit_y);
    CHECK(f.snap.player.position.z == 0.0f);
}

TEST_CASE("Boost drains energy and doubles speed", "[player]") {
    test::SimFixture f;
    PlayerSystem player(f.config);
    f.snap.input.move_x = 1.0f;
    f.snap.input.boost = true;

    player.update(f.snap, test::TICK);
    CHECK(f.snap.player.is_boosting);
    CHECK_THAT(f.snap.player.position.x, WithinAbs(80.0 / 60.0, 1e-4));
    CHECK_THAT(f.snap.player.energy, WithinAbs(100.0 - 25.0 / 60.0, 1e-3));

    f.snap.player.energy = 0.0f;
    player.update(f.snap, test::TICK);
    CHECK_FALSE(f.snap.player.is_boosting);
}

TEST_CASE("Look input turns the player and pitch is limited", "[player]") {
    test::SimFixture f;
    PlayerSystem player(f.config);
    f.snap.input.look_x = 100.0f;
    f.snap.input.look_y = -100000.0f;

    player.update(f.snap, test::TICK);
    CHECK_THAT(f.snap.player.yaw, WithinAbs(-0.15, 1e-5));
    CHECK_THAT(f.snap.player.pitch,
               WithinAbs(f.config.player.pitch_limit, 1e-5));
}

TEST_CASE("Shields and energy regenerate", "[player]") {
    test::SimFixture f;
    PlayerSystem player(f.config);
    f.snap.player.shields = 50.0f;
    f.snap.player.energy = 10.0f;

    for (int i = 0; i < 60; i++) player.update(f.snap, test::TICK);
    CHECK_THAT(f.snap.player.shields, WithinAbs(52.0, 1e-3));
    CHECK_THAT(f.snap.player.energy, WithinAbs(25.0, 1e-3));
}

TEST_CASE("Plasma bolt fires twin shots on its cooldown", "[player][weapon]") {
    test::SimFixture f;
    PlayerSystem player(f.config);
    REQUIRE(player.weapon().def().id == "plasma_bolt");
    f.snap.input.fire = true;

    player.update(f.snap, test::TICK);
    REQUIRE(f.snap.projectiles.size() == 2);
    CHECK(f.snap.player.is_firing);
    // Regeneration runs before the weapon; energy was already full.
    CHECK_THAT(f.snap.player.energy, WithinAbs(95.0, 1e-3));
    CHECK_THAT(f.snap.player.weapon_cooldown, WithinAbs(0.5, 1e-6));

    const auto* left = f.snap.projectiles[0];
    const auto* right = f.snap.projectiles[1];
    CHECK_THAT(left->position.x, WithinAbs(-2.2, 1e-5));
    CHECK_THAT(right->position.x, WithinAbs(2.2, 1e-5));
    CHECK_THAT(left->velocity.z, WithinAbs(-150.0, 1e-3));
    CHECK(left->owner == Owner::Player);

    // 0.5 s between volleys.
    for (int i = 0; i < 25; i++) player.update(f.snap, test::TICK);
    CHECK(f.snap.projectiles.size() == 2);
    for (int i = 0; i < 10; i++) player.update(f.snap, test::TICK);
    CHECK(f.snap.projectiles.size() == 4);
}

TEST_CASE("Turbo halves the weapon cooldown", "[player][weapon]") {
    auto cfg = test::quiet_config();
    Weapon gun(cfg, *cfg.find_weapon("plasma_bolt"));
    CHECK_THAT(gun.cooldown_for(false), WithinAbs(0.5, 1e-6));
    CHECK_THAT(gun.cooldown_for(true), WithinAbs(0.25, 1e-6));
}

TEST_CASE("Firing needs enough energy", "[player][weapon]") {
    test::SimFixture f;
    PlayerSystem player(f.config);
    f.snap.player.energy = 4.0f;
    f.snap.input.fire = true;

    player.update(f.snap, test::TICK);
    CHECK(f.snap.projectiles.empty());
}

TEST_CASE("Scatter weapon fans its pellets", "[player][weapon]") {
    auto cfg = test::quiet_config();
    cfg.equipped_weapon = "plasma_scatter";
    test::SimFixture f(cfg);
    PlayerSystem player(f.config);
    f.snap.input.fire = true;

    player.update(f.snap, test::TICK);
    REQUIRE(f.snap.projectiles.size() == 7);

    const auto* first = f.snap.projectiles.front();
    const auto* last = f.snap.projectiles.back();
    const auto* middle = f.snap.projectiles[3];
    CHECK(first->payload == PayloadType::Spread);
    CHECK_THAT(middle->velocity.x, WithinAbs(0.0, 1e-3));
    CHECK(first->velocity.x * last->velocity.x < 0.0f);
    CHECK_THAT(first->lifetime, WithinAbs(0.8, 1e-6));
}
