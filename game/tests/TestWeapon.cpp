/**
 * @file TestWeapon.cpp
 * @brief Fire-rate gating, reload and projectile spawning.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "GameTestHelpers.hpp"
#include "dz/game/components/Audio.hpp"
#include "dz/game/components/Collision.hpp"
#include "dz/game/components/Input.hpp"
#include "dz/game/components/Physics.hpp"
#include "dz/game/components/Render.hpp"
#include "dz/game/components/Transform.hpp"
#include "dz/game/components/Weapon.hpp"
#include "dz/game/systems/WeaponSystem.hpp"

namespace dz::game {

using Catch::Matchers::WithinAbs;

TEST_CASE("Pistol fire rate is two rounds per second", "[game][weapon]")
{
    WeaponComponent pistol{WeaponType::Pistol};
    REQUIRE(pistol.stats().fireRate == 2.0f);
    REQUIRE(pistol.currentAmmo() == 12);
    REQUIRE(pistol.reserveAmmo() == 36);

    REQUIRE(pistol.fire(1000.0));
    REQUIRE(pistol.currentAmmo() == 11);

    REQUIRE_FALSE(pistol.fire(1499.0));
    REQUIRE(pistol.currentAmmo() == 11);

    REQUIRE(pistol.fire(1500.0));
    REQUIRE(pistol.currentAmmo() == 10);
}

TEST_CASE("Emptying the magazine starts a timed reload", "[game][weapon]")
{
    WeaponComponent pistol{WeaponType::Pistol};

    core::TimeMs now = 0.0;
    for (int i = 0; i < 12; ++i, now += 500.0)
        REQUIRE(pistol.fire(now));

    const core::TimeMs lastShot = now - 500.0;
    REQUIRE(pistol.currentAmmo() == 0);
    REQUIRE(pistol.isReloading());
    REQUIRE_FALSE(pistol.canFire(lastShot + 10000.0));

    pistol.updateReload(lastShot + 1499.0);
    REQUIRE(pistol.isReloading());
    REQUIRE(pistol.currentAmmo() == 0);

    pistol.updateReload(lastShot + 1500.0);
    REQUIRE_FALSE(pistol.isReloading());
    REQUIRE(pistol.currentAmmo() == 12);
    REQUIRE(pistol.reserveAmmo() == 24);
}

TEST_CASE("Reload is bounded by the reserve and ignored when full", "[game][weapon]")
{
    WeaponComponent rifle{WeaponType::Rifle};

    rifle.startReload(0.0);
    REQUIRE_FALSE(rifle.isReloading());

    rifle.setReserveAmmo(5);
    core::TimeMs now = 0.0;
    while (rifle.currentAmmo() > 0)
    {
        REQUIRE(rifle.fire(now));
        now += 125.0;
    }
    REQUIRE(rifle.isReloading());

    rifle.updateReload(now + 2000.0);
    REQUIRE(rifle.currentAmmo() == 5);
    REQUIRE(rifle.reserveAmmo() == 0);
}

TEST_CASE("Weapon archetypes carry their stats", "[game][weapon]")
{
    REQUIRE(weaponStats(WeaponType::Sniper).damage == 100.0f);
    REQUIRE(weaponStats(WeaponType::Shotgun).magazineSize == 8);
    REQUIRE(weaponStats(WeaponType::Lmg).magazineSize == 100);
    REQUIRE(weaponStats(WeaponType::Smg).fireRate == 12.0f);
    REQUIRE(weaponName(WeaponType::Rifle) == "rifle");
}

TEST_CASE("WeaponSystem spawns a projectile and plays the fire clip", "[game][weapon]")
{
    ecs::World world;
    test::RecordingAudio audio;
    auto& weapons = world.emplaceSystem<WeaponSystem>(&audio);

    const auto shooter = world.createEntity("Shooter");
    world.emplaceComponent<TransformComponent>(shooter, math::Vec3f{2.0f, 0.0f, 3.0f});
    world.emplaceComponent<InputComponent>(shooter)->state.fire = true;
    world.emplaceComponent<WeaponComponent>(shooter, WeaponType::Pistol);
    world.emplaceComponent<AudioComponent>(shooter);

    world.update(0.1f);
    REQUIRE(weapons.shotsFired() == 1);

    const auto projectiles = world.query(ecs::Query::with({ecs::ComponentId::Collision}));
    REQUIRE(projectiles.size() == 1);
    const auto bullet = projectiles.front();

    REQUIRE(world.getEntity(bullet)->name == "Projectile");
    const auto& origin = world.getComponent<TransformComponent>(bullet)->position;
    REQUIRE(origin == math::Vec3f{2.0f, 1.5f, 3.0f});
    REQUIRE_THAT(world.getComponent<PhysicsComponent>(bullet)->velocity.z, WithinAbs(-300.0, 1e-3));
    REQUIRE(world.getComponent<RenderComponent>(bullet)->mesh == render::MeshKind::Sphere);

    const auto* shot = world.getComponent<CollisionComponent>(bullet);
    REQUIRE(shot->isProjectile);
    REQUIRE(shot->damage == 25.0f);
    REQUIRE(shot->owner == shooter);

    REQUIRE(audio.plays.size() == 1);
    REQUIRE(audio.plays.front().clip == "pistol_fire");
    REQUIRE_THAT(audio.plays.front().volume, WithinAbs(0.8, 1e-5));

    // Fire interval has not elapsed yet.
    world.update(0.1f);
    REQUIRE(weapons.shotsFired() == 1);
    REQUIRE(world.getComponent<WeaponComponent>(shooter)->currentAmmo() == 11);
}

TEST_CASE("WeaponSystem reloads on request without audio", "[game][weapon]")
{
    ecs::World world;
    world.emplaceSystem<WeaponSystem>(nullptr);

    const auto shooter = world.createEntity("Shooter");
    world.emplaceComponent<TransformComponent>(shooter);
    auto* input  = world.emplaceComponent<InputComponent>(shooter);
    auto* weapon = world.emplaceComponent<WeaponComponent>(shooter, WeaponType::Pistol);

    input->state.fire = true;
    world.update(0.1f);
    input->state.fire   = false;
    input->state.reload = true;
    world.update(0.1f);
    REQUIRE(weapon->isReloading());

    input->state.reload = false;
    test::advance(world, 1.6f, 0.1f);
    REQUIRE_FALSE(weapon->isReloading());
    REQUIRE(weapon->currentAmmo() == 12);
    REQUIRE(weapon->reserveAmmo() == 35);
}

} // namespace dz::game
