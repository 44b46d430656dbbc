/**
 * @file WeaponSystem.cpp
 * @brief WeaponSystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/WeaponSystem.hpp>
#include <dz/game/components/Audio.hpp>
#include <dz/game/components/Collision.hpp>
#include <dz/game/components/Input.hpp>
#include <dz/game/components/Physics.hpp>
#include <dz/game/components/Render.hpp>
#include <dz/game/components/Transform.hpp>
#include <dz/game/components/Weapon.hpp>
#include <dz/ecs/World.hpp>
#include <dz/core/Constants.hpp>
#include <dz/core/Log.hpp>

#include <string>

namespace dz::game {

using ecs::ComponentId;

namespace {

constexpr core::u32 kTracerColor     = 0xffff00;
constexpr core::f32 kProjectileRadius = 0.1f;

} // namespace

WeaponSystem::WeaponSystem(ecs::World& world, audio::IAudioEngine* audio)
    : System(world, "WeaponSystem", ecs::SystemPriority::kNormal,
             ecs::Query::with({ComponentId::Transform, ComponentId::Input}))
    , _audio{audio}
{}

core::Expected<void> WeaponSystem::onUpdate(core::f32 /*dt*/)
{
    const core::TimeMs now = world().timeMs();

    for (auto id : activeEntities())
    {
        const auto* transform = world().getComponent<TransformComponent>(id);
        const auto* input     = world().getComponent<InputComponent>(id);
        auto*       weapon    = world().getComponent<WeaponComponent>(id);
        if (!transform || !input || !weapon)
            continue;

        if (input->state.reload)
            weapon->startReload(now);

        weapon->updateReload(now);

        if (input->state.fire && weapon->canFire(now))
            fire(id, *transform, *weapon, now);
    }
    return {};
}

void WeaponSystem::fire(ecs::EntityId shooter, const TransformComponent& transform,
                        WeaponComponent& weapon, core::TimeMs now)
{
    if (!weapon.fire(now))
        return;

    const auto projectile = world().createEntity("Projectile");
    if (!projectile.isValid())
        return;

    const WeaponStats& stats = weapon.stats();
    const math::Vec3f origin = transform.position + math::Vec3f{0.0f, core::kEyeHeight, 0.0f};
    const math::Vec3f aim    = transform.rotation.rotate(math::Vec3f{0.0f, 0.0f, -1.0f});

    world().emplaceComponent<TransformComponent>(projectile, origin, transform.rotation);
    world().emplaceComponent<RenderComponent>(projectile, render::MeshKind::Sphere, kTracerColor);
    if (auto* physics = world().emplaceComponent<PhysicsComponent>(projectile))
        physics->velocity = aim * stats.projectileSpeed;
    world().emplaceComponent<CollisionComponent>(projectile, kProjectileRadius, true, stats.damage, now, shooter);
    ++_shotsFired;

    const auto* sound = world().getComponent<AudioComponent>(shooter);
    if (!_audio || !sound)
        return;

    const std::string clipId = std::string{weaponName(weapon.type())} + "_fire";
    if (const AudioClip* clip = sound->clip(clipId))
        _audio->play(clip->id, transform.position, sound->volumeAt(*clip, 0.0f));
    else
        core::Log::debug("WeaponSystem", "no clip '" + clipId + "'");
}

} // namespace dz::game
