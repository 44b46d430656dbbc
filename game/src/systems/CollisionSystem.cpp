/**
 * @file CollisionSystem.cpp
 * @brief CollisionSystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/CollisionSystem.hpp>
#include <dz/game/systems/BattleRoyaleSystem.hpp>
#include <dz/game/systems/DestructionSystem.hpp>
#include <dz/game/components/Collision.hpp>
#include <dz/game/components/Destructible.hpp>
#include <dz/game/components/Health.hpp>
#include <dz/game/components/Transform.hpp>
#include <dz/ecs/World.hpp>

namespace dz::game {

using ecs::ComponentId;

CollisionSystem::CollisionSystem(ecs::World& world)
    : System(world, "CollisionSystem", ecs::SystemPriority::kHigh,
             ecs::Query::with({ComponentId::Transform, ComponentId::Collision}))
{}

core::Expected<void> CollisionSystem::onUpdate(core::f32 /*dt*/)
{
    const core::TimeMs now = world().timeMs();
    const auto ids = activeEntities();

    for (core::usize i = 0; i < ids.size(); ++i)
    {
        const auto a = ids[i];
        if (!world().isActive(a))
            continue;

        const auto* transformA = world().getComponent<TransformComponent>(a);
        const auto* collisionA = world().getComponent<CollisionComponent>(a);
        if (!transformA || !collisionA)
            continue;

        if (collisionA->expired(now))
        {
            world().destroyEntity(a);
            continue;
        }

        for (core::usize j = i + 1; j < ids.size(); ++j)
        {
            const auto b = ids[j];
            if (!world().isActive(b))
                continue;

            const auto* transformB = world().getComponent<TransformComponent>(b);
            const auto* collisionB = world().getComponent<CollisionComponent>(b);
            if (!transformB || !collisionB)
                continue;

            if (transformA->position.distance(transformB->position) >= collisionA->radius + collisionB->radius)
                continue;

            // Projectiles pass through their own shooter.
            if (collisionA->isProjectile && !collisionB->isProjectile)
            {
                if (collisionA->owner == b)
                    continue;
                resolveHit(a, b, *collisionA);
                break;
            }
            if (collisionB->isProjectile && !collisionA->isProjectile && collisionB->owner != a)
                resolveHit(b, a, *collisionB);
        }
    }
    return {};
}

void CollisionSystem::resolveHit(ecs::EntityId projectile, ecs::EntityId target, const CollisionComponent& shot)
{
    const core::TimeMs now    = world().timeMs();
    const core::f32    damage = shot.damage;
    const ecs::EntityId owner = shot.owner;

    if (world().hasComponent<DestructibleComponent>(target))
    {
        if (auto* destruction = world().getSystem<DestructionSystem>("DestructionSystem"))
            destruction->triggerDestruction(target, damage);
    }

    if (auto* health = world().getComponent<HealthComponent>(target); health && !health->isDead())
    {
        const core::f32 before = health->current();
        const bool killed = health->takeDamage(damage, now);
        const core::f32 dealt = before - health->current();

        auto* royale = world().getSystem<BattleRoyaleSystem>("BattleRoyaleSystem");
        if (royale && owner.isValid())
        {
            if (dealt > 0.0f)
                royale->addDamage(owner, dealt);
            if (killed)
                royale->addKill(owner);
        }
    }

    world().destroyEntity(projectile);
    ++_hits;
}

} // namespace dz::game
