/**
 * @file WorldJson.cpp
 * @brief World to JSON dumper.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/serial/WorldJson.hpp>
#include <dz/core/Log.hpp>

#include <dz/game/components/AI.hpp>
#include <dz/game/components/Audio.hpp>
#include <dz/game/components/BattleRoyale.hpp>
#include <dz/game/components/Camera.hpp>
#include <dz/game/components/Collision.hpp>
#include <dz/game/components/Destructible.hpp>
#include <dz/game/components/Health.hpp>
#include <dz/game/components/Input.hpp>
#include <dz/game/components/Loot.hpp>
#include <dz/game/components/Physics.hpp>
#include <dz/game/components/Progression.hpp>
#include <dz/game/components/Render.hpp>
#include <dz/game/components/Transform.hpp>
#include <dz/game/components/Weapon.hpp>

#include <fstream>
#include <string>

using json = nlohmann::json;

namespace dz::serial {

namespace {

json vec(const math::Vec3f& v)
{
    return json::array({v.x, v.y, v.z});
}

json quat(const math::Quatf& q)
{
    return json::array({q.w, q.x, q.y, q.z});
}

json entityRef(ecs::EntityId id)
{
    return id.isValid() ? json(id.raw()) : json(nullptr);
}

json names(const ecs::Archetype& archetype)
{
    json out = json::array();
    for (auto id : archetype.ids())
        out.push_back(std::string(ecs::componentName(id)));
    return out;
}

json inputToJson(const input::InputState& s)
{
    return {
        {"forward", s.forward}, {"backward", s.backward}, {"left", s.left}, {"right", s.right},
        {"jump", s.jump},       {"fire", s.fire},         {"aim", s.aim},   {"sprint", s.sprint},
        {"crouch", s.crouch},   {"reload", s.reload},
        {"mouse", {s.mouseX, s.mouseY}},
        {"look", {s.lookX, s.lookY}},
    };
}

json aiToJson(const game::AIComponent& ai)
{
    const auto& p = ai.perception;
    json perception = {
        {"nearestEnemy", entityRef(p.nearestEnemy)},
        {"nearestEnemyDistance", p.nearestEnemyDistance},
        {"nearestLoot", entityRef(p.nearestLoot)},
        {"nearestLootDistance", p.nearestLootDistance},
        {"health", p.health},
        {"ammo", p.ammo},
        {"isUnderFire", p.isUnderFire},
        {"lastKnownEnemyPosition", p.lastKnownEnemyPosition ? vec(*p.lastKnownEnemyPosition) : json(nullptr)},
    };
    return {
        {"state", std::string(game::aiStateName(ai.state))},
        {"perception", std::move(perception)},
        {"reactionTimeMs", ai.reactionTimeMs},
        {"accuracy", ai.accuracy},
        {"aggression", ai.aggression},
        {"lastDecisionTime", ai.lastDecisionTime},
        {"patrolPoints", ai.patrolPoints.size()},
        {"patrolIndex", ai.patrolIndex},
    };
}

json progressionToJson(const game::ProgressionComponent& p)
{
    const auto s = p.summary();
    json unlocked = json::array();
    for (const auto& item : p.unlockables())
    {
        if (item.unlocked)
            unlocked.push_back(item.id);
    }
    json completed = json::array();
    for (const auto& a : p.achievements())
    {
        if (a.completed)
            completed.push_back(a.id);
    }
    return {
        {"level", s.level},
        {"xp", s.xp},
        {"xpToNextLevel", s.xpToNextLevel},
        {"prestige", s.prestige},
        {"currency", s.currency},
        {"unlocked", std::move(unlocked)},
        {"achievements", std::move(completed)},
        {"kills", p.stats().kills},
        {"wins", p.stats().wins},
        {"playTime", p.stats().playTime},
    };
}

json performanceToJson(const ecs::PerformanceReport& r)
{
    return {
        {"updateCount", r.updateCount},
        {"lastMs", r.lastMs},
        {"avgMs", r.avgMs},
        {"maxMs", r.maxMs},
        {"minMs", r.minMs},
    };
}

} // namespace

// ========================================================================== //
//  Components                                                                //
// ========================================================================== //

json componentToJson(const ecs::Component& component)
{
    using ecs::ComponentId;

    switch (component.componentId())
    {
    case ComponentId::Transform: {
        const auto& c = static_cast<const game::TransformComponent&>(component);
        return {{"position", vec(c.position)}, {"rotation", quat(c.rotation)}, {"scale", vec(c.scale)}};
    }
    case ComponentId::Physics: {
        const auto& c = static_cast<const game::PhysicsComponent&>(component);
        return {
            {"velocity", vec(c.velocity)},
            {"acceleration", vec(c.acceleration)},
            {"mass", c.mass},
            {"collider", std::string(game::colliderName(c.collider))},
            {"restitution", c.restitution},
            {"friction", c.friction},
            {"continuousCollision", c.continuousCollision},
            {"isStatic", c.isStatic},
        };
    }
    case ComponentId::Input:
        return inputToJson(static_cast<const game::InputComponent&>(component).state);
    case ComponentId::Camera: {
        const auto& c = static_cast<const game::CameraComponent&>(component);
        return {
            {"mode", std::string(game::cameraModeName(c.mode))},
            {"target", entityRef(c.target)},
            {"offset", vec(c.offset)},
            {"fov", c.fov},
            {"near", c.nearPlane},
            {"far", c.farPlane},
        };
    }
    case ComponentId::Render: {
        const auto& c = static_cast<const game::RenderComponent&>(component);
        return {
            {"mesh", std::string(render::meshName(c.mesh))},
            {"color", c.color},
            {"visible", c.visible},
            {"castShadow", c.castShadow},
        };
    }
    case ComponentId::Health: {
        const auto& c = static_cast<const game::HealthComponent&>(component);
        return {{"current", c.current()}, {"max", c.max()}, {"isDead", c.isDead()}};
    }
    case ComponentId::Weapon: {
        const auto& c = static_cast<const game::WeaponComponent&>(component);
        return {
            {"type", std::string(game::weaponName(c.type()))},
            {"currentAmmo", c.currentAmmo()},
            {"reserveAmmo", c.reserveAmmo()},
            {"isReloading", c.isReloading()},
        };
    }
    case ComponentId::Collision: {
        const auto& c = static_cast<const game::CollisionComponent&>(component);
        return {
            {"radius", c.radius},
            {"isProjectile", c.isProjectile},
            {"damage", c.damage},
            {"createdAt", c.createdAt},
            {"owner", entityRef(c.owner)},
        };
    }
    case ComponentId::Destructible: {
        const auto& c = static_cast<const game::DestructibleComponent&>(component);
        return {
            {"health", c.health},
            {"maxHealth", c.maxHealth},
            {"fracturePoints", c.fracturePoints},
            {"debrisCount", c.debrisCount},
            {"destroyed", c.destroyed},
        };
    }
    case ComponentId::AI:
        return aiToJson(static_cast<const game::AIComponent&>(component));
    case ComponentId::BattleRoyale: {
        const auto& c = static_cast<const game::BattleRoyaleComponent&>(component);
        return {
            {"placement", c.placement},
            {"kills", c.kills},
            {"damageDealt", c.damageDealt},
            {"timeAlive", c.timeAlive},
            {"eliminated", c.eliminated},
        };
    }
    case ComponentId::Progression:
        return progressionToJson(static_cast<const game::ProgressionComponent&>(component));
    case ComponentId::Audio: {
        const auto& c = static_cast<const game::AudioComponent&>(component);
        json clips = json::array();
        for (const auto& clip : c.clips())
            clips.push_back(clip.id);
        return {{"masterVolume", c.masterVolume}, {"enabled", c.enabled}, {"clips", std::move(clips)}};
    }
    case ComponentId::Loot: {
        const auto& c = static_cast<const game::LootComponent&>(component);
        return {{"kind", std::string(game::lootName(c.kind))}, {"amount", c.amount}};
    }
    case ComponentId::Count:
        break;
    }
    return json::object();
}

// ========================================================================== //
//  World                                                                     //
// ========================================================================== //

json toJson(const ecs::World& world)
{
    json entities = json::array();
    world.forEachEntity([&](const ecs::Entity& e) {
        json components = json::object();
        world.forEachComponent(e.id, [&](const ecs::Component& c) {
            components[std::string(ecs::componentName(c.componentId()))] = componentToJson(c);
        });

        entities.push_back(json{
            {"id", e.id.raw()},
            {"name", e.name},
            {"active", e.active},
            {"createdAt", e.createdAt},
            {"lastModified", e.lastModified},
            {"components", std::move(components)},
        });
    });

    json systems = json::array();
    for (const auto& system : world.systems())
    {
        const auto& q = system->query();
        systems.push_back(json{
            {"name", system->name()},
            {"priority", std::string(ecs::priorityName(system->priority()))},
            {"active", system->isActive()},
            {"enabled", system->isEnabled()},
            {"query", {{"all", names(q.all)}, {"any", names(q.any)}, {"none", names(q.none)}}},
            {"entityCount", system->entityCount()},
            {"performance", performanceToJson(system->performanceReport())},
        });
    }

    const auto s = world.stats();
    json stats = {
        {"entityCount", s.entityCount},
        {"activeEntityCount", s.activeEntityCount},
        {"componentCount", s.componentCount},
        {"systemCount", s.systemCount},
        {"activeSystemCount", s.activeSystemCount},
        {"frameCount", s.frameCount},
        {"fixedStepCount", s.fixedStepCount},
        {"lastUpdateMs", s.lastUpdateMs},
        {"avgUpdateMs", s.avgUpdateMs},
    };

    return {
        {"time", world.timeMs()},
        {"entities", std::move(entities)},
        {"systems", std::move(systems)},
        {"stats", std::move(stats)},
    };
}

core::Expected<void> dumpWorld(const ecs::World& world, const std::filesystem::path& path, int indent)
{
    std::ofstream out{path};
    if (!out)
        return core::makeError(core::ErrorCode::kIoError, "cannot open " + path.string());

    try
    {
        out << toJson(world).dump(indent) << '\n';
    }
    catch (const json::exception& e)
    {
        return core::makeError(core::ErrorCode::kSerializationFailed, e.what());
    }

    if (!out)
        return core::makeError(core::ErrorCode::kIoError, "write failed for " + path.string());

    core::Log::debug("Serial", "world dumped to " + path.string());
    return {};
}

} // namespace dz::serial
