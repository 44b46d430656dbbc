/**
 * @file AISystem.cpp
 * @brief AISystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/AISystem.hpp>
#include <dz/game/components/AI.hpp>
#include <dz/game/components/Health.hpp>
#include <dz/game/components/Input.hpp>
#include <dz/game/components/Loot.hpp>
#include <dz/game/components/Transform.hpp>
#include <dz/game/components/Weapon.hpp>
#include <dz/ecs/World.hpp>

#include <cmath>
#include <numbers>
#include <random>
#include <utility>

namespace dz::game {

using ecs::ComponentId;

namespace {

constexpr core::TimeMs kCloseCombatMs  = 5000.0;
constexpr core::TimeMs kEngageCombatMs = 3000.0;
constexpr core::TimeMs kSearchMs       = 10000.0;
constexpr core::TimeMs kPursuitMs      = 8000.0;

constexpr core::f32 kHealthToFight   = 30.0f;
constexpr core::f32 kHealthRecovered = 50.0f;
constexpr core::f32 kAggressionClose = 0.5f;
constexpr core::f32 kAggressionFar   = 0.7f;

[[nodiscard]] math::Vec3f flat(math::Vec3f v) noexcept
{
    v.y = 0.0f;
    return v;
}

/// Yaw of a direction, 0 facing -Z, positive turning towards -X.
[[nodiscard]] core::f32 yawOf(const math::Vec3f& v) noexcept
{
    return std::atan2(-v.x, -v.z);
}

/// Signed yaw that turns the body to face @p direction, in (-pi, pi].
[[nodiscard]] core::f32 yawTowards(const TransformComponent& transform, const math::Vec3f& direction) noexcept
{
    if (flat(direction).isZero())
        return 0.0f;

    const math::Vec3f facing = transform.rotation.rotate(math::Vec3f{0.0f, 0.0f, -1.0f});
    core::f32 delta = yawOf(direction) - yawOf(facing);

    constexpr core::f32 kPi = std::numbers::pi_v<core::f32>;
    while (delta > kPi)   delta -= 2.0f * kPi;
    while (delta <= -kPi) delta += 2.0f * kPi;
    return delta;
}

} // namespace

AISystem::AISystem(ecs::World& world)
    : AISystem(world, Settings{})
{}

AISystem::AISystem(ecs::World& world, Settings settings)
    : System(world, "AISystem", ecs::SystemPriority::kNormal,
             ecs::Query::with({ComponentId::Transform, ComponentId::AI}))
    , _settings{std::move(settings)}
{}

core::Expected<void> AISystem::onUpdate(core::f32 /*dt*/)
{
    const core::TimeMs now = world().timeMs();

    for (auto id : activeEntities())
    {
        auto* transform = world().getComponent<TransformComponent>(id);
        auto* ai        = world().getComponent<AIComponent>(id);
        auto* input     = world().getComponent<InputComponent>(id);
        if (!transform || !ai || !input)
            continue;

        perceive(id, *transform, *ai);

        if (now - ai->lastDecisionTime >= ai->reactionTimeMs)
        {
            decide(*transform, *ai, now);
            ai->lastDecisionTime = now;
        }

        act(*transform, *ai, *input);
    }
    return {};
}

// ========================================================================== //
//  Perception                                                                //
// ========================================================================== //

void AISystem::perceive(ecs::EntityId self, const TransformComponent& transform, AIComponent& ai)
{
    auto& p = ai.perception;

    p.nearestEnemy         = ecs::EntityId{};
    p.nearestEnemyDistance = AIPerception::kFar;

    for (auto other : world().query(_settings.perceptionQuery))
    {
        if (other == self)
            continue;
        const auto* otherTransform = world().getComponent<TransformComponent>(other);
        if (!otherTransform)
            continue;
        if (const auto* health = world().getComponent<HealthComponent>(other); health && health->isDead())
            continue;

        const core::f32 d = transform.position.distance(otherTransform->position);
        if (d < p.nearestEnemyDistance && d < _settings.detectionRange)
        {
            p.nearestEnemy          = other;
            p.nearestEnemyDistance  = d;
            p.nearestEnemyDirection = (otherTransform->position - transform.position).normalize();
        }
    }

    if (p.nearestEnemy.isValid())
    {
        if (const auto* enemy = world().getComponent<TransformComponent>(p.nearestEnemy))
            p.lastKnownEnemyPosition = enemy->position;
    }

    p.nearestLoot         = ecs::EntityId{};
    p.nearestLootDistance = AIPerception::kFar;
    for (auto loot : world().query(ecs::Query::with({ComponentId::Transform, ComponentId::Loot})))
    {
        const auto* lootTransform = world().getComponent<TransformComponent>(loot);
        const core::f32 d = transform.position.distance(lootTransform->position);
        if (d < p.nearestLootDistance)
        {
            p.nearestLoot         = loot;
            p.nearestLootDistance = d;
        }
    }

    if (const auto* health = world().getComponent<HealthComponent>(self))
        p.health = health->current();
    if (const auto* weapon = world().getComponent<WeaponComponent>(self))
        p.ammo = weapon->currentAmmo();
}

// ========================================================================== //
//  Decision                                                                  //
// ========================================================================== //

void AISystem::decide(const TransformComponent& transform, AIComponent& ai, core::TimeMs now)
{
    const auto& p          = ai.perception;
    const bool  seesEnemy  = p.nearestEnemy.isValid();
    const bool  lootNearby = p.nearestLoot.isValid() && p.nearestLootDistance < _settings.lootRange;

    if (seesEnemy && p.nearestEnemyDistance < _settings.closeRange)
    {
        if (p.health > kHealthToFight && ai.aggression > kAggressionClose)
        {
            ai.state         = AIState::Combat;
            ai.combatTimeout = now + kCloseCombatMs;
        }
        else
        {
            ai.state = AIState::Retreat;
        }
    }
    else if (seesEnemy && p.nearestEnemyDistance < _settings.engageRange)
    {
        if (ai.aggression > kAggressionFar)
        {
            ai.state         = AIState::Combat;
            ai.combatTimeout = now + kEngageCombatMs;
        }
        else
        {
            ai.state         = AIState::Search;
            ai.searchTimeout = now + kSearchMs;
        }
    }
    else if (ai.state == AIState::Search && now > ai.searchTimeout)
    {
        ai.state = AIState::Patrol;
    }
    else if (ai.state == AIState::Combat && now > ai.combatTimeout)
    {
        ai.state         = AIState::Search;
        ai.searchTimeout = now + kPursuitMs;
    }
    else if (ai.state == AIState::Retreat && p.health > kHealthRecovered)
    {
        ai.state = AIState::Patrol;
    }
    else if (ai.state == AIState::Patrol && lootNearby)
    {
        ai.state = AIState::Loot;
    }
    else if (ai.state == AIState::Loot && !lootNearby)
    {
        ai.state = AIState::Patrol;
    }

    if (ai.state == AIState::Patrol && ai.patrolPoints.empty())
        buildPatrolRoute(transform, ai);
}

void AISystem::buildPatrolRoute(const TransformComponent& transform, AIComponent& ai) const
{
    const math::Vec3f c = transform.position;
    const core::f32   r = _settings.patrolRadius;

    ai.patrolPoints = {
        c + math::Vec3f{r, 0.0f, 0.0f},
        c + math::Vec3f{0.0f, 0.0f, r},
        c + math::Vec3f{-r, 0.0f, 0.0f},
        c + math::Vec3f{0.0f, 0.0f, -r},
    };
    ai.patrolIndex = 0;
}

// ========================================================================== //
//  Behaviour                                                                 //
// ========================================================================== //

void AISystem::act(const TransformComponent& transform, AIComponent& ai, InputComponent& input)
{
    auto& state = input.state;
    state.clearActions();

    const auto& p = ai.perception;
    std::uniform_real_distribution<core::f32> roll{0.0f, 1.0f};

    switch (ai.state)
    {
    case AIState::Patrol:
    {
        if (ai.patrolPoints.empty())
            break;
        ai.patrolIndex %= ai.patrolPoints.size();
        const math::Vec3f toPoint = flat(ai.patrolPoints[ai.patrolIndex] - transform.position);
        if (toPoint.length() < _settings.waypointTolerance)
            ai.patrolIndex = (ai.patrolIndex + 1) % ai.patrolPoints.size();
        else
            steer(transform, toPoint.normalize(), input);
        break;
    }
    case AIState::Search:
    {
        if (!p.lastKnownEnemyPosition)
            break;
        const math::Vec3f toTarget = flat(*p.lastKnownEnemyPosition - transform.position);
        if (toTarget.length() > _settings.searchArrival)
            steer(transform, toTarget.normalize(), input);
        break;
    }
    case AIState::Combat:
    {
        steer(transform, p.nearestEnemyDirection, input);
        state.aim   = true;
        state.lookX = yawTowards(transform, p.nearestEnemyDirection);
        if (roll(world().random()) < ai.accuracy)
            state.fire = true;
        if (roll(world().random()) < _settings.strafeChance)
        {
            state.left  = !state.left;
            state.right = !state.right;
        }
        break;
    }
    case AIState::Retreat:
    {
        if (!p.lastKnownEnemyPosition)
            break;
        steer(transform, flat(transform.position - *p.lastKnownEnemyPosition).normalize(), input);
        state.sprint = true;
        break;
    }
    case AIState::Loot:
        break;
    }
}

void AISystem::steer(const TransformComponent& transform, const math::Vec3f& direction, InputComponent& input) const
{
    auto& state = input.state;
    const core::f32 t = _settings.axisThreshold;

    // Movement input is expressed in the body frame.
    const math::Vec3f local = transform.rotation.conjugate().rotate(direction);

    if (local.x > t)  state.right    = true;
    if (local.x < -t) state.left     = true;
    if (local.z > t)  state.backward = true;
    if (local.z < -t) state.forward  = true;
}

} // namespace dz::game
