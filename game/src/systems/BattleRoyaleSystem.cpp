/**
 * @file BattleRoyaleSystem.cpp
 * @brief BattleRoyaleSystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/BattleRoyaleSystem.hpp>
#include <dz/game/components/Health.hpp>
#include <dz/game/components/Transform.hpp>
#include <dz/ecs/World.hpp>
#include <dz/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <random>
#include <string>
#include <utility>

namespace dz::game {

using ecs::ComponentId;

namespace {

[[nodiscard]] core::f32 horizontalDistance(const math::Vec3f& a, const math::Vec3f& b) noexcept
{
    const core::f32 dx = a.x - b.x;
    const core::f32 dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

} // namespace

BattleRoyaleSystem::BattleRoyaleSystem(ecs::World& world)
    : BattleRoyaleSystem(world, Settings{})
{}

BattleRoyaleSystem::BattleRoyaleSystem(ecs::World& world, Settings settings)
    : System(world, "BattleRoyaleSystem", ecs::SystemPriority::kNormal,
             ecs::Query::with({ComponentId::BattleRoyale}))
    , _settings{std::move(settings)}
{
    if (_settings.phases.empty())
    {
        core::Log::warn("BattleRoyaleSystem", "empty phase table, using defaults");
        _settings.phases = defaultPhases();
    }
    _match.zone     = _settings.phases.front();
    _match.safeZone = _settings.phases.front();
}

std::vector<ZonePhase> BattleRoyaleSystem::defaultPhases()
{
    return {
        {0, {}, 1000.0f,  0.0f, 300000.0, 0.0, 0.0},
        {1, {},  800.0f,  1.0f, 180000.0, 0.0, 0.0},
        {2, {},  600.0f,  2.0f, 150000.0, 0.0, 0.0},
        {3, {},  400.0f,  3.0f, 120000.0, 0.0, 0.0},
        {4, {},  200.0f,  5.0f,  90000.0, 0.0, 0.0},
        {5, {},  100.0f, 10.0f,  60000.0, 0.0, 0.0},
    };
}

// ========================================================================== //
//  Match control                                                             //
// ========================================================================== //

bool BattleRoyaleSystem::setPhases(std::vector<ZonePhase> phases)
{
    if (phases.empty() || _match.phase == MatchPhase::Active || _match.phase == MatchPhase::Finished)
        return false;

    _settings.phases = std::move(phases);
    _match.zone      = _settings.phases.front();
    _match.safeZone  = _settings.phases.front();
    return true;
}

void BattleRoyaleSystem::startGame()
{
    const core::TimeMs now = world().timeMs();

    _match.phase        = MatchPhase::Active;
    _match.startTime    = now;
    _match.endTime      = 0.0;
    _match.currentPhase = 0;
    _match.winner       = ecs::EntityId{};

    _match.zone           = _settings.phases.front();
    _match.zone.startTime = now;
    _match.zone.endTime   = now + _match.zone.durationMs;
    _match.safeZone       = _match.zone;

    core::u32 players = 0;
    for (auto id : entities())
    {
        if (auto* record = world().getComponent<BattleRoyaleComponent>(id))
        {
            record->placement  = 0;
            record->eliminated = false;
            ++players;
        }
    }
    _match.totalPlayers = players;
    _match.playersAlive = players;
    _lastZoneTick       = now;

    core::Log::info("BattleRoyaleSystem", "match started with " + std::to_string(players) + " players");
    emit({MatchEventKind::GameStarted, {}, 0, players, 0});
}

void BattleRoyaleSystem::dropPlayers()
{
    if (_match.phase == MatchPhase::Waiting)
        _match.phase = MatchPhase::Dropping;

    auto& rng = world().random();
    std::uniform_real_distribution<core::f32> unit{0.0f, 1.0f};
    _match.dropZone = _match.zone.center;

    for (auto id : entities())
    {
        auto* transform = world().getComponent<TransformComponent>(id);
        if (!transform)
            continue;

        const core::f32 angle    = unit(rng) * 2.0f * std::numbers::pi_v<core::f32>;
        const core::f32 distance = unit(rng) * _match.zone.radius;
        transform->position = {_match.zone.center.x + std::cos(angle) * distance,
                               _settings.dropHeight,
                               _match.zone.center.z + std::sin(angle) * distance};
    }

    emit({MatchEventKind::PlayersDropped, {}, 0, _match.playersAlive, _match.currentPhase});
}

void BattleRoyaleSystem::addKill(ecs::EntityId player)
{
    if (auto* record = world().getComponent<BattleRoyaleComponent>(player))
        ++record->kills;
}

void BattleRoyaleSystem::addDamage(ecs::EntityId player, core::f32 damage)
{
    if (auto* record = world().getComponent<BattleRoyaleComponent>(player))
        record->damageDealt += damage;
}

ZoneInfo BattleRoyaleSystem::zoneInfo() const noexcept
{
    return ZoneInfo{_match.zone, _match.safeZone, _match.currentPhase, _match.playersAlive, _match.totalPlayers};
}

// ========================================================================== //
//  Update                                                                    //
// ========================================================================== //

core::Expected<void> BattleRoyaleSystem::onUpdate(core::f32 dt)
{
    if (_match.phase != MatchPhase::Active)
        return {};

    const core::TimeMs now = world().timeMs();

    if (now >= _match.zone.endTime && _match.currentPhase + 1 < _settings.phases.size())
        advancePhase(now);

    if (now - _lastZoneTick >= _settings.zoneTickMs)
    {
        applyZoneDamage(now);
        _lastZoneTick = now;
    }

    for (auto id : activeEntities())
    {
        auto* record = world().getComponent<BattleRoyaleComponent>(id);
        if (!record || record->eliminated)
            continue;

        if (isAlive(id))
        {
            record->timeAlive += dt;
            continue;
        }

        eliminate(id, *record);
        if (_match.phase != MatchPhase::Active)
            break;
    }
    return {};
}

void BattleRoyaleSystem::advancePhase(core::TimeMs now)
{
    const ZonePhase previous = _match.zone;
    ++_match.currentPhase;

    ZonePhase next = _settings.phases[_match.currentPhase];

    auto& rng = world().random();
    std::uniform_real_distribution<core::f32> unit{0.0f, 1.0f};
    const core::f32 angle    = unit(rng) * 2.0f * std::numbers::pi_v<core::f32>;
    const core::f32 distance = unit(rng) * std::max(0.0f, previous.radius - next.radius);

    next.center    = {previous.center.x + std::cos(angle) * distance, 0.0f,
                      previous.center.z + std::sin(angle) * distance};
    next.startTime = now;
    next.endTime   = now + next.durationMs;

    _match.zone     = next;
    _match.safeZone = next;

    core::Log::info("BattleRoyaleSystem", "zone phase " + std::to_string(_match.currentPhase)
                                          + " radius " + std::to_string(next.radius));
    emit({MatchEventKind::PhaseChanged, {}, 0, _match.playersAlive, _match.currentPhase});
}

void BattleRoyaleSystem::applyZoneDamage(core::TimeMs now)
{
    for (auto id : activeEntities())
    {
        auto* record    = world().getComponent<BattleRoyaleComponent>(id);
        auto* health    = world().getComponent<HealthComponent>(id);
        auto* transform = world().getComponent<TransformComponent>(id);
        if (!record || !health || !transform || health->isDead() || record->eliminated)
            continue;

        if (horizontalDistance(transform->position, _match.zone.center) <= _match.zone.radius)
            continue;

        health->takeDamage(_match.zone.damagePerTick, now);
        record->lastZoneDamage = now;
    }
}

void BattleRoyaleSystem::eliminate(ecs::EntityId id, BattleRoyaleComponent& record)
{
    record.eliminated = true;
    record.placement  = _match.playersAlive;
    if (_match.playersAlive > 0)
        --_match.playersAlive;

    emit({MatchEventKind::PlayerEliminated, id, record.placement, _match.playersAlive, _match.currentPhase});

    if (_match.playersAlive <= 1)
        endGame(world().timeMs());
}

void BattleRoyaleSystem::endGame(core::TimeMs now)
{
    _match.phase   = MatchPhase::Finished;
    _match.endTime = now;

    for (auto id : entities())
    {
        auto* record = world().getComponent<BattleRoyaleComponent>(id);
        if (record && !record->eliminated && isAlive(id))
        {
            _match.winner     = id;
            record->placement = 1;
            break;
        }
    }

    if (_match.winner.isValid())
        core::Log::info("BattleRoyaleSystem", "match over, winner entity " + std::to_string(_match.winner.raw()));
    else
        core::Log::info("BattleRoyaleSystem", "match over, no survivor");

    emit({MatchEventKind::GameEnded, _match.winner, 1, _match.playersAlive, _match.currentPhase});
}

bool BattleRoyaleSystem::isAlive(ecs::EntityId id) const noexcept
{
    if (!world().isActive(id))
        return false;
    const auto* health = world().getComponent<HealthComponent>(id);
    return !health || !health->isDead();
}

void BattleRoyaleSystem::onEntityRemoved(ecs::EntityId id)
{
    if (_match.phase != MatchPhase::Active)
        return;

    if (auto* record = world().getComponent<BattleRoyaleComponent>(id); record && !record->eliminated)
        eliminate(id, *record);
}

void BattleRoyaleSystem::emit(const MatchEvent& event) const
{
    if (_listener)
        _listener(event);
}

} // namespace dz::game
