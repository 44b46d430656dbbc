/**
 * @file TestBattleRoyale.cpp
 * @brief Zone phases, zone damage, eliminations and match end.
 */

#include <catch2/catch_test_macros.hpp>

#include "GameTestHelpers.hpp"
#include "dz/game/components/BattleRoyale.hpp"
#include "dz/game/components/Health.hpp"
#include "dz/game/components/Transform.hpp"
#include "dz/game/systems/BattleRoyaleSystem.hpp"

#include <cmath>
#include <vector>

namespace dz::game {

namespace {

ecs::EntityId spawnContestant(ecs::World& world, math::Vec3f at)
{
    const auto id = world.createEntity("Contestant");
    world.emplaceComponent<TransformComponent>(id, at);
    world.emplaceComponent<HealthComponent>(id);
    world.emplaceComponent<BattleRoyaleComponent>(id);
    return id;
}

BattleRoyaleSystem::Settings singleZone(core::f32 radius, core::f32 damage)
{
    BattleRoyaleSystem::Settings settings;
    settings.phases = {{0, {}, radius, damage, 1.0e9, 0.0, 0.0}};
    return settings;
}

} // namespace

TEST_CASE("Default zone table shrinks over six phases", "[game][royale]")
{
    const auto phases = BattleRoyaleSystem::defaultPhases();
    REQUIRE(phases.size() == 6);
    REQUIRE(phases.front().radius == 1000.0f);
    REQUIRE(phases.front().damagePerTick == 0.0f);
    REQUIRE(phases.back().radius == 100.0f);
    REQUIRE(phases.back().damagePerTick == 10.0f);
    REQUIRE(phases[1].durationMs == 180000.0);
}

TEST_CASE("Players outside the zone bleed out and the last one wins", "[game][royale]")
{
    ecs::World world;
    auto& royale = world.emplaceSystem<BattleRoyaleSystem>(singleZone(10.0f, 50.0f));

    std::vector<MatchEvent> events;
    royale.setListener([&events](const MatchEvent& e) { events.push_back(e); });

    const auto inside  = spawnContestant(world, {3.0f, 0.0f, 0.0f});
    const auto outside = spawnContestant(world, {0.0f, 40.0f, 100.0f});

    royale.startGame();
    REQUIRE(royale.match().phase == MatchPhase::Active);
    REQUIRE(royale.match().totalPlayers == 2);
    REQUIRE(royale.match().playersAlive == 2);

    world.update(0.5f);
    REQUIRE(world.getComponent<HealthComponent>(outside)->current() == 100.0f);

    world.update(0.5f);
    REQUIRE(world.getComponent<HealthComponent>(outside)->current() == 50.0f);
    REQUIRE(world.getComponent<HealthComponent>(inside)->current() == 100.0f);
    REQUIRE(world.getComponent<BattleRoyaleComponent>(outside)->lastZoneDamage == world.timeMs());

    test::advance(world, 1.0f, 0.5f);
    REQUIRE(world.getComponent<HealthComponent>(outside)->isDead());
    REQUIRE(royale.match().playersAlive == 1);
    REQUIRE(royale.match().phase == MatchPhase::Finished);
    REQUIRE(royale.match().winner == inside);
    REQUIRE(world.getComponent<BattleRoyaleComponent>(inside)->placement == 1);
    REQUIRE(world.getComponent<BattleRoyaleComponent>(outside)->placement == 2);
    REQUIRE(world.getComponent<BattleRoyaleComponent>(outside)->eliminated);

    REQUIRE(events.size() == 3);
    REQUIRE(events[0].kind == MatchEventKind::GameStarted);
    REQUIRE(events[1].kind == MatchEventKind::PlayerEliminated);
    REQUIRE(events[1].player == outside);
    REQUIRE(events[2].kind == MatchEventKind::GameEnded);
    REQUIRE(events[2].player == inside);

    const core::f32 aliveFor = world.getComponent<BattleRoyaleComponent>(inside)->timeAlive;
    world.update(0.5f);
    REQUIRE(world.getComponent<BattleRoyaleComponent>(inside)->timeAlive == aliveFor);
}

TEST_CASE("Nothing happens before the match starts", "[game][royale]")
{
    ecs::World world;
    auto& royale = world.emplaceSystem<BattleRoyaleSystem>(singleZone(10.0f, 50.0f));
    const auto outside = spawnContestant(world, {100.0f, 0.0f, 0.0f});

    test::advance(world, 3.0f, 0.5f);
    REQUIRE(royale.match().phase == MatchPhase::Waiting);
    REQUIRE(world.getComponent<HealthComponent>(outside)->current() == 100.0f);
    REQUIRE(world.getComponent<BattleRoyaleComponent>(outside)->timeAlive == 0.0f);
}

TEST_CASE("Zone phases advance on their timer and stay inside the old zone", "[game][royale]")
{
    ecs::World world;
    BattleRoyaleSystem::Settings settings;
    settings.phases = {
        {0, {}, 100.0f, 0.0f, 1000.0, 0.0, 0.0},
        {1, {},  40.0f, 1.0f, 1000.0, 0.0, 0.0},
    };
    auto& royale = world.emplaceSystem<BattleRoyaleSystem>(settings);

    std::vector<MatchEventKind> kinds;
    royale.setListener([&kinds](const MatchEvent& e) { kinds.push_back(e.kind); });

    spawnContestant(world, {});
    spawnContestant(world, {1.0f, 0.0f, 0.0f});
    royale.startGame();

    world.update(0.5f);
    REQUIRE(royale.zoneInfo().phase == 0);

    world.update(0.5f);
    const ZoneInfo info = royale.zoneInfo();
    REQUIRE(info.phase == 1);
    REQUIRE(info.zone.radius == 40.0f);
    REQUIRE(info.zone.endTime == info.zone.startTime + 1000.0);
    REQUIRE(std::hypot(info.safeZone.center.x, info.safeZone.center.z) <= 60.0f + 1e-3f);
    REQUIRE(kinds.back() == MatchEventKind::PhaseChanged);

    test::advance(world, 3.0f, 0.5f);
    REQUIRE(royale.zoneInfo().phase == 1);
}

TEST_CASE("Dropping scatters players at altitude inside the zone", "[game][royale]")
{
    ecs::World world;
    auto& royale = world.emplaceSystem<BattleRoyaleSystem>();

    std::vector<ecs::EntityId> players;
    for (int i = 0; i < 10; ++i)
        players.push_back(spawnContestant(world, {}));

    royale.dropPlayers();
    REQUIRE(royale.match().phase == MatchPhase::Dropping);

    for (auto id : players)
    {
        const auto& p = world.getComponent<TransformComponent>(id)->position;
        REQUIRE(p.y == 100.0f);
        REQUIRE(std::hypot(p.x, p.z) <= 1000.0f + 1e-2f);
    }
}

TEST_CASE("The zone table can be replaced only before the match", "[game][royale]")
{
    ecs::World world;
    auto& royale = world.emplaceSystem<BattleRoyaleSystem>();
    spawnContestant(world, {});

    REQUIRE_FALSE(royale.setPhases({}));
    REQUIRE(royale.setPhases({{0, {}, 60.0f, 0.0f, 20000.0, 0.0, 0.0}}));
    REQUIRE(royale.zoneInfo().zone.radius == 60.0f);

    royale.startGame();
    REQUIRE(royale.zoneInfo().zone.endTime == 20000.0);
    REQUIRE_FALSE(royale.setPhases({{0, {}, 10.0f, 0.0f, 1000.0, 0.0, 0.0}}));
    REQUIRE(royale.zoneInfo().zone.radius == 60.0f);
}

TEST_CASE("Kills and damage are credited to the record", "[game][royale]")
{
    ecs::World world;
    auto& royale = world.emplaceSystem<BattleRoyaleSystem>();
    const auto id = spawnContestant(world, {});

    royale.addKill(id);
    royale.addKill(id);
    royale.addDamage(id, 42.5f);
    royale.addKill(world.createEntity("Spectator"));

    const auto* record = world.getComponent<BattleRoyaleComponent>(id);
    REQUIRE(record->kills == 2);
    REQUIRE(record->damageDealt == 42.5f);
}

TEST_CASE("Destroying a live contestant eliminates it", "[game][royale]")
{
    ecs::World world;
    auto& royale = world.emplaceSystem<BattleRoyaleSystem>();
    const auto a = spawnContestant(world, {});
    const auto b = spawnContestant(world, {});
    const auto c = spawnContestant(world, {});
    royale.startGame();

    world.destroyEntity(c);
    world.update(0.1f);
    REQUIRE(royale.match().playersAlive == 2);
    REQUIRE(royale.match().phase == MatchPhase::Active);

    world.destroyEntity(b);
    world.update(0.1f);
    REQUIRE(royale.match().phase == MatchPhase::Finished);
    REQUIRE(royale.match().winner == a);
}

TEST_CASE("Detaching a contestant's record eliminates it", "[game][royale]")
{
    ecs::World world;
    auto& royale = world.emplaceSystem<BattleRoyaleSystem>();
    const auto a = spawnContestant(world, {});
    const auto b = spawnContestant(world, {});
    const auto c = spawnContestant(world, {});
    royale.startGame();

    REQUIRE(world.removeComponent<BattleRoyaleComponent>(c));
    world.update(0.1f);
    REQUIRE(royale.match().playersAlive == 2);
    REQUIRE_FALSE(royale.hasEntity(c));

    world.destroyEntity(b);
    world.update(0.1f);
    REQUIRE(royale.match().phase == MatchPhase::Finished);
    REQUIRE(royale.match().winner == a);
}

} // namespace dz::game
