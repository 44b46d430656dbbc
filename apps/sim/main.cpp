/**
 * @file main.cpp
 * @brief Dropzone headless match simulator.
 *
 * Usage: dropzone_sim [--bots N] [--seconds S] [--seed N] [--debug]
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/engine/Engine.hpp>
#include <dz/engine/Config.hpp>
#include <dz/core/Log.hpp>
#include <dz/core/Types.hpp>

#include <dz/game/Prefabs.hpp>
#include <dz/game/components/BattleRoyale.hpp>
#include <dz/game/components/Progression.hpp>
#include <dz/game/systems/BattleRoyaleSystem.hpp>
#include <dz/game/systems/DestructionSystem.hpp>
#include <dz/game/systems/ProgressionSystem.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <numbers>
#include <random>
#include <string>
#include <string_view>
#include <vector>

using namespace dz;

namespace {

constexpr core::f64 kHostStep    = 1.0 / 60.0;
constexpr core::f32 kArenaRadius = 60.0f;

struct Options
{
    core::u32 bots{16};
    core::f64 seconds{180.0};
    core::u32 seed{0x5eed};
    bool      debug{false};
};

struct Standing
{
    std::string name;
    core::u32   placement;
    core::u32   kills;
    core::u32   level;
};

template <typename T>
bool parseNumber(std::string_view text, T& out)
{
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc{} && ptr == end;
}

bool parseOptions(int argc, char* argv[], Options& options)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg == "--debug")
        {
            options.debug = true;
            continue;
        }

        if (i + 1 >= argc)
        {
            core::Log::error("Sim", "missing value after " + std::string(arg));
            return false;
        }
        const std::string_view value{argv[++i]};

        bool ok = false;
        if (arg == "--bots")
            ok = parseNumber(value, options.bots) && options.bots >= 2;
        else if (arg == "--seconds")
            ok = parseNumber(value, options.seconds) && options.seconds > 0.0;
        else if (arg == "--seed")
            ok = parseNumber(value, options.seed);
        else
        {
            core::Log::error("Sim", "unknown option " + std::string(arg));
            return false;
        }

        if (!ok)
        {
            core::Log::error("Sim", "invalid value '" + std::string(value) + "' for " + std::string(arg));
            return false;
        }
    }
    return true;
}

/// Zone table scaled down to the arena so a match ends within a few minutes.
std::vector<game::ZonePhase> arenaPhases()
{
    return {
        {0, {}, kArenaRadius,         0.0f, 30000.0, 0.0, 0.0},
        {1, {}, kArenaRadius * 0.6f,  2.0f, 30000.0, 0.0, 0.0},
        {2, {}, kArenaRadius * 0.3f,  5.0f, 30000.0, 0.0, 0.0},
        {3, {}, kArenaRadius * 0.1f, 10.0f, 60000.0, 0.0, 0.0},
    };
}

void spawnArena(ecs::World& world, game::DestructionSystem& destruction, core::u32 bots)
{
    auto& rng = world.random();
    std::uniform_int_distribution<int> weapon{0, static_cast<int>(game::WeaponType::Lmg)};
    std::uniform_real_distribution<core::f32> unit{0.0f, 1.0f};

    for (core::u32 i = 0; i < bots; ++i)
    {
        const auto id = game::prefab::spawnBot(world, "Bot_" + std::to_string(i + 1), {},
                                               static_cast<game::WeaponType>(weapon(rng)));
        if (!id.isValid())
        {
            core::Log::warn("Sim", "world full after " + std::to_string(i) + " bots");
            break;
        }
        world.emplaceComponent<game::ProgressionComponent>(id);
    }

    for (int i = 0; i < 6; ++i)
    {
        const core::f32 angle = static_cast<core::f32>(i) * std::numbers::pi_v<core::f32> / 3.0f;
        const math::Vec3f start{std::cos(angle) * 20.0f, 0.0f, std::sin(angle) * 20.0f};
        const math::Vec3f end{std::cos(angle) * 30.0f, 0.0f, std::sin(angle) * 30.0f};
        destruction.createDestructibleWall(start, end);
    }
    destruction.createDestructibleBuilding({0.0f, 0.0f, 0.0f}, {8.0f, 9.0f, 8.0f});

    for (int i = 0; i < 12; ++i)
    {
        const math::Vec3f at{(unit(rng) - 0.5f) * kArenaRadius, 0.0f, (unit(rng) - 0.5f) * kArenaRadius};
        if (i % 3 == 0)
            destruction.createDestructibleObject(at, {1.0f, 1.0f, 1.0f});
        else
            game::prefab::spawnLoot(world, at, i % 3 == 1 ? game::LootKind::Ammo : game::LootKind::Health, 30);
    }
}

/// Converts a finished match record into experience and lifetime stats.
void settle(ecs::World& world, game::ProgressionSystem& progression, ecs::EntityId id,
            std::vector<Standing>& standings)
{
    const auto* record = world.getComponent<game::BattleRoyaleComponent>(id);
    auto* profile      = world.getComponent<game::ProgressionComponent>(id);
    if (!record || !profile)
        return;

    const core::u64 xp = 100ull * record->kills + static_cast<core::u64>(record->timeAlive) +
                         (record->placement == 1 ? 1000ull : 0ull);
    progression.addXP(id, xp);

    game::PlayerStats stats = profile->stats();
    ++stats.totalGames;
    stats.kills       += record->kills;
    stats.damageDealt += record->damageDealt;
    if (record->placement == 1)
        ++stats.wins;
    else
        ++stats.deaths;
    if (record->placement <= 3)
        ++stats.top3;
    if (record->placement <= 10)
        ++stats.top10;
    progression.updatePlayerStats(id, stats);

    const auto* entity = world.getEntity(id);
    standings.push_back({entity ? entity->name : "?", record->placement, record->kills, profile->level()});
}

} // namespace

int main(int argc, char* argv[])
{
    core::Log::info("Sim", "=== Dropzone headless match ===");

    Options options;
    if (!parseOptions(argc, argv, options))
    {
        core::Log::info("Sim", "usage: dropzone_sim [--bots N>=2] [--seconds S] [--seed N] [--debug]");
        return 2;
    }

    auto config = engine::Config::Builder{}
        .headless(true)
        .randomSeed(options.seed)
        .totalPlayers(options.bots)
        .enableDebug(options.debug)
        .build();

    engine::Engine engine{config};

    auto result = engine.init();
    if (!result)
    {
        core::Log::fatal("Sim", "engine init failed: " + result.error().message());
        return 1;
    }

    auto& world       = engine.world();
    auto* royale      = engine.getSystem<game::BattleRoyaleSystem>("BattleRoyaleSystem");
    auto* destruction = engine.getSystem<game::DestructionSystem>("DestructionSystem");
    auto* progression = engine.getSystem<game::ProgressionSystem>("ProgressionSystem");
    if (!royale || !destruction || !progression)
    {
        core::Log::fatal("Sim", "default systems missing");
        return 1;
    }

    if (!royale->setPhases(arenaPhases()))
        core::Log::warn("Sim", "keeping the default zone table");
    spawnArena(world, *destruction, config.totalPlayers());

    std::vector<Standing> standings;
    royale->setListener([&](const game::MatchEvent& event) {
        switch (event.kind)
        {
        case game::MatchEventKind::PlayerEliminated:
        case game::MatchEventKind::GameEnded:
            if (event.player.isValid())
                settle(world, *progression, event.player, standings);
            break;
        case game::MatchEventKind::PhaseChanged:
            core::Log::info("Sim", "zone closing, " + std::to_string(event.playersRemaining) + " players left");
            break;
        default:
            break;
        }
    });

    royale->dropPlayers();
    royale->startGame();

    const auto frames = static_cast<core::u64>(std::ceil(options.seconds / kHostStep));
    for (core::u64 i = 0; i <= frames; ++i)
    {
        engine.frame(static_cast<core::f64>(i) * kHostStep);
        if (royale->match().phase == game::MatchPhase::Finished)
            break;
    }

    const auto& match = royale->match();
    if (match.phase != game::MatchPhase::Finished)
        core::Log::info("Sim", "time limit reached with " + std::to_string(match.playersAlive) + " players alive");

    std::sort(standings.begin(), standings.end(),
              [](const Standing& a, const Standing& b) { return a.placement < b.placement; });
    for (const auto& s : standings)
    {
        core::Log::info("Sim", "#" + std::to_string(s.placement) + " " + s.name + "  kills " +
                               std::to_string(s.kills) + "  level " + std::to_string(s.level));
    }

    const auto& stats = engine.stats();
    core::Log::info("Sim", std::to_string(stats.frameCount) + " frames, " +
                           std::to_string(world.timeMs() / 1000.0) + " s simulated, avg update " +
                           std::to_string(stats.world.avgUpdateMs) + " ms");

    engine.shutdown();
    return 0;
}
