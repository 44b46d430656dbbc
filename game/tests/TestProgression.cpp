/**
 * @file TestProgression.cpp
 * @brief Levels, prestige, unlocks, achievements and the progression system.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "dz/game/components/Progression.hpp"
#include "dz/game/systems/ProgressionSystem.hpp"
#include "dz/ecs/World.hpp"

namespace dz::game {

using Catch::Matchers::WithinAbs;

TEST_CASE("Experience levels up on the growth curve", "[game][progression]")
{
    ProgressionComponent p;
    REQUIRE(p.level() == 1);
    REQUIRE(p.xpToNextLevel() == 1000);

    REQUIRE_FALSE(p.addXP(999));
    REQUIRE(p.level() == 1);

    REQUIRE(p.addXP(1));
    REQUIRE(p.level() == 2);
    REQUIRE(p.xp() == 0);
    REQUIRE(p.xpToNextLevel() == 1200);
    REQUIRE(p.totalXp() == 1000);
}

TEST_CASE("A large grant resolves every level it reaches", "[game][progression]")
{
    ProgressionComponent p;
    REQUIRE_FALSE(p.unlockable("skin_stealth")->unlocked);

    REQUIRE(p.addXP(1000 + 1200 + 500));
    REQUIRE(p.level() == 3);
    REQUIRE(p.xp() == 500);
    REQUIRE(p.xpToNextLevel() == 1440);
    REQUIRE(p.unlockable("skin_stealth")->unlocked);
    REQUIRE_FALSE(p.unlockable("weapon_sniper")->unlocked);
}

TEST_CASE("Reaching level 100 grants a prestige", "[game][progression]")
{
    ProgressionComponent p;
    while (p.level() < 99)
        p.addXP(p.xpToNextLevel());
    REQUIRE(p.prestige() == 0);

    p.addXP(p.xpToNextLevel());
    REQUIRE(p.prestige() == 1);
    REQUIRE(p.level() == 1);
    REQUIRE(p.xp() == 0);
    REQUIRE(p.xpToNextLevel() == 1000);
    REQUIRE(p.currency() == ProgressionComponent::kPrestigeReward);
}

TEST_CASE("Winning a match completes first_win and pays for a skin", "[game][progression]")
{
    ProgressionComponent p;
    p.addXP(900);

    PlayerStats stats;
    stats.totalGames = 1;
    stats.wins       = 1;
    p.updateStats(stats);

    REQUIRE(p.achievement("first_win")->completed);
    REQUIRE(p.level() == 2);
    REQUIRE(p.xp() == 400);
    REQUIRE(p.currency() == 100);
    REQUIRE(p.stats().totalGames == 1);

    REQUIRE(p.unlockItem("skin_stealth"));
    REQUIRE(p.xp() == 100);
    REQUIRE(p.currency() == 50);
    REQUIRE(p.unlockable("skin_stealth")->unlocked);

    REQUIRE_FALSE(p.unlockItem("skin_stealth"));
    REQUIRE_FALSE(p.unlockItem("weapon_sniper"));
    REQUIRE_FALSE(p.unlockItem("no_such_item"));

    // Completed achievements pay out only once.
    p.updateStats(stats);
    REQUIRE(p.currency() == 50);
}

TEST_CASE("Kill Master rewards the sniper rifle", "[game][progression]")
{
    ProgressionComponent p;

    PlayerStats stats;
    stats.kills = 60;
    p.updateStats(stats);
    REQUIRE(p.achievement("kill_master")->progress == 60);
    REQUIRE_FALSE(p.achievement("kill_master")->completed);

    stats.kills = 140;
    p.updateStats(stats);
    const Achievement* a = p.achievement("kill_master");
    REQUIRE(a->completed);
    REQUIRE(a->progress == 100);
    REQUIRE(p.unlockable("weapon_sniper")->unlocked);
    REQUIRE(p.currency() == 500);
    REQUIRE(p.level() == 2);
    REQUIRE(p.xp() == 1000);
}

TEST_CASE("Equipping replaces the item of the same type", "[game][progression]")
{
    ProgressionComponent p;
    REQUIRE_FALSE(p.equipItem("weapon_sniper"));
    REQUIRE(p.equipItem("weapon_rifle"));
    REQUIRE(p.equippedItems().at(UnlockableType::Weapon) == "weapon_rifle");

    REQUIRE(p.updateAchievement("kill_master", 100));
    REQUIRE(p.equipItem("weapon_sniper"));
    REQUIRE(p.equippedItems().at(UnlockableType::Weapon) == "weapon_sniper");
    REQUIRE(p.unlockable("weapon_sniper")->equipped);
    REQUIRE_FALSE(p.unlockable("weapon_rifle")->equipped);
    REQUIRE(p.equippedItems().size() == 1);
}

TEST_CASE("Summary reports level progress and collection counts", "[game][progression]")
{
    ProgressionComponent p;
    p.addXP(600);

    const ProgressSummary s = p.summary();
    REQUIRE(s.level == 1);
    REQUIRE(s.xp == 600);
    REQUIRE_THAT(s.progress, WithinAbs(60.0, 1e-3));
    REQUIRE(s.unlockedItems == 1);
    REQUIRE(s.totalItems == 5);
    REQUIRE(s.completedAchievements == 0);
    REQUIRE(s.totalAchievements == 4);
}

TEST_CASE("ProgressionSystem tracks play time and forwards to the component", "[game][progression]")
{
    ecs::World world;
    auto& system = world.emplaceSystem<ProgressionSystem>();

    const auto player = world.createEntity("Player");
    world.emplaceComponent<ProgressionComponent>(player);
    const auto bot = world.createEntity("Bot");

    world.update(0.5f);
    world.update(0.5f);
    REQUIRE_THAT(world.getComponent<ProgressionComponent>(player)->stats().playTime, WithinAbs(1.0, 1e-9));

    REQUIRE(system.addXP(player, 1000));
    REQUIRE_FALSE(system.addXP(bot, 1000));
    REQUIRE(system.equipItem(player, "weapon_rifle"));
    REQUIRE_FALSE(system.unlockItem(bot, "skin_stealth"));

    PlayerStats stats;
    stats.headshots = 50;
    REQUIRE(system.updatePlayerStats(player, stats));
    REQUIRE_FALSE(system.updatePlayerStats(bot, stats));

    auto progress = system.playerProgress(player);
    REQUIRE(progress.has_value());
    REQUIRE(progress->level == 3);
    REQUIRE(progress->currency == 300);
    REQUIRE(progress->completedAchievements == 1);

    auto missing = system.playerProgress(bot);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code() == core::ErrorCode::kComponentMissing);
}

} // namespace dz::game
