/**
 * @file Progression.hpp
 * @brief Long-term player progression: levels, prestige, currency,
 *        unlockable items, achievements and lifetime statistics.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_PROGRESSION_HPP
    #define DZ_GAME_COMPONENTS_PROGRESSION_HPP

#include <dz/ecs/Component.hpp>
#include <dz/core/Types.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dz::game {

enum class UnlockableType : core::u8
{
    Weapon = 0,
    Cosmetic,
    Emote,
    Title,
    Banner
};

enum class Rarity : core::u8
{
    Common = 0,
    Rare,
    Epic,
    Legendary
};

[[nodiscard]] constexpr std::string_view unlockableTypeName(UnlockableType type) noexcept
{
    switch (type)
    {
    case UnlockableType::Weapon:   return "weapon";
    case UnlockableType::Cosmetic: return "cosmetic";
    case UnlockableType::Emote:    return "emote";
    case UnlockableType::Title:    return "title";
    case UnlockableType::Banner:   return "banner";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view rarityName(Rarity rarity) noexcept
{
    switch (rarity)
    {
    case Rarity::Common:    return "common";
    case Rarity::Rare:      return "rare";
    case Rarity::Epic:      return "epic";
    case Rarity::Legendary: return "legendary";
    }
    return "unknown";
}

struct Unlockable
{
    std::string    id;
    std::string    name;
    std::string    description;
    UnlockableType type{UnlockableType::Weapon};
    Rarity         rarity{Rarity::Common};
    core::u32      levelRequired{1};
    core::u32      xpCost{0};
    core::u32      currencyCost{0};
    bool           unlocked{false};
    bool           equipped{false};
};

struct Achievement
{
    std::string id;
    std::string name;
    std::string description;
    core::u32   progress{0};
    core::u32   maxProgress{1};
    bool        completed{false};
    core::u32   rewardXp{0};
    core::u32   rewardCurrency{0};
    std::string rewardUnlockable;   ///< Empty when the reward unlocks nothing.
};

struct PlayerStats
{
    core::u32   totalGames{0};
    core::u32   wins{0};
    core::u32   top3{0};
    core::u32   top10{0};
    core::u32   kills{0};
    core::u32   deaths{0};
    core::f32   damageDealt{0.0f};
    core::f32   damageTaken{0.0f};
    core::u32   headshots{0};
    core::f32   longestKill{0.0f};
    core::f32   averagePlacement{0.0f};
    core::f64   playTime{0.0};          ///< Seconds.
    std::string favoriteWeapon{"pistol"};
    core::u32   bestKillStreak{0};
};

struct ProgressSummary
{
    core::u32 level;
    core::u64 xp;
    core::u64 xpToNextLevel;
    core::f32 progress;                 ///< Percent of the current level.
    core::u32 prestige;
    core::u32 currency;
    core::usize unlockedItems;
    core::usize totalItems;
    core::usize completedAchievements;
    core::usize totalAchievements;
};

class ProgressionComponent final : public ecs::ComponentBase<ecs::ComponentId::Progression>
{
public:
    static constexpr core::u32 kBaseXp         = 1000;
    static constexpr core::f64 kXpGrowth       = 1.2;
    static constexpr core::u32 kPrestigeLevel  = 100;
    static constexpr core::u32 kMaxPrestige    = 10;
    static constexpr core::u32 kPrestigeReward = 1000;

    ProgressionComponent();

    /**
     * @brief Adds experience and resolves every level reached.
     * @return true if at least one level was gained.
     */
    bool addXP(core::u64 amount);

    /** @brief Buys a locked item with xp and currency. */
    bool unlockItem(std::string_view itemId);

    /** @brief Equips an unlocked item, replacing the one of the same type. */
    bool equipItem(std::string_view itemId);

    /**
     * @brief Sets the progress of an achievement, granting its reward on
     *        completion.
     * @return true on the call that completes it.
     */
    bool updateAchievement(std::string_view achievementId, core::u32 progress);

    /** @brief Replaces the lifetime stats and feeds the stat-driven achievements. */
    void updateStats(const PlayerStats& stats);

    [[nodiscard]] ProgressSummary summary() const noexcept;

    [[nodiscard]] const Unlockable*  unlockable(std::string_view id) const noexcept;
    [[nodiscard]] const Achievement* achievement(std::string_view id) const noexcept;

    [[nodiscard]] core::u32 level()         const noexcept { return _level; }
    [[nodiscard]] core::u64 xp()            const noexcept { return _xp; }
    [[nodiscard]] core::u64 xpToNextLevel() const noexcept { return _xpToNextLevel; }
    [[nodiscard]] core::u64 totalXp()       const noexcept { return _totalXp; }
    [[nodiscard]] core::u32 prestige()      const noexcept { return _prestige; }
    [[nodiscard]] core::u32 currency()      const noexcept { return _currency; }

    [[nodiscard]] const std::vector<Unlockable>&  unlockables()  const noexcept { return _unlockables; }
    [[nodiscard]] const std::vector<Achievement>& achievements() const noexcept { return _achievements; }
    [[nodiscard]] const PlayerStats&              stats()        const noexcept { return _stats; }
    [[nodiscard]] PlayerStats&                    stats()              noexcept { return _stats; }

    [[nodiscard]] const std::map<UnlockableType, std::string>& equippedItems() const noexcept { return _equipped; }

private:
    void levelUp();
    void applyPrestige();
    void unlockByLevel();

    Unlockable*  findUnlockable(std::string_view id) noexcept;
    Achievement* findAchievement(std::string_view id) noexcept;

    core::u32 _level{1};
    core::u64 _xp{0};
    core::u64 _xpToNextLevel{kBaseXp};
    core::u64 _totalXp{0};
    core::u32 _prestige{0};
    core::u32 _currency{0};

    std::vector<Unlockable>               _unlockables;
    std::vector<Achievement>              _achievements;
    PlayerStats                           _stats;
    std::map<UnlockableType, std::string> _equipped;
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_PROGRESSION_HPP
