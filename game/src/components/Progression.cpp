/**
 * @file Progression.cpp
 * @brief ProgressionComponent implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/components/Progression.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace dz::game {

ProgressionComponent::ProgressionComponent()
{
    _unlockables = {
        {"weapon_rifle",   "Assault Rifle", "High rate of fire assault rifle",
         UnlockableType::Weapon,   Rarity::Common,    1,    0,    0, true,  false},
        {"weapon_sniper",  "Sniper Rifle",  "Long-range precision weapon",
         UnlockableType::Weapon,   Rarity::Rare,      5,  500,  100, false, false},
        {"skin_stealth",   "Stealth Suit",  "Dark tactical outfit",
         UnlockableType::Cosmetic, Rarity::Rare,      3,  300,   50, false, false},
        {"emote_victory",  "Victory Dance", "Celebrate your wins",
         UnlockableType::Emote,    Rarity::Epic,     10, 1000,  200, false, false},
        {"title_champion", "Champion",      "Prove your worth",
         UnlockableType::Title,    Rarity::Legendary, 20, 5000, 1000, false, false},
    };

    _achievements = {
        {"first_win",   "First Victory", "Win your first battle royale",
         0,   1, false,  500, 100, ""},
        {"kill_master", "Kill Master",   "Get 100 kills",
         0, 100, false, 2000, 500, "weapon_sniper"},
        {"survivor",    "Survivor",      "Survive for 10 minutes in a single match",
         0,   1, false, 1000, 200, ""},
        {"headhunter",  "Headhunter",    "Get 50 headshots",
         0,  50, false, 1500, 300, ""},
    };
}

// ========================================================================== //
//  Levels                                                                    //
// ========================================================================== //

bool ProgressionComponent::addXP(core::u64 amount)
{
    _xp      += amount;
    _totalXp += amount;

    bool levelled = false;
    while (_xp >= _xpToNextLevel)
    {
        levelUp();
        levelled = true;
    }
    return levelled;
}

void ProgressionComponent::levelUp()
{
    ++_level;
    _xp           -= _xpToNextLevel;
    _xpToNextLevel = static_cast<core::u64>(
        std::floor(static_cast<core::f64>(kBaseXp) * std::pow(kXpGrowth, static_cast<core::f64>(_level - 1))));

    if (_level >= kPrestigeLevel && _prestige < kMaxPrestige)
        applyPrestige();

    unlockByLevel();
}

void ProgressionComponent::applyPrestige()
{
    ++_prestige;
    _level         = 1;
    _xp            = 0;
    _xpToNextLevel = kBaseXp;
    _currency     += kPrestigeReward;
}

void ProgressionComponent::unlockByLevel()
{
    for (auto& item : _unlockables)
    {
        if (!item.unlocked && _level >= item.levelRequired)
            item.unlocked = true;
    }
}

// ========================================================================== //
//  Items                                                                     //
// ========================================================================== //

bool ProgressionComponent::unlockItem(std::string_view itemId)
{
    Unlockable* item = findUnlockable(itemId);
    if (!item || item->unlocked)
        return false;

    if (_xp < item->xpCost || _currency < item->currencyCost)
        return false;

    _xp          -= item->xpCost;
    _currency    -= item->currencyCost;
    item->unlocked = true;
    return true;
}

bool ProgressionComponent::equipItem(std::string_view itemId)
{
    Unlockable* item = findUnlockable(itemId);
    if (!item || !item->unlocked)
        return false;

    for (auto& other : _unlockables)
    {
        if (other.type == item->type)
            other.equipped = false;
    }

    item->equipped        = true;
    _equipped[item->type] = item->id;
    return true;
}

// ========================================================================== //
//  Achievements & stats                                                      //
// ========================================================================== //

bool ProgressionComponent::updateAchievement(std::string_view achievementId, core::u32 progress)
{
    Achievement* a = findAchievement(achievementId);
    if (!a || a->completed)
        return false;

    a->progress = std::min(progress, a->maxProgress);
    if (a->progress < a->maxProgress)
        return false;

    a->completed = true;
    addXP(a->rewardXp);
    _currency += a->rewardCurrency;

    if (!a->rewardUnlockable.empty())
    {
        if (Unlockable* reward = findUnlockable(a->rewardUnlockable))
            reward->unlocked = true;
    }
    return true;
}

void ProgressionComponent::updateStats(const PlayerStats& stats)
{
    _stats = stats;

    updateAchievement("first_win", _stats.wins);
    updateAchievement("kill_master", _stats.kills);
    updateAchievement("headhunter", _stats.headshots);
}

ProgressSummary ProgressionComponent::summary() const noexcept
{
    const auto unlocked = static_cast<core::usize>(std::count_if(
        _unlockables.begin(), _unlockables.end(), [](const Unlockable& u) { return u.unlocked; }));
    const auto completed = static_cast<core::usize>(std::count_if(
        _achievements.begin(), _achievements.end(), [](const Achievement& a) { return a.completed; }));

    return ProgressSummary{
        _level,
        _xp,
        _xpToNextLevel,
        _xpToNextLevel > 0 ? static_cast<core::f32>(_xp) / static_cast<core::f32>(_xpToNextLevel) * 100.0f : 0.0f,
        _prestige,
        _currency,
        unlocked,
        _unlockables.size(),
        completed,
        _achievements.size(),
    };
}

// ========================================================================== //
//  Lookup                                                                    //
// ========================================================================== //

const Unlockable* ProgressionComponent::unlockable(std::string_view id) const noexcept
{
    auto it = std::find_if(_unlockables.begin(), _unlockables.end(),
                           [id](const Unlockable& u) { return u.id == id; });
    return it != _unlockables.end() ? &*it : nullptr;
}

const Achievement* ProgressionComponent::achievement(std::string_view id) const noexcept
{
    auto it = std::find_if(_achievements.begin(), _achievements.end(),
                           [id](const Achievement& a) { return a.id == id; });
    return it != _achievements.end() ? &*it : nullptr;
}

Unlockable* ProgressionComponent::findUnlockable(std::string_view id) noexcept
{
    return const_cast<Unlockable*>(std::as_const(*this).unlockable(id));
}

Achievement* ProgressionComponent::findAchievement(std::string_view id) noexcept
{
    return const_cast<Achievement*>(std::as_const(*this).achievement(id));
}

} // namespace dz::game
