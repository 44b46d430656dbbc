/**
 * @file BattleRoyaleSystem.hpp
 * @brief Single-match controller: shrinking zone, zone damage, eliminations
 *        and winner detection.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_BATTLEROYALESYSTEM_HPP
    #define DZ_GAME_SYSTEMS_BATTLEROYALESYSTEM_HPP

#include <dz/ecs/System.hpp>
#include <dz/game/components/BattleRoyale.hpp>
#include <dz/core/Constants.hpp>

#include <functional>
#include <string_view>
#include <vector>

namespace dz::game {

enum class MatchEventKind : core::u8
{
    GameStarted = 0,
    PlayersDropped,
    PhaseChanged,
    PlayerEliminated,
    GameEnded
};

[[nodiscard]] constexpr std::string_view matchEventName(MatchEventKind kind) noexcept
{
    switch (kind)
    {
    case MatchEventKind::GameStarted:      return "game-started";
    case MatchEventKind::PlayersDropped:   return "players-dropped";
    case MatchEventKind::PhaseChanged:     return "phase-changed";
    case MatchEventKind::PlayerEliminated: return "player-eliminated";
    case MatchEventKind::GameEnded:        return "game-ended";
    }
    return "unknown";
}

struct MatchEvent
{
    MatchEventKind kind;
    ecs::EntityId  player{};            ///< Eliminated player, or the winner.
    core::u32      placement{0};
    core::u32      playersRemaining{0};
    core::u32      phase{0};
};

struct ZoneInfo
{
    ZonePhase zone;
    ZonePhase safeZone;
    core::u32 phase;
    core::u32 playersAlive;
    core::u32 totalPlayers;
};

/**
 * @class BattleRoyaleSystem
 * @brief Owns the MatchState. Members are the entities carrying a
 *        BattleRoyaleComponent.
 *
 * Nothing happens until startGame(). While the match is active, every
 * update advances the zone phase when its timer runs out, applies zone
 * damage to members outside the zone every @c zoneTickMs, eliminates dead
 * members exactly once and ends the match when at most one is left.
 */
class BattleRoyaleSystem final : public ecs::System
{
public:
    using Listener = std::function<void(const MatchEvent&)>;

    struct Settings
    {
        /// Entry 0 is the initial zone.
        std::vector<ZonePhase> phases{defaultPhases()};
        core::TimeMs           zoneTickMs{core::kZoneTickMs};
        core::f32              dropHeight{core::kDropHeight};
    };

    explicit BattleRoyaleSystem(ecs::World& world);
    BattleRoyaleSystem(ecs::World& world, Settings settings);

    [[nodiscard]] static std::vector<ZonePhase> defaultPhases();

    /**
     * @brief Replaces the zone table before the match starts.
     * @return false once the match is active or finished, or if @p phases
     *         is empty.
     */
    bool setPhases(std::vector<ZonePhase> phases);

    void startGame();
    void dropPlayers();

    void addKill(ecs::EntityId player);
    void addDamage(ecs::EntityId player, core::f32 damage);

    [[nodiscard]] ZoneInfo          zoneInfo() const noexcept;
    [[nodiscard]] const MatchState& match()    const noexcept { return _match; }

    void setListener(Listener listener) { _listener = std::move(listener); }

protected:
    core::Expected<void> onUpdate(core::f32 dt) override;
    void onEntityRemoved(ecs::EntityId id) override;

private:
    void advancePhase(core::TimeMs now);
    void applyZoneDamage(core::TimeMs now);
    void eliminate(ecs::EntityId id, BattleRoyaleComponent& record);
    void endGame(core::TimeMs now);
    [[nodiscard]] bool isAlive(ecs::EntityId id) const noexcept;
    void emit(const MatchEvent& event) const;

    Settings     _settings;
    MatchState   _match;
    core::TimeMs _lastZoneTick{0.0};
    Listener     _listener;
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_BATTLEROYALESYSTEM_HPP
