/**
 * @file HealthSystem.hpp
 * @brief Death handling: players are reported, everything else is cleaned up.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_HEALTHSYSTEM_HPP
    #define DZ_GAME_SYSTEMS_HEALTHSYSTEM_HPP

#include <dz/ecs/System.hpp>
#include <dz/core/Constants.hpp>

#include <string>
#include <unordered_set>

namespace dz::game {

/**
 * @class HealthSystem
 * @brief Dead entities named @c playerName are logged once and kept so the
 *        host can respawn them. Any other dead entity is destroyed once
 *        @c corpseLingerMs has passed since its death.
 */
class HealthSystem final : public ecs::System
{
public:
    struct Settings
    {
        std::string  playerName{"Player"};
        core::TimeMs corpseLingerMs{core::kCorpseLingerMs};
    };

    explicit HealthSystem(ecs::World& world);
    HealthSystem(ecs::World& world, Settings settings);

protected:
    core::Expected<void> onUpdate(core::f32 dt) override;
    void onEntityRemoved(ecs::EntityId id) override;

private:
    Settings                          _settings;
    std::unordered_set<ecs::EntityId> _reported;
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_HEALTHSYSTEM_HPP
