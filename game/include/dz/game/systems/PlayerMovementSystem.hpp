/**
 * @file PlayerMovementSystem.hpp
 * @brief Turns action state into walking, sprinting, turning and jumping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_PLAYERMOVEMENTSYSTEM_HPP
    #define DZ_GAME_SYSTEMS_PLAYERMOVEMENTSYSTEM_HPP

#include <dz/ecs/System.hpp>

namespace dz::game {

/**
 * @class PlayerMovementSystem
 * @brief Drives players and bots alike: both express intent through their
 *        InputComponent.
 */
class PlayerMovementSystem final : public ecs::System
{
public:
    struct Settings
    {
        core::f32 moveSpeed{5.0f};
        core::f32 sprintSpeed{8.0f};
        core::f32 jumpForce{8.0f};
        core::f32 idleDamping{0.9f};
    };

    explicit PlayerMovementSystem(ecs::World& world);
    PlayerMovementSystem(ecs::World& world, Settings settings);

protected:
    core::Expected<void> onUpdate(core::f32 dt) override;

private:
    Settings _settings;
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_PLAYERMOVEMENTSYSTEM_HPP
