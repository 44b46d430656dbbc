/**
 * @file InputSystem.hpp
 * @brief Copies the host-owned input state into player-controlled entities.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_INPUTSYSTEM_HPP
    #define DZ_GAME_SYSTEMS_INPUTSYSTEM_HPP

#include <dz/ecs/System.hpp>
#include <dz/input/InputState.hpp>

namespace dz::game {

/**
 * @class InputSystem
 * @brief Single reader of the platform input state.
 *
 * The state is owned by the host (usually input::InputManager) and bound at
 * construction. Bot entities carry an AIComponent and are excluded: the
 * AISystem writes their InputComponent instead.
 */
class InputSystem final : public ecs::System
{
public:
    InputSystem(ecs::World& world, const input::InputState& source);

protected:
    core::Expected<void> onUpdate(core::f32 dt) override;

private:
    const input::InputState& _source;
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_INPUTSYSTEM_HPP
