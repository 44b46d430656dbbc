/**
 * @file Input.hpp
 * @brief Per-entity action state, written by the InputSystem (players) or
 *        the AISystem (bots).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_INPUT_HPP
    #define DZ_GAME_COMPONENTS_INPUT_HPP

#include <dz/ecs/Component.hpp>
#include <dz/input/InputState.hpp>

namespace dz::game {

struct InputComponent final : ecs::ComponentBase<ecs::ComponentId::Input>
{
    input::InputState state{};
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_INPUT_HPP
