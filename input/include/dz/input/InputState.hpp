/**
 * @file InputState.hpp
 * @brief Snapshot of player action input for one frame.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_INPUT_INPUTSTATE_HPP
    #define DZ_INPUT_INPUTSTATE_HPP

#include <dz/core/Types.hpp>

namespace dz::input {

/**
 * @struct InputState
 * @brief Action flags and pointer deltas.
 *
 * One instance is owned by the host (through InputManager) and is the
 * single source the InputSystem copies into player components. AI
 * controllers write the same struct directly into their own component.
 */
struct InputState
{
    bool forward{false};
    bool backward{false};
    bool left{false};
    bool right{false};
    bool jump{false};
    bool fire{false};
    bool aim{false};
    bool sprint{false};
    bool crouch{false};
    bool reload{false};

    core::f32 mouseX{0.0f};
    core::f32 mouseY{0.0f};
    core::f32 lookX{0.0f};   ///< Yaw delta in radians, consumed by movement.
    core::f32 lookY{0.0f};   ///< Pitch delta in radians.

    /** @brief Clears the boolean actions, keeping pointer state. */
    void clearActions() noexcept
    {
        forward = backward = left = right = false;
        jump = fire = aim = sprint = crouch = reload = false;
    }

    [[nodiscard]] bool hasMovement() const noexcept
    {
        return forward || backward || left || right;
    }

    [[nodiscard]] bool operator==(const InputState&) const = default;
};

} // namespace dz::input

#endif // DZ_INPUT_INPUTSTATE_HPP
