/**
 * @file InputManager.hpp
 * @brief Owner of the frame's InputState, fed by registered sources.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_INPUT_INPUTMANAGER_HPP
    #define DZ_INPUT_INPUTMANAGER_HPP

#include <dz/input/IInputSource.hpp>
#include <dz/input/InputState.hpp>
#include <dz/core/Expected.hpp>
#include <dz/core/NonCopyable.hpp>
#include <dz/core/Types.hpp>

#include <memory>

namespace dz::input {

/**
 * @class InputManager
 * @brief Single writer of the host-owned InputState.
 *
 * Sources are polled in registration order once per frame, before the
 * World update; later sources override earlier ones for the fields they
 * write. Systems only ever see the state through a const reference.
 */
class InputManager final : public core::NonCopyable<InputManager>
{
public:
    InputManager();
    ~InputManager();

    /** @brief Registers a new input source. */
    void addSource(std::unique_ptr<IInputSource> source);

    /** @brief Initializes all registered sources, stopping at the first failure. */
    [[nodiscard]] core::Expected<void> init();

    /**
     * @brief Polls every source into the current state.
     *
     * A failing source is logged and skipped; the frame keeps the values
     * the other sources produced.
     */
    void poll();

    /** @brief Shuts down all sources. */
    void shutdown();

    /** @brief Current snapshot, read by the InputSystem. */
    [[nodiscard]] const InputState& state() const noexcept;

    /** @brief Direct write access for hosts that inject input without a source. */
    [[nodiscard]] InputState& mutableState() noexcept;

    /** @brief Number of completed poll() calls. */
    [[nodiscard]] core::u64 sequence() const noexcept;

    [[nodiscard]] core::usize sourceCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace dz::input

#endif // DZ_INPUT_INPUTMANAGER_HPP
