/**
 * @file IInputSource.hpp
 * @brief Abstract input source interface (keyboard, gamepad, replay...).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_INPUT_IINPUTSOURCE_HPP
    #define DZ_INPUT_IINPUTSOURCE_HPP

#include <dz/input/InputState.hpp>
#include <dz/core/Expected.hpp>

namespace dz::input {

/**
 * @class IInputSource
 * @brief Strategy interface for polled input sources.
 *
 * Platform adapters implement this to translate device events into the
 * shared InputState.
 */
class IInputSource
{
public:
    virtual ~IInputSource() = default;

    /** @brief Initializes the input source. */
    [[nodiscard]] virtual core::Expected<void> init() = 0;

    /** @brief Polls the device and writes the result into @p state. */
    [[nodiscard]] virtual core::Expected<void> poll(InputState& state) = 0;

    /** @brief Shuts down the input source. */
    virtual void shutdown() = 0;

    /** @brief Returns a human-readable name. */
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace dz::input

#endif // DZ_INPUT_IINPUTSOURCE_HPP
