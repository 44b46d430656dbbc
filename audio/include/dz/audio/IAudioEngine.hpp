/**
 * @file IAudioEngine.hpp
 * @brief Abstract audio backend consumed by gameplay systems.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_AUDIO_IAUDIOENGINE_HPP
    #define DZ_AUDIO_IAUDIOENGINE_HPP

#include <dz/math/Vec3.hpp>
#include <dz/core/Expected.hpp>
#include <dz/core/Types.hpp>

#include <string_view>

namespace dz::audio {

/**
 * @class IAudioEngine
 * @brief Fire-and-forget positional playback.
 *
 * Implementations own clip loading and mixing. play() must not block the
 * simulation frame.
 */
class IAudioEngine
{
public:
    virtual ~IAudioEngine() = default;

    [[nodiscard]] virtual core::Expected<void> init() = 0;
    virtual void shutdown() = 0;

    virtual void setListenerPosition(const math::Vec3f& position,
                                     const math::Vec3f& forward,
                                     const math::Vec3f& up) = 0;

    /**
     * @brief Plays a clip at a world position.
     * @param clipId   Clip identifier (e.g. "rifle_fire").
     * @param position World-space emitter position.
     * @param volume   Linear gain in [0, 1].
     */
    virtual void play(std::string_view clipId, const math::Vec3f& position, core::f32 volume) = 0;

    virtual void stopAll() = 0;

    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace dz::audio

#endif // DZ_AUDIO_IAUDIOENGINE_HPP
