/**
 * @file Audio.hpp
 * @brief Sound clips an entity can emit, with distance attenuation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_AUDIO_HPP
    #define DZ_GAME_COMPONENTS_AUDIO_HPP

#include <dz/ecs/Component.hpp>
#include <dz/core/Types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace dz::game {

struct AudioClip
{
    std::string id;
    core::f32   volume{1.0f};
    bool        loop{false};
    bool        spatial{true};
    core::f32   maxDistance{100.0f};
};

class AudioComponent final : public ecs::ComponentBase<ecs::ComponentId::Audio>
{
public:
    /** @brief Starts with the default weapon, footstep and ambience clips. */
    AudioComponent();

    [[nodiscard]] const AudioClip* clip(std::string_view id) const noexcept;

    /** @brief Adds @p clip, replacing any clip with the same id. */
    void addClip(AudioClip clip);

    /**
     * @brief Playback volume of @p clip heard from @p distance units away.
     *
     * Spatial clips fade linearly to silence at maxDistance. The result is
     * scaled by the master volume and is 0 while disabled.
     */
    [[nodiscard]] core::f32 volumeAt(const AudioClip& clip, core::f32 distance) const noexcept;

    [[nodiscard]] const std::vector<AudioClip>& clips() const noexcept { return _clips; }

    core::f32 masterVolume{1.0f};
    bool      spatialEnabled{true};
    bool      enabled{true};

private:
    std::vector<AudioClip> _clips;
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_AUDIO_HPP
