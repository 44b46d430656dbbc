/**
 * @file Audio.cpp
 * @brief AudioComponent implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/components/Audio.hpp>

#include <algorithm>

namespace dz::game {

AudioComponent::AudioComponent()
    : _clips{
          {"pistol_fire",   0.8f, false, true,  100.0f},
          {"rifle_fire",    0.9f, false, true,  150.0f},
          {"shotgun_fire",  1.0f, false, true,   80.0f},
          {"footstep",      0.3f, false, true,   20.0f},
          {"ambient_wind",  0.2f, true,  false,   0.0f},
          {"ambient_birds", 0.1f, true,  false,   0.0f},
      }
{}

const AudioClip* AudioComponent::clip(std::string_view id) const noexcept
{
    auto it = std::find_if(_clips.begin(), _clips.end(),
                           [id](const AudioClip& c) { return c.id == id; });
    return it != _clips.end() ? &*it : nullptr;
}

void AudioComponent::addClip(AudioClip clip)
{
    auto it = std::find_if(_clips.begin(), _clips.end(),
                           [&clip](const AudioClip& c) { return c.id == clip.id; });
    if (it != _clips.end())
    {
        *it = std::move(clip);
        return;
    }
    _clips.push_back(std::move(clip));
}

core::f32 AudioComponent::volumeAt(const AudioClip& clip, core::f32 distance) const noexcept
{
    if (!enabled)
        return 0.0f;

    core::f32 attenuation = 1.0f;
    if (clip.spatial && spatialEnabled && clip.maxDistance > 0.0f)
        attenuation = std::max(0.0f, 1.0f - distance / clip.maxDistance);

    return attenuation * clip.volume * masterVolume;
}

} // namespace dz::game
