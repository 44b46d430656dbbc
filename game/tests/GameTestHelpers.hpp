/**
 * @file GameTestHelpers.hpp
 * @brief Recording collaborators and a capturing logger for gameplay tests.
 */

#pragma once

#ifndef DZ_GAME_TESTS_GAME_TEST_HELPERS_HPP
    #define DZ_GAME_TESTS_GAME_TEST_HELPERS_HPP

#include "dz/audio/IAudioEngine.hpp"
#include "dz/core/Log.hpp"
#include "dz/ecs/World.hpp"
#include "dz/render/IRenderScene.hpp"

#include <map>
#include <string>
#include <vector>

namespace dz::game::test {

struct CapturingLogger final : core::ILogger {
    std::vector<std::string> lines;

    void write(core::LogLevel, std::string_view tag, std::string_view message) override
    {
        lines.push_back(std::string(tag) + ": " + std::string(message));
    }

    [[nodiscard]] int count(std::string_view needle) const
    {
        int n = 0;
        for (const auto& l : lines)
            if (l.find(needle) != std::string::npos)
                ++n;
        return n;
    }
};

struct ScopedLogger {
    CapturingLogger logger;
    ScopedLogger()  { core::Log::setLogger(&logger); }
    ~ScopedLogger() { core::Log::setLogger(nullptr); }
};

struct RecordingAudio final : audio::IAudioEngine {
    struct Play {
        std::string clip;
        math::Vec3f position;
        core::f32   volume;
    };
    std::vector<Play> plays;

    core::Expected<void> init() override { return {}; }
    void shutdown() override {}
    void setListenerPosition(const math::Vec3f&, const math::Vec3f&, const math::Vec3f&) override {}
    void play(std::string_view clipId, const math::Vec3f& position, core::f32 volume) override
    {
        plays.push_back({std::string(clipId), position, volume});
    }
    void stopAll() override {}
    [[nodiscard]] const char* name() const noexcept override { return "RecordingAudio"; }
};

struct RecordingScene final : render::IRenderScene {
    std::map<ecs::EntityId, render::RenderInstance> instances;
    int removals{0};

    void upsertInstance(ecs::EntityId entity, const render::RenderInstance& instance) override
    {
        instances[entity] = instance;
    }
    void removeInstance(ecs::EntityId entity) override
    {
        removals += static_cast<int>(instances.erase(entity));
    }
};

struct RecordingCamera final : render::ICameraController {
    math::Vec3f position{};
    math::Vec3f target{};
    int calls{0};

    void setPosition(const math::Vec3f& p) override { position = p; ++calls; }
    void setTarget(const math::Vec3f& t) override { target = t; }
};

/// Advances @p world by @p seconds in steps of @p dt.
inline void advance(ecs::World& world, core::f32 seconds, core::f32 dt)
{
    const int steps = static_cast<int>(seconds / dt + 0.5f);
    for (int i = 0; i < steps; ++i)
        world.update(dt);
}

} // namespace dz::game::test

#endif // DZ_GAME_TESTS_GAME_TEST_HELPERS_HPP
