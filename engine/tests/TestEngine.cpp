/**
 * @file TestEngine.cpp
 * @brief Unit tests for engine::Config, engine::GameLoop and engine::Engine.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "dz/audio/IAudioEngine.hpp"
#include "dz/engine/Engine.hpp"
#include "dz/engine/GameLoop.hpp"
#include "dz/game/Prefabs.hpp"
#include "dz/game/components/Input.hpp"
#include "dz/input/InputManager.hpp"
#include "dz/render/IRenderScene.hpp"

#include <map>
#include <memory>
#include <string>

namespace dz::engine {

using Catch::Matchers::WithinAbs;

namespace {

struct CountingScene final : render::IRenderScene {
    std::map<ecs::EntityId, render::RenderInstance> instances;

    void upsertInstance(ecs::EntityId entity, const render::RenderInstance& instance) override
    {
        instances[entity] = instance;
    }
    void removeInstance(ecs::EntityId entity) override { instances.erase(entity); }
};

struct StubAudio final : audio::IAudioEngine {
    explicit StubAudio(bool failInit) : _failInit{failInit} {}

    bool shutDown{false};

    core::Expected<void> init() override
    {
        if (_failInit)
            return core::makeError(core::ErrorCode::kIoError, "no device");
        return {};
    }
    void shutdown() override { shutDown = true; }
    void setListenerPosition(const math::Vec3f&, const math::Vec3f&, const math::Vec3f&) override {}
    void play(std::string_view, const math::Vec3f&, core::f32) override {}
    void stopAll() override {}
    const char* name() const noexcept override { return "StubAudio"; }

private:
    bool _failInit;
};

class ForwardSource final : public input::IInputSource {
public:
    core::Expected<void> init() override { return {}; }
    core::Expected<void> poll(input::InputState& state) override
    {
        state.forward = true;
        return {};
    }
    void shutdown() override {}
    const char* name() const noexcept override { return "Forward"; }
};

Config headlessConfig()
{
    return Config::Builder{}.headless(true).build();
}

} // namespace

// ========================================================================== //
//  Config                                                                    //
// ========================================================================== //

TEST_CASE("Config builder keeps defaults and overrides", "[engine][config]")
{
    const Config defaults = Config::Builder{}.build();
    REQUIRE(defaults.fixedTimeStep() == core::kFixedTimeStep);
    REQUIRE(defaults.maxFrameTime() == core::kMaxFrameTime);
    REQUIRE(defaults.targetFps() == 0);
    REQUIRE_FALSE(defaults.headless());
    REQUIRE(defaults.validate().has_value());

    const Config custom = Config::Builder{}
                              .fixedTimeStep(0.01)
                              .targetFps(30)
                              .randomSeed(7)
                              .totalPlayers(12)
                              .headless(true)
                              .build();
    REQUIRE(custom.fixedTimeStep() == 0.01);
    REQUIRE(custom.targetFps() == 30);
    REQUIRE(custom.randomSeed() == 7);
    REQUIRE(custom.totalPlayers() == 12);
    REQUIRE(custom.headless());
}

TEST_CASE("Config validation rejects unusable values", "[engine][config]")
{
    auto zeroStep = Config::Builder{}.fixedTimeStep(0.0).build().validate();
    REQUIRE_FALSE(zeroStep.has_value());
    REQUIRE(zeroStep.error().code() == core::ErrorCode::kInvalidArgument);

    REQUIRE_FALSE(Config::Builder{}.maxFrameTime(-1.0).build().validate().has_value());
    REQUIRE_FALSE(Config::Builder{}.maxEntities(0).build().validate().has_value());
}

// ========================================================================== //
//  GameLoop                                                                  //
// ========================================================================== //

TEST_CASE("GameLoop clamps frame deltas", "[engine][loop]")
{
    GameLoop loop{Config::Builder{}.build()};
    int updates = 0;
    loop.setCallbacks(LoopCallbacks{{}, [&updates](core::f32) { ++updates; }, {}});

    REQUIRE(loop.frame(10.0) == 0.0f);
    REQUIRE_THAT(loop.frame(10.02), WithinAbs(0.02, 1e-6));
    REQUIRE_THAT(loop.frame(12.0), WithinAbs(core::kMaxFrameTime, 1e-6));
    REQUIRE(loop.frame(11.0) == 0.0f);
    REQUIRE(updates == 4);
    REQUIRE(loop.frameCount() == 4);
}

TEST_CASE("GameLoop freezes time across pause", "[engine][loop]")
{
    GameLoop loop{Config::Builder{}.build()};
    core::f32 simulated = 0.0f;
    loop.setCallbacks(LoopCallbacks{{}, [&simulated](core::f32 dt) { simulated += dt; }, {}});

    loop.frame(0.0);
    loop.frame(0.02);
    loop.pause();
    REQUIRE(loop.isPaused());
    REQUIRE(loop.frame(5.0) == 0.0f);
    REQUIRE(loop.frameCount() == 2);

    loop.resume();
    REQUIRE(loop.frame(60.0) == 0.0f);
    loop.frame(60.01);
    REQUIRE_THAT(simulated, WithinAbs(0.03, 1e-5));
}

TEST_CASE("GameLoop::run stops on request", "[engine][loop]")
{
    GameLoop loop{Config::Builder{}.build()};
    int frames = 0;
    std::string order;
    loop.setCallbacks(LoopCallbacks{
        [&order]() { order += 'p'; },
        [&](core::f32) {
            order += 'u';
            if (++frames == 3)
                loop.requestStop();
        },
        [&order]() { order += 'f'; },
    });

    loop.run();
    REQUIRE(frames == 3);
    REQUIRE(order == "pufpufpuf");
    REQUIRE_FALSE(loop.isRunning());
}

// ========================================================================== //
//  Engine                                                                    //
// ========================================================================== //

TEST_CASE("Engine init registers the default systems", "[engine]")
{
    Engine headless{headlessConfig()};
    REQUIRE(headless.init().has_value());
    REQUIRE(headless.isInitialised());
    REQUIRE(headless.world().hasSystem("InputSystem"));
    REQUIRE(headless.world().hasSystem("BattleRoyaleSystem"));
    REQUIRE(headless.world().hasSystem("ProgressionSystem"));
    REQUIRE_FALSE(headless.world().hasSystem("RenderSystem"));
    REQUIRE(headless.world().systems().front()->name() == "InputSystem");
    REQUIRE(headless.world().systems().back()->name() == "ProgressionSystem");

    auto again = headless.init();
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kInvalidState);

    Engine windowed{Config::Builder{}.build()};
    REQUIRE(windowed.init().has_value());
    REQUIRE(windowed.world().hasSystem("RenderSystem"));
    REQUIRE(windowed.world().hasSystem("CameraSystem"));
    REQUIRE(windowed.world().systems().size() == headless.world().systems().size() + 2);
}

TEST_CASE("Engine refuses to start with a bad configuration", "[engine]")
{
    Engine engine{Config::Builder{}.fixedTimeStep(-1.0).build()};
    auto result = engine.init();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE_FALSE(engine.isInitialised());

    REQUIRE(engine.frame(1.0) == 0.0f);
    auto run = engine.run();
    REQUIRE_FALSE(run.has_value());
    REQUIRE(run.error().code() == core::ErrorCode::kInvalidState);
}

TEST_CASE("Engine frames advance the world by the clamped delta", "[engine]")
{
    Engine engine{headlessConfig()};
    REQUIRE(engine.init().has_value());

    engine.frame(0.0);
    REQUIRE(engine.world().timeMs() == 0.0);

    engine.frame(0.5);
    REQUIRE_THAT(engine.world().timeMs(), WithinAbs(1000.0 / 30.0, 1e-3));
    REQUIRE(engine.world().stats().fixedStepCount == 2);

    engine.pause();
    engine.frame(3.0);
    engine.resume();
    engine.frame(4.0);
    REQUIRE_THAT(engine.world().timeMs(), WithinAbs(1000.0 / 30.0, 1e-3));
}

TEST_CASE("Engine stats sample fps every 60 frames", "[engine]")
{
    Engine engine{headlessConfig()};
    REQUIRE(engine.init().has_value());

    for (int i = 0; i < 59; ++i)
        engine.frame(static_cast<core::f64>(i) / 60.0);
    REQUIRE(engine.stats().fps == 0.0);
    REQUIRE(engine.stats().frameCount == 59);

    engine.frame(59.0 / 60.0);
    REQUIRE(engine.stats().frameCount == 60);
    REQUIRE_THAT(engine.stats().fps, WithinAbs(60.0, 0.01));

    engine.frame(59.0 / 60.0 + 0.02);
    REQUIRE_THAT(engine.stats().fps, WithinAbs(60.0, 0.01));
    REQUIRE_THAT(engine.stats().frameTimeMs, WithinAbs(20.0, 1e-3));
    REQUIRE_THAT(engine.stats().deltaTime, WithinAbs(0.02, 1e-6));
    REQUIRE(engine.stats().fixedDeltaTime == static_cast<core::f32>(core::kFixedTimeStep));
    REQUIRE(engine.stats().world.frameCount == 61);
}

TEST_CASE("Engine feeds polled input to player entities", "[engine]")
{
    Engine engine{headlessConfig()};
    engine.input().addSource(std::make_unique<ForwardSource>());
    REQUIRE(engine.init().has_value());

    const auto player = game::prefab::spawnPlayer(engine.world(), {});
    engine.frame(0.0);

    REQUIRE(engine.world().getComponent<game::InputComponent>(player)->state.forward);
    REQUIRE(engine.input().sequence() == 1);
}

TEST_CASE("Engine pushes render instances to the injected scene", "[engine]")
{
    CountingScene scene;
    Engine engine{Config::Builder{}.build(), Collaborators{&scene, nullptr, nullptr}};
    REQUIRE(engine.init().has_value());

    game::prefab::spawnLoot(engine.world(), {}, game::LootKind::Ammo, 30);
    game::prefab::spawnLoot(engine.world(), {2.0f, 0.0f, 0.0f}, game::LootKind::Health, 25);
    engine.frame(0.0);

    REQUIRE(scene.instances.size() == 2);
    REQUIRE(engine.stats().renderedInstances == 2);

    const PerformanceSnapshot report = engine.performanceReport();
    REQUIRE(report.entities.size() == 2);
    REQUIRE(report.entities.front().componentCount == 3);
    REQUIRE(report.systems.size() == engine.world().systems().size());
}

TEST_CASE("Engine degrades to silence when audio fails to start", "[engine]")
{
    StubAudio broken{true};
    {
        Engine engine{headlessConfig(), Collaborators{nullptr, nullptr, &broken}};
        REQUIRE(engine.init().has_value());
        engine.shutdown();
    }
    REQUIRE_FALSE(broken.shutDown);

    StubAudio working{false};
    {
        Engine engine{headlessConfig(), Collaborators{nullptr, nullptr, &working}};
        REQUIRE(engine.init().has_value());
    }
    REQUIRE(working.shutDown);
}

TEST_CASE("Engine shutdown clears the world", "[engine]")
{
    Engine engine{headlessConfig()};
    REQUIRE(engine.init().has_value());
    engine.createEntity("a");
    engine.frame(0.0);

    engine.shutdown();
    REQUIRE_FALSE(engine.isInitialised());
    REQUIRE(engine.world().systems().empty());
    REQUIRE(engine.world().stats().entityCount == 0);
}

} // namespace dz::engine
