/**
 * @file Engine.cpp
 * @brief Engine façade implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/engine/Engine.hpp>
#include <dz/engine/GameLoop.hpp>
#include <dz/core/Log.hpp>

#include <dz/audio/IAudioEngine.hpp>
#include <dz/input/InputManager.hpp>
#include <dz/render/IRenderScene.hpp>

#include <dz/game/systems/AISystem.hpp>
#include <dz/game/systems/BattleRoyaleSystem.hpp>
#include <dz/game/systems/CameraSystem.hpp>
#include <dz/game/systems/CollisionSystem.hpp>
#include <dz/game/systems/DestructionSystem.hpp>
#include <dz/game/systems/HealthSystem.hpp>
#include <dz/game/systems/InputSystem.hpp>
#include <dz/game/systems/PhysicsSystem.hpp>
#include <dz/game/systems/PlayerMovementSystem.hpp>
#include <dz/game/systems/ProgressionSystem.hpp>
#include <dz/game/systems/RenderSystem.hpp>
#include <dz/game/systems/WeaponSystem.hpp>

#include <utility>

namespace dz::engine {

namespace {

ecs::World::Settings worldSettings(const Config& config)
{
    ecs::World::Settings settings;
    settings.fixedTimeStep = static_cast<core::f32>(config.fixedTimeStep());
    settings.maxEntities   = config.maxEntities();
    settings.randomSeed    = config.randomSeed();
    return settings;
}

} // namespace

struct Engine::Impl
{
    Config              config;
    Collaborators       collaborators;
    ecs::World          world;
    input::InputManager inputManager;
    GameLoop            loop;
    EngineStats         stats;

    game::RenderSystem* renderSystem{nullptr};
    bool                initialised{false};

    Impl(Config cfg, Collaborators collab)
        : config{std::move(cfg)}
        , collaborators{collab}
        , world{worldSettings(config)}
        , inputManager{}
        , loop{config}
    {
        stats.fixedDeltaTime = world.fixedTimeStep();
    }
};

Engine::Engine(Config config, Collaborators collaborators)
    : _impl{std::make_unique<Impl>(std::move(config), collaborators)}
{
    _impl->loop.setCallbacks(LoopCallbacks{
        [this]() { _impl->inputManager.poll(); },
        [this](core::f32 dt) {
            _impl->world.update(dt);
            updateStats(dt);
        },
        {},
    });
}

Engine::~Engine()
{
    if (_impl && _impl->initialised)
    {
        shutdown();
    }
}

// ========================================================================== //
//  Lifecycle                                                                 //
// ========================================================================== //

core::Expected<void> Engine::init()
{
    if (_impl->initialised)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "engine already initialised");
    }

    if (auto valid = _impl->config.validate(); !valid)
    {
        core::Log::fatal("Engine", "invalid configuration: " + valid.error().message());
        return valid;
    }

    if (_impl->config.enableDebug())
    {
        core::Log::setMinLevel(core::LogLevel::kDebug);
    }

    core::Log::info("Engine", "init: wiring subsystems");

    if (auto inputResult = _impl->inputManager.init(); !inputResult)
    {
        core::Log::fatal("Engine", "input initialisation failed: " + inputResult.error().message());
        return inputResult;
    }

    if (auto* audio = _impl->collaborators.audio)
    {
        if (auto audioResult = audio->init(); !audioResult)
        {
            core::Log::warn("Engine", std::string(audio->name()) + " unavailable, running silent: " +
                                      audioResult.error().message());
            _impl->collaborators.audio = nullptr;
        }
    }

    registerDefaultSystems();

    _impl->initialised = true;
    core::Log::info("Engine", "init: done, " + std::to_string(_impl->world.systems().size()) + " systems");
    return {};
}

void Engine::registerDefaultSystems()
{
    auto& world = _impl->world;
    const auto& collab = _impl->collaborators;

    world.emplaceSystem<game::InputSystem>(_impl->inputManager.state());

    world.emplaceSystem<game::PlayerMovementSystem>();
    world.emplaceSystem<game::PhysicsSystem>();
    world.emplaceSystem<game::CollisionSystem>();

    game::AISystem::Settings ai;
    ai.perceptionQuery = ecs::Query::with({ecs::ComponentId::Transform, ecs::ComponentId::Health});
    world.emplaceSystem<game::AISystem>(ai);
    world.emplaceSystem<game::WeaponSystem>(collab.audio);
    world.emplaceSystem<game::DestructionSystem>();
    world.emplaceSystem<game::HealthSystem>();
    world.emplaceSystem<game::BattleRoyaleSystem>();
    world.emplaceSystem<game::ProgressionSystem>();

    if (!_impl->config.headless())
    {
        world.emplaceSystem<game::CameraSystem>(collab.camera);
        _impl->renderSystem = &world.emplaceSystem<game::RenderSystem>(collab.scene);
    }
}

core::f32 Engine::frame(core::f64 nowSeconds)
{
    if (!_impl->initialised)
    {
        core::Log::warn("Engine", "frame() called before init()");
        return 0.0f;
    }
    return _impl->loop.frame(nowSeconds);
}

core::Expected<void> Engine::run()
{
    if (!_impl->initialised)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "run() called before init()");
    }

    _impl->loop.run();
    return {};
}

void Engine::pause() noexcept
{
    _impl->loop.pause();
}

void Engine::resume() noexcept
{
    _impl->loop.resume();
}

void Engine::stop() noexcept
{
    _impl->loop.requestStop();
}

void Engine::shutdown()
{
    if (!_impl->initialised)
    {
        return;
    }

    core::Log::info("Engine", "shutdown");

    _impl->loop.requestStop();
    _impl->renderSystem = nullptr;
    _impl->world.clear();

    if (_impl->collaborators.audio)
    {
        _impl->collaborators.audio->stopAll();
        _impl->collaborators.audio->shutdown();
    }

    _impl->inputManager.shutdown();
    _impl->initialised = false;
}

bool Engine::isInitialised() const noexcept
{
    return _impl->initialised;
}

bool Engine::isPaused() const noexcept
{
    return _impl->loop.isPaused();
}

// ========================================================================== //
//  World pass-through                                                        //
// ========================================================================== //

ecs::World& Engine::world() noexcept
{
    return _impl->world;
}

const ecs::World& Engine::world() const noexcept
{
    return _impl->world;
}

ecs::EntityId Engine::createEntity(std::string name)
{
    return _impl->world.createEntity(std::move(name));
}

bool Engine::destroyEntity(ecs::EntityId id)
{
    return _impl->world.destroyEntity(id);
}

std::vector<ecs::EntityId> Engine::query(const ecs::Query& q) const
{
    return _impl->world.query(q);
}

input::InputManager& Engine::input() noexcept
{
    return _impl->inputManager;
}

const Config& Engine::config() const noexcept
{
    return _impl->config;
}

// ========================================================================== //
//  Stats                                                                     //
// ========================================================================== //

void Engine::updateStats(core::f32 dt)
{
    auto& stats = _impl->stats;
    ++stats.frameCount;

    if (stats.frameCount % core::kFpsSampleFrames == 0)
    {
        stats.fps = dt > 0.0f ? 1.0 / static_cast<core::f64>(dt) : 0.0;
    }

    stats.frameTimeMs       = static_cast<core::f64>(dt) * 1000.0;
    stats.deltaTime         = dt;
    stats.fixedDeltaTime    = _impl->world.fixedTimeStep();
    stats.world             = _impl->world.stats();
    stats.renderedInstances = _impl->renderSystem ? _impl->renderSystem->submittedInstances() : 0;
}

const EngineStats& Engine::stats() const noexcept
{
    return _impl->stats;
}

PerformanceSnapshot Engine::performanceReport() const
{
    PerformanceSnapshot report;
    report.engine  = _impl->stats;
    report.systems = _impl->world.systemReports();

    const core::TimeMs now = _impl->world.timeMs();
    _impl->world.forEachEntity([&](const ecs::Entity& e) {
        report.entities.push_back(EntitySummary{
            e.id, e.name, e.active, e.age(now), _impl->world.archetypeOf(e.id).count()});
    });
    return report;
}

} // namespace dz::engine
