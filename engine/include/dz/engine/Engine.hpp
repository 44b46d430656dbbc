/**
 * @file Engine.hpp
 * @brief Top-level engine façade (Façade pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ENGINE_ENGINE_HPP
    #define DZ_ENGINE_ENGINE_HPP

#include <dz/engine/Config.hpp>
#include <dz/ecs/World.hpp>
#include <dz/core/Expected.hpp>
#include <dz/core/Types.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dz::audio  { class IAudioEngine; }
namespace dz::input  { class InputManager; }
namespace dz::render { class IRenderScene; class ICameraController; }

namespace dz::engine {

/**
 * @brief Host-provided back-ends. Every pointer may be null; the matching
 *        systems then run without side effects.
 */
struct Collaborators
{
    render::IRenderScene*      scene{nullptr};
    render::ICameraController* camera{nullptr};
    audio::IAudioEngine*       audio{nullptr};
};

struct EngineStats
{
    core::f64       fps{0.0};               ///< Refreshed every kFpsSampleFrames frames.
    core::f64       frameTimeMs{0.0};
    core::f32       deltaTime{0.0f};
    core::f32       fixedDeltaTime{0.0f};
    core::u64       frameCount{0};
    ecs::WorldStats world{};
    core::usize     renderedInstances{0};
};

struct EntitySummary
{
    ecs::EntityId id;
    std::string   name;
    bool          active;
    core::TimeMs  age;
    core::usize   componentCount;
};

struct PerformanceSnapshot
{
    EngineStats                         engine;
    std::vector<ecs::PerformanceReport> systems;
    std::vector<EntitySummary>          entities;
};

/**
 * @brief Top-level engine façade.
 *
 * Owns the World, the InputManager and the GameLoop. init() registers the
 * default gameplay systems, frame() and run() drive the World from host
 * time, and shutdown() tears everything down in reverse order.
 */
class Engine
{
public:
    /// @param config Immutable engine configuration.
    explicit Engine(Config config, Collaborators collaborators = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Validate the configuration, initialise input and audio, and
     *        register the default systems.
     * @return Success or the first fatal error encountered.
     */
    [[nodiscard]] core::Expected<void> init();

    /**
     * @brief Runs one frame at host time @p nowSeconds.
     * @return The simulated delta, 0 while paused or before init().
     */
    core::f32 frame(core::f64 nowSeconds);

    /** @brief Run the main loop (blocks until stop() is requested). */
    [[nodiscard]] core::Expected<void> run();

    void pause() noexcept;
    void resume() noexcept;

    /** @brief Request graceful loop termination. */
    void stop() noexcept;

    /** @brief Shut down all subsystems in reverse init order. */
    void shutdown();

    [[nodiscard]] bool isInitialised() const noexcept;
    [[nodiscard]] bool isPaused()      const noexcept;

    // --------------------------------------------------------------------- //
    //  World pass-through                                                    //
    // --------------------------------------------------------------------- //

    [[nodiscard]] ecs::World&       world() noexcept;
    [[nodiscard]] const ecs::World& world() const noexcept;

    ecs::EntityId createEntity(std::string name = "Entity");
    bool          destroyEntity(ecs::EntityId id);

    template <typename T>
    [[nodiscard]] T* getSystem(std::string_view name) const noexcept { return world().getSystem<T>(name); }

    [[nodiscard]] std::vector<ecs::EntityId> query(const ecs::Query& q) const;

    // --------------------------------------------------------------------- //
    //  Host access                                                           //
    // --------------------------------------------------------------------- //

    [[nodiscard]] input::InputManager& input() noexcept;
    [[nodiscard]] const Config&        config() const noexcept;

    [[nodiscard]] const EngineStats& stats() const noexcept;
    [[nodiscard]] PerformanceSnapshot performanceReport() const;

private:
    void registerDefaultSystems();
    void updateStats(core::f32 dt);

    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace dz::engine

#endif // DZ_ENGINE_ENGINE_HPP
