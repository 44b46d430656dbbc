/**
 * @file GameLoop.hpp
 * @brief Variable time-step host frame driver with a spiral-of-death clamp.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ENGINE_GAMELOOP_HPP
    #define DZ_ENGINE_GAMELOOP_HPP

#include <dz/engine/Config.hpp>
#include <dz/core/NonCopyable.hpp>
#include <dz/core/Types.hpp>

#include <functional>

namespace dz::engine {

/** @brief Callbacks the game loop invokes each frame. */
struct LoopCallbacks
{
    /** @brief Called once per frame before the update (input poll, etc.). */
    std::function<void()> preFrame;

    /** @brief Called once per frame with the clamped delta time in seconds. */
    std::function<void(core::f32 dt)> update;

    /** @brief Called once per frame after the update (stats, present, etc.). */
    std::function<void()> postFrame;
};

/**
 * @class GameLoop
 * @brief Turns host timestamps into clamped frame deltas.
 *
 * The first frame after construction or resume() only records its
 * timestamp and runs with dt = 0, so time spent paused is never simulated.
 * The fixed-step catch-up itself lives in ecs::World; the loop only bounds
 * how much time one frame may hand it.
 */
class GameLoop final : public core::NonCopyable<GameLoop>
{
public:
    /// @param config Engine configuration (provides maxFrameTime and targetFps).
    explicit GameLoop(const Config& config);
    ~GameLoop();

    void setCallbacks(LoopCallbacks callbacks);

    /**
     * @brief Runs one frame at host time @p nowSeconds.
     * @return The delta handed to the update callback, 0 while paused.
     */
    core::f32 frame(core::f64 nowSeconds);

    /**
     * @brief Drives frame() from std::chrono::steady_clock until
     *        requestStop() is called, sleeping to honour targetFps.
     */
    void run();

    /** @brief Request graceful loop termination. */
    void requestStop() noexcept;

    void pause() noexcept;
    void resume() noexcept;

    [[nodiscard]] bool      isRunning()  const noexcept { return _running; }
    [[nodiscard]] bool      isPaused()   const noexcept { return _paused; }
    [[nodiscard]] core::u64 frameCount() const noexcept { return _frameCount; }
    [[nodiscard]] core::f32 lastDelta()  const noexcept { return _lastDelta; }

private:
    core::f64     _maxFrameTime;
    core::u32     _targetFps;
    LoopCallbacks _callbacks;

    core::f64     _lastTime{0.0};
    bool          _hasLastTime{false};
    bool          _paused{false};
    bool          _running{false};
    bool          _stopRequested{false};
    core::u64     _frameCount{0};
    core::f32     _lastDelta{0.0f};
};

} // namespace dz::engine

#endif // DZ_ENGINE_GAMELOOP_HPP
