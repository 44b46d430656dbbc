/**
 * @file GameLoop.cpp
 * @brief GameLoop implementation: clamped variable step on a steady clock.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/engine/GameLoop.hpp>
#include <dz/core/Log.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <utility>

namespace dz::engine {

namespace {

constexpr auto kPausedSleep = std::chrono::milliseconds{10};

} // namespace

GameLoop::GameLoop(const Config& config)
    : _maxFrameTime{config.maxFrameTime() > 0.0 ? config.maxFrameTime() : core::kMaxFrameTime}
    , _targetFps{config.targetFps()}
{}

GameLoop::~GameLoop() = default;

void GameLoop::setCallbacks(LoopCallbacks callbacks)
{
    _callbacks = std::move(callbacks);
}

core::f32 GameLoop::frame(core::f64 nowSeconds)
{
    if (_paused)
        return 0.0f;

    core::f64 frameTime = _hasLastTime ? nowSeconds - _lastTime : 0.0;
    _lastTime    = nowSeconds;
    _hasLastTime = true;

    frameTime  = std::clamp(frameTime, 0.0, _maxFrameTime);
    _lastDelta = static_cast<core::f32>(frameTime);

    if (_callbacks.preFrame)
    {
        _callbacks.preFrame();
    }

    if (_callbacks.update)
    {
        _callbacks.update(_lastDelta);
    }

    if (_callbacks.postFrame)
    {
        _callbacks.postFrame();
    }

    ++_frameCount;
    return _lastDelta;
}

void GameLoop::run()
{
    _running       = true;
    _stopRequested = false;
    _hasLastTime   = false;

    using Clock = std::chrono::steady_clock;
    const auto origin = Clock::now();

    while (!_stopRequested)
    {
        const auto frameStart = Clock::now();

        if (_paused)
        {
            std::this_thread::sleep_for(kPausedSleep);
            continue;
        }

        frame(std::chrono::duration<core::f64>(frameStart - origin).count());

        if (_targetFps > 0)
        {
            const auto budget = std::chrono::duration<core::f64>(1.0 / static_cast<core::f64>(_targetFps));
            std::this_thread::sleep_until(frameStart + std::chrono::duration_cast<Clock::duration>(budget));
        }
    }

    _running = false;
    core::Log::info("GameLoop", "stopped after " + std::to_string(_frameCount) + " frames");
}

void GameLoop::requestStop() noexcept
{
    _stopRequested = true;
}

void GameLoop::pause() noexcept
{
    _paused = true;
}

void GameLoop::resume() noexcept
{
    if (!_paused)
        return;

    _paused      = false;
    _hasLastTime = false;
}

} // namespace dz::engine
