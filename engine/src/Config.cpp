/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/engine/Config.hpp>

#include <cmath>

namespace dz::engine {

Config::Builder& Config::Builder::fixedTimeStep(core::f64 seconds) noexcept
{
    _fixedTimeStep = seconds;
    return *this;
}

Config::Builder& Config::Builder::maxFrameTime(core::f64 seconds) noexcept
{
    _maxFrameTime = seconds;
    return *this;
}

Config::Builder& Config::Builder::targetFps(core::u32 fps) noexcept
{
    _targetFps = fps;
    return *this;
}

Config::Builder& Config::Builder::maxEntities(core::u32 n) noexcept
{
    _maxEntities = n;
    return *this;
}

Config::Builder& Config::Builder::randomSeed(core::u32 seed) noexcept
{
    _randomSeed = seed;
    return *this;
}

Config::Builder& Config::Builder::enableDebug(bool enabled) noexcept
{
    _enableDebug = enabled;
    return *this;
}

Config::Builder& Config::Builder::headless(bool enabled) noexcept
{
    _headless = enabled;
    return *this;
}

Config::Builder& Config::Builder::totalPlayers(core::u32 n) noexcept
{
    _totalPlayers = n;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg._fixedTimeStep = _fixedTimeStep;
    cfg._maxFrameTime  = _maxFrameTime;
    cfg._targetFps     = _targetFps;
    cfg._maxEntities   = _maxEntities;
    cfg._randomSeed    = _randomSeed;
    cfg._enableDebug   = _enableDebug;
    cfg._headless      = _headless;
    cfg._totalPlayers  = _totalPlayers;
    return cfg;
}

core::Expected<void> Config::validate() const
{
    if (!std::isfinite(_fixedTimeStep) || _fixedTimeStep <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "fixedTimeStep must be positive");

    if (!std::isfinite(_maxFrameTime) || _maxFrameTime <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "maxFrameTime must be positive");

    if (_maxEntities == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "maxEntities must be non-zero");

    return {};
}

} // namespace dz::engine
