/**
 * @file Config.hpp
 * @brief Engine configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ENGINE_CONFIG_HPP
    #define DZ_ENGINE_CONFIG_HPP

#include <dz/core/Constants.hpp>
#include <dz/core/Expected.hpp>
#include <dz/core/Types.hpp>

namespace dz::engine {

/** @brief Immutable engine configuration. */
class Config
{
public:
    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder& fixedTimeStep(core::f64 seconds) noexcept;
        Builder& maxFrameTime(core::f64 seconds) noexcept;
        Builder& targetFps(core::u32 fps) noexcept;
        Builder& maxEntities(core::u32 n) noexcept;
        Builder& randomSeed(core::u32 seed) noexcept;
        Builder& enableDebug(bool enabled) noexcept;
        Builder& headless(bool enabled) noexcept;
        Builder& totalPlayers(core::u32 n) noexcept;

        [[nodiscard]] Config build() const noexcept;

    private:
        core::f64 _fixedTimeStep{core::kFixedTimeStep};
        core::f64 _maxFrameTime{core::kMaxFrameTime};
        core::u32 _targetFps{0};
        core::u32 _maxEntities{core::kMaxEntities};
        core::u32 _randomSeed{0x5eed};
        bool      _enableDebug{false};
        bool      _headless{false};
        core::u32 _totalPlayers{100};
    };

    /**
     * @brief Rejects values the engine cannot run with.
     * @return kInvalidArgument naming the first offending field.
     */
    [[nodiscard]] core::Expected<void> validate() const;

    [[nodiscard]] core::f64 fixedTimeStep() const noexcept { return _fixedTimeStep; }
    [[nodiscard]] core::f64 maxFrameTime()  const noexcept { return _maxFrameTime; }
    [[nodiscard]] core::u32 targetFps()     const noexcept { return _targetFps; }      ///< 0 = uncapped.
    [[nodiscard]] core::u32 maxEntities()   const noexcept { return _maxEntities; }
    [[nodiscard]] core::u32 randomSeed()    const noexcept { return _randomSeed; }
    [[nodiscard]] bool      enableDebug()   const noexcept { return _enableDebug; }
    [[nodiscard]] bool      headless()      const noexcept { return _headless; }
    [[nodiscard]] core::u32 totalPlayers()  const noexcept { return _totalPlayers; }

private:
    friend class Builder;

    core::f64 _fixedTimeStep{core::kFixedTimeStep};
    core::f64 _maxFrameTime{core::kMaxFrameTime};
    core::u32 _targetFps{0};
    core::u32 _maxEntities{core::kMaxEntities};
    core::u32 _randomSeed{0x5eed};
    bool      _enableDebug{false};
    bool      _headless{false};
    core::u32 _totalPlayers{100};
};

} // namespace dz::engine

#endif // DZ_ENGINE_CONFIG_HPP
