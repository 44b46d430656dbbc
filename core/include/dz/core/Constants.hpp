/**
 * @file Constants.hpp
 * @brief Engine-wide compile-time constants.
 *
 * Default values for the frame loop, the entity handle layout and the
 * shared gameplay tunables. Systems copy these into their Settings
 * structs so individual worlds can override them.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef DZ_CORE_CONSTANTS_HPP
    #define DZ_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace dz::core {

// ---- Frame loop ----------------------------------------------------------

inline constexpr f64   kFixedTimeStep         = 1.0 / 60.0;
inline constexpr f64   kMaxFrameTime          = 1.0 / 30.0;
inline constexpr u32   kFpsSampleFrames       = 60;

// ---- Entity handles ------------------------------------------------------

inline constexpr u32   kGenerationBits        = 12;
inline constexpr u32   kSlotBits              = 20;
inline constexpr u32   kMaxEntities           = 100'000;

// ---- Physics -------------------------------------------------------------

inline constexpr f32   kGravity               = -9.81f;
inline constexpr f32   kGroundFriction        = 0.98f;

// ---- Gameplay ------------------------------------------------------------

inline constexpr f32   kEyeHeight             = 1.5f;
inline constexpr f64   kProjectileLifetimeMs  = 5000.0;
inline constexpr f64   kCorpseLingerMs        = 2000.0;
inline constexpr f64   kZoneTickMs            = 1000.0;
inline constexpr f32   kDropHeight            = 100.0f;

} // namespace dz::core

#endif // DZ_CORE_CONSTANTS_HPP
