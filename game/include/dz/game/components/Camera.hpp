/**
 * @file Camera.hpp
 * @brief Camera rig description consumed by the CameraSystem.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_CAMERA_HPP
    #define DZ_GAME_COMPONENTS_CAMERA_HPP

#include <dz/ecs/Component.hpp>
#include <dz/ecs/Entity.hpp>
#include <dz/math/Vec3.hpp>
#include <dz/core/Types.hpp>

#include <string_view>

namespace dz::game {

enum class CameraMode : core::u8
{
    Follow = 0,
    Free,
    Orbit
};

[[nodiscard]] constexpr std::string_view cameraModeName(CameraMode mode) noexcept
{
    switch (mode)
    {
    case CameraMode::Follow: return "follow";
    case CameraMode::Free:   return "free";
    case CameraMode::Orbit:  return "orbit";
    }
    return "unknown";
}

struct CameraComponent final : ecs::ComponentBase<ecs::ComponentId::Camera>
{
    CameraMode    mode{CameraMode::Follow};
    ecs::EntityId target{};
    math::Vec3f   offset{0.0f, 5.0f, -10.0f};
    core::f32     fov{75.0f};
    core::f32     nearPlane{0.1f};
    core::f32     farPlane{1000.0f};
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_CAMERA_HPP
