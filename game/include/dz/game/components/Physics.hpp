/**
 * @file Physics.hpp
 * @brief Rigid-body state integrated by the PhysicsSystem.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_PHYSICS_HPP
    #define DZ_GAME_COMPONENTS_PHYSICS_HPP

#include <dz/ecs/Component.hpp>
#include <dz/math/Vec3.hpp>
#include <dz/core/Types.hpp>

#include <string_view>

namespace dz::game {

enum class ColliderKind : core::u8
{
    Box = 0,
    Sphere,
    Capsule,
    Mesh
};

[[nodiscard]] constexpr std::string_view colliderName(ColliderKind kind) noexcept
{
    switch (kind)
    {
    case ColliderKind::Box:     return "box";
    case ColliderKind::Sphere:  return "sphere";
    case ColliderKind::Capsule: return "capsule";
    case ColliderKind::Mesh:    return "mesh";
    }
    return "unknown";
}

struct PhysicsComponent final : ecs::ComponentBase<ecs::ComponentId::Physics>
{
    math::Vec3f  velocity{};
    math::Vec3f  acceleration{};
    core::f32    mass{1.0f};
    ColliderKind collider{ColliderKind::Box};
    core::f32    restitution{0.5f};
    core::f32    friction{0.5f};
    bool         continuousCollision{false};
    bool         isStatic{false};
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_PHYSICS_HPP
