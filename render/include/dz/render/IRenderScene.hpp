/**
 * @file IRenderScene.hpp
 * @brief Scene and camera interfaces the simulation pushes visual state to.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_RENDER_IRENDERSCENE_HPP
    #define DZ_RENDER_IRENDERSCENE_HPP

#include <dz/ecs/Entity.hpp>
#include <dz/math/Quat.hpp>
#include <dz/math/Vec3.hpp>
#include <dz/core/Types.hpp>

#include <string_view>

namespace dz::render {

/**
 * @enum MeshKind
 * @brief Primitive shapes the scene can instance.
 */
enum class MeshKind : core::u8
{
    Cube = 0,
    Sphere,
    Terrain
};

[[nodiscard]] constexpr std::string_view meshName(MeshKind mesh) noexcept
{
    switch (mesh)
    {
    case MeshKind::Cube:    return "cube";
    case MeshKind::Sphere:  return "sphere";
    case MeshKind::Terrain: return "terrain";
    }
    return "unknown";
}

/**
 * @struct RenderInstance
 * @brief Per-entity visual state, pushed every frame.
 */
struct RenderInstance
{
    MeshKind    mesh{MeshKind::Cube};
    core::u32   color{0xffffff};
    math::Vec3f position{};
    math::Quatf rotation{};
    math::Vec3f scale{1.0f, 1.0f, 1.0f};
};

/**
 * @class IRenderScene
 * @brief Opaque render scene handle.
 *
 * Instances are keyed by entity. The scene owns meshes, materials and
 * batching; the simulation never reads back from it.
 */
class IRenderScene
{
public:
    virtual ~IRenderScene() = default;

    /** @brief Creates or updates the instance drawn for @p entity. */
    virtual void upsertInstance(ecs::EntityId entity, const RenderInstance& instance) = 0;

    /** @brief Drops the instance of @p entity, if any. */
    virtual void removeInstance(ecs::EntityId entity) = 0;
};

/**
 * @class ICameraController
 * @brief Camera setters the camera-follow logic drives.
 */
class ICameraController
{
public:
    virtual ~ICameraController() = default;

    virtual void setPosition(const math::Vec3f& position) = 0;
    virtual void setTarget(const math::Vec3f& target) = 0;
};

} // namespace dz::render

#endif // DZ_RENDER_IRENDERSCENE_HPP
