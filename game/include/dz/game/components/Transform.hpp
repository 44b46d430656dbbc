/**
 * @file Transform.hpp
 * @brief Position, orientation and scale of an entity.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_TRANSFORM_HPP
    #define DZ_GAME_COMPONENTS_TRANSFORM_HPP

#include <dz/ecs/Component.hpp>
#include <dz/math/Quat.hpp>
#include <dz/math/Vec3.hpp>

namespace dz::game {

struct TransformComponent final : ecs::ComponentBase<ecs::ComponentId::Transform>
{
    math::Vec3f position{};
    math::Quatf rotation{};
    math::Vec3f scale{1.0f, 1.0f, 1.0f};

    TransformComponent() = default;
    explicit TransformComponent(math::Vec3f pos,
                                math::Quatf rot = math::Quatf::identity(),
                                math::Vec3f scl = math::Vec3f::one())
        : position{pos}, rotation{rot}, scale{scl}
    {}
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_TRANSFORM_HPP
