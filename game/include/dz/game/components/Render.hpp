/**
 * @file Render.hpp
 * @brief Visual description of an entity for the render scene.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_RENDER_HPP
    #define DZ_GAME_COMPONENTS_RENDER_HPP

#include <dz/ecs/Component.hpp>
#include <dz/render/IRenderScene.hpp>
#include <dz/core/Types.hpp>

namespace dz::game {

struct RenderComponent final : ecs::ComponentBase<ecs::ComponentId::Render>
{
    render::MeshKind mesh{render::MeshKind::Cube};
    core::u32        color{0xffffff};
    bool             visible{true};
    bool             castShadow{true};

    RenderComponent() = default;
    RenderComponent(render::MeshKind m, core::u32 c) : mesh{m}, color{c} {}
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_RENDER_HPP
