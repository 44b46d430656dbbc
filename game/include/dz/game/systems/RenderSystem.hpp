/**
 * @file RenderSystem.hpp
 * @brief Mirrors visible entities into the external render scene.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_RENDERSYSTEM_HPP
    #define DZ_GAME_SYSTEMS_RENDERSYSTEM_HPP

#include <dz/ecs/System.hpp>
#include <dz/render/IRenderScene.hpp>

namespace dz::game {

class RenderSystem final : public ecs::System
{
public:
    RenderSystem(ecs::World& world, render::IRenderScene* scene);

    /** @brief Instances pushed to the scene during the last update. */
    [[nodiscard]] core::usize submittedInstances() const noexcept { return _submitted; }

    void setScene(render::IRenderScene* scene) noexcept { _scene = scene; }

protected:
    core::Expected<void> onUpdate(core::f32 dt) override;
    void onEntityRemoved(ecs::EntityId id) override;

private:
    render::IRenderScene* _scene;
    core::usize           _submitted{0};
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_RENDERSYSTEM_HPP
