/**
 * @file CameraSystem.hpp
 * @brief Drives the external camera from follow-mode camera rigs.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_CAMERASYSTEM_HPP
    #define DZ_GAME_SYSTEMS_CAMERASYSTEM_HPP

#include <dz/ecs/System.hpp>
#include <dz/render/IRenderScene.hpp>

namespace dz::game {

/**
 * @class CameraSystem
 * @brief Runs in the late pass so it sees this frame's final transforms.
 *
 * A null controller keeps the system running without side effects.
 */
class CameraSystem final : public ecs::System
{
public:
    CameraSystem(ecs::World& world, render::ICameraController* controller);

    void setController(render::ICameraController* controller) noexcept { _controller = controller; }

protected:
    core::Expected<void> onLateUpdate(core::f32 dt) override;

private:
    render::ICameraController* _controller;
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_CAMERASYSTEM_HPP
