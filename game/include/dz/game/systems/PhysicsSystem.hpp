/**
 * @file PhysicsSystem.hpp
 * @brief Gravity, semi-implicit Euler integration and ground clamp.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_PHYSICSSYSTEM_HPP
    #define DZ_GAME_SYSTEMS_PHYSICSSYSTEM_HPP

#include <dz/ecs/System.hpp>
#include <dz/core/Constants.hpp>

namespace dz::game {

class PhysicsSystem final : public ecs::System
{
public:
    struct Settings
    {
        core::f32 gravity{core::kGravity};
        /// Horizontal velocity multiplier applied once per update.
        core::f32 groundFriction{core::kGroundFriction};
    };

    explicit PhysicsSystem(ecs::World& world);
    PhysicsSystem(ecs::World& world, Settings settings);

    [[nodiscard]] const Settings& settings() const noexcept { return _settings; }

protected:
    core::Expected<void> onUpdate(core::f32 dt) override;

private:
    Settings _settings;
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_PHYSICSSYSTEM_HPP
