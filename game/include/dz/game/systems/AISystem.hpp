/**
 * @file AISystem.hpp
 * @brief Bot perception, reaction-delayed state machine and input synthesis.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_AISYSTEM_HPP
    #define DZ_GAME_SYSTEMS_AISYSTEM_HPP

#include <dz/ecs/System.hpp>
#include <dz/ecs/Query.hpp>
#include <dz/math/Vec3.hpp>

namespace dz::game {

struct AIComponent;
struct InputComponent;
struct TransformComponent;

/**
 * @class AISystem
 * @brief Each update a bot refreshes its perception, re-decides its state
 *        once per reaction interval, then writes the state's intent into its
 *        own InputComponent. Bots without an InputComponent are skipped.
 *
 * Decision table, first match wins:
 * | condition                                   | next state                  |
 * |---------------------------------------------|-----------------------------|
 * | enemy < closeRange, health > 30, aggr > 0.5 | combat, +5 s                |
 * | enemy < closeRange                          | retreat                     |
 * | enemy < engageRange, aggr > 0.7             | combat, +3 s                |
 * | enemy < engageRange                         | search, +10 s               |
 * | search past its timeout                     | patrol                      |
 * | combat past its timeout                     | search, +8 s                |
 * | retreat with health > 50                    | patrol                      |
 * | patrol with loot < lootRange                | loot                        |
 * | loot with no loot < lootRange               | patrol                      |
 *
 * In combat the bot also turns to face its target through @c lookX, so the
 * WeaponSystem fires along the line of sight.
 */
class AISystem final : public ecs::System
{
public:
    struct Settings
    {
        /// Entities a bot may consider as enemies.
        ecs::Query perceptionQuery{ecs::Query::with({ecs::ComponentId::Transform})};
        core::f32  detectionRange{50.0f};
        core::f32  closeRange{10.0f};
        core::f32  engageRange{30.0f};
        core::f32  lootRange{5.0f};
        core::f32  patrolRadius{10.0f};
        core::f32  waypointTolerance{2.0f};
        core::f32  searchArrival{1.0f};
        core::f32  strafeChance{0.3f};
        core::f32  axisThreshold{0.1f};
    };

    explicit AISystem(ecs::World& world);
    AISystem(ecs::World& world, Settings settings);

    [[nodiscard]] const Settings& settings() const noexcept { return _settings; }

protected:
    core::Expected<void> onUpdate(core::f32 dt) override;

private:
    void perceive(ecs::EntityId self, const TransformComponent& transform, AIComponent& ai);
    void decide(const TransformComponent& transform, AIComponent& ai, core::TimeMs now);
    void act(const TransformComponent& transform, AIComponent& ai, InputComponent& input);

    void steer(const TransformComponent& transform, const math::Vec3f& direction, InputComponent& input) const;
    void buildPatrolRoute(const TransformComponent& transform, AIComponent& ai) const;

    Settings _settings;
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_AISYSTEM_HPP
