/**
 * @file World.hpp
 * @brief The ECS orchestrator: owns entities, components and systems and
 *        drives the per-frame update passes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ECS_WORLD_HPP
    #define DZ_ECS_WORLD_HPP

#include <dz/ecs/ComponentStore.hpp>
#include <dz/ecs/EntityRegistry.hpp>
#include <dz/ecs/Query.hpp>
#include <dz/ecs/System.hpp>
#include <dz/core/Constants.hpp>
#include <dz/core/NonCopyable.hpp>
#include <dz/core/Types.hpp>

#include <functional>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dz::ecs {

/**
 * @struct WorldStats
 * @brief Counters and timings populated for debug overlays.
 */
struct WorldStats
{
    core::u32    entityCount{0};        ///< Unreleased entities.
    core::u32    activeEntityCount{0};
    core::usize  componentCount{0};
    core::usize  systemCount{0};
    core::usize  activeSystemCount{0};
    core::u64    frameCount{0};
    core::u64    fixedStepCount{0};
    core::f64    lastUpdateMs{0.0};     ///< Wall-clock cost of the last update().
    core::f64    avgUpdateMs{0.0};
    core::TimeMs simulatedTimeMs{0.0};
};

/**
 * @class World
 * @brief Sole owner of the entity registry, the component store and the
 *        system list.
 *
 * Frame order inside update():
 *  1. advance the simulated clock;
 *  2. resolve pending structural changes (new entities are matched against
 *     every system, destroyed entities leave every system and are purged);
 *  3. update pass in priority order;
 *  4. fixed-step catch-up passes while the accumulator holds a full step;
 *  5. late pass.
 *
 * Component attach / detach updates the entity's membership in every system
 * immediately. Entity creation and destruction only become structural at
 * the start of the next update().
 */
class World final : public core::NonMovable<World>
{
public:
    struct Settings
    {
        core::f32 fixedTimeStep{static_cast<core::f32>(core::kFixedTimeStep)};
        core::u32 maxEntities{core::kMaxEntities};
        core::u32 randomSeed{0x5eed};
    };

    World();
    explicit World(Settings settings);
    ~World();

    // --------------------------------------------------------------------- //
    //  Entities                                                              //
    // --------------------------------------------------------------------- //

    /**
     * @brief Creates an active entity, visible to systems from the next
     *        update() (or immediately through component attach).
     * @return The new id, or a null id when the slot pool is exhausted.
     */
    EntityId createEntity(std::string name = "Entity");

    /**
     * @brief Marks @p id inactive and schedules its removal.
     * @return false for unknown or already purged ids.
     */
    bool destroyEntity(EntityId id);

    [[nodiscard]] const Entity* getEntity(EntityId id) const noexcept;

    /** @brief True until the entity is purged. */
    [[nodiscard]] bool hasEntity(EntityId id) const noexcept;

    [[nodiscard]] bool isActive(EntityId id) const noexcept;

    /** @brief Visits every unpurged entity. */
    void forEachEntity(const std::function<void(const Entity&)>& fn) const;

    // --------------------------------------------------------------------- //
    //  Components                                                            //
    // --------------------------------------------------------------------- //

    /**
     * @brief Attaches @p component, replacing one of the same type.
     * @return false if the entity is unknown or inactive.
     */
    bool addComponent(EntityId id, std::unique_ptr<Component> component);

    /** @brief Constructs a component in place. @return nullptr on failure. */
    template <ComponentType T, typename... Args>
    T* emplaceComponent(EntityId id, Args&&... args);

    /** @return false if the entity does not carry a component of type @p cid. */
    bool removeComponent(EntityId id, ComponentId cid);

    template <ComponentType T>
    bool removeComponent(EntityId id) { return removeComponent(id, T::kId); }

    [[nodiscard]] Component* getComponent(EntityId id, ComponentId cid) const noexcept;

    /** @brief Typed accessor. Returns nullptr for purged or unknown ids. */
    template <ComponentType T>
    [[nodiscard]] T* getComponent(EntityId id) const noexcept;

    [[nodiscard]] bool hasComponent(EntityId id, ComponentId cid) const noexcept;

    template <ComponentType T>
    [[nodiscard]] bool hasComponent(EntityId id) const noexcept { return hasComponent(id, T::kId); }

    [[nodiscard]] Archetype archetypeOf(EntityId id) const noexcept;

    /** @brief Visits the components of @p id in ComponentId order. */
    void forEachComponent(EntityId id, const std::function<void(const Component&)>& fn) const;

    // --------------------------------------------------------------------- //
    //  Systems                                                               //
    // --------------------------------------------------------------------- //

    /**
     * @brief Takes ownership of @p system, initializes it and seeds its
     *        membership. A system with the same name is shut down and
     *        replaced.
     * @return Non-owning pointer to the stored system, or nullptr if
     *         @p system is null.
     */
    System* addSystem(std::unique_ptr<System> system);

    /** @brief Constructs a system of type @p T with this world injected. */
    template <typename T, typename... Args>
    T& emplaceSystem(Args&&... args);

    /** @brief Shuts down and removes the named system. */
    bool removeSystem(std::string_view name);

    [[nodiscard]] System* getSystem(std::string_view name) const noexcept;

    /** @brief Typed lookup. Returns nullptr if absent or of another type. */
    template <typename T>
    [[nodiscard]] T* getSystem(std::string_view name) const noexcept;

    [[nodiscard]] bool hasSystem(std::string_view name) const noexcept;

    /** @brief Systems in execution order. */
    [[nodiscard]] const std::vector<std::unique_ptr<System>>& systems() const noexcept { return _systems; }

    [[nodiscard]] std::vector<PerformanceReport> systemReports() const;

    // --------------------------------------------------------------------- //
    //  Frame                                                                 //
    // --------------------------------------------------------------------- //

    /** @brief Runs one frame. @p dt is the host-clamped delta in seconds. */
    void update(core::f32 dt);

    /** @brief Active entities matching @p query, scanning the registry. */
    [[nodiscard]] std::vector<EntityId> query(const Query& query) const;

    [[nodiscard]] WorldStats stats() const;

    /** @brief Simulated milliseconds elapsed over every update(). */
    [[nodiscard]] core::TimeMs timeMs() const noexcept { return _timeMs; }

    [[nodiscard]] core::f32 fixedTimeStep() const noexcept { return _settings.fixedTimeStep; }
    void setFixedTimeStep(core::f32 step) noexcept;

    /** @brief Seeded generator shared by every gameplay system. */
    [[nodiscard]] std::mt19937& random() noexcept { return _random; }

    /** @brief Shuts every system down and drops all entities and components. */
    void clear();

private:
    void notifyComponentChange(EntityId id);
    void processPending();
    void purge(EntityId id);
    void sortSystems();
    void report(const System& system, std::string_view pass, const core::Error& error) const;

    Settings                              _settings;
    EntityRegistry                        _registry;
    ComponentStore                        _store;
    std::vector<std::unique_ptr<System>>  _systems;

    std::vector<EntityId>                 _pendingAdditions;
    std::vector<EntityId>                 _pendingRemovals;

    std::mt19937                          _random;
    core::TimeMs                          _timeMs{0.0};
    core::f32                             _accumulator{0.0f};

    core::u64                             _frameCount{0};
    core::u64                             _fixedStepCount{0};
    core::f64                             _lastUpdateMs{0.0};
    core::f64                             _totalUpdateMs{0.0};
};

} // namespace dz::ecs

#include "World.inl"

#endif // DZ_ECS_WORLD_HPP
