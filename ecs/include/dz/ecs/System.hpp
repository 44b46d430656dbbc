/**
 * @file System.hpp
 * @brief System base class: lifecycle, query membership and timing.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ECS_SYSTEM_HPP
    #define DZ_ECS_SYSTEM_HPP

#include <dz/ecs/Query.hpp>
#include <dz/ecs/Entity.hpp>
#include <dz/core/Expected.hpp>
#include <dz/core/NonCopyable.hpp>
#include <dz/core/Types.hpp>

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace dz::ecs {

class World;

/**
 * @enum SystemPriority
 * @brief Execution rank within a frame. Higher values run first.
 */
enum class SystemPriority : core::u8
{
    kLow      = 0,
    kNormal   = 1,
    kHigh     = 2,
    kCritical = 3
};

[[nodiscard]] constexpr std::string_view priorityName(SystemPriority p) noexcept
{
    switch (p)
    {
    case SystemPriority::kLow:      return "low";
    case SystemPriority::kNormal:   return "normal";
    case SystemPriority::kHigh:     return "high";
    case SystemPriority::kCritical: return "critical";
    }
    return "unknown";
}

/**
 * @struct PerformanceReport
 * @brief Timing snapshot of one system, for diagnostics overlays.
 *
 * Times are wall-clock milliseconds per invocation. @c minMs reads 0 until
 * the first invocation.
 */
struct PerformanceReport
{
    std::string name;
    core::usize entityCount{0};
    core::u64   updateCount{0};
    core::f64   lastMs{0.0};
    core::f64   avgMs{0.0};
    core::f64   maxMs{0.0};
    core::f64   minMs{0.0};
};

/**
 * @class System
 * @brief Base of every gameplay system.
 *
 * A system declares a Query; the World keeps its entity membership in sync
 * with component changes. The public update / fixedUpdate / lateUpdate
 * wrappers are no-ops while the system is inactive, disabled or has no
 * members, and otherwise run the matching hook, time it and turn any
 * escaping std::exception into an Error so that one failing system never
 * takes the frame down.
 */
class System : public core::NonMovable<System>
{
public:
    /**
     * @param world    Owning world, injected at construction.
     * @param name     Unique name used for lookup and logs.
     * @param priority Execution rank.
     * @param query    Membership filter.
     */
    System(World& world, std::string name, SystemPriority priority, Query query);
    virtual ~System();

    // --------------------------------------------------------------------- //
    //  Passes                                                                //
    // --------------------------------------------------------------------- //

    core::Expected<void> update(core::f32 dt);
    core::Expected<void> fixedUpdate(core::f32 fixedDt);
    core::Expected<void> lateUpdate(core::f32 dt);

    // --------------------------------------------------------------------- //
    //  Membership                                                            //
    // --------------------------------------------------------------------- //

    [[nodiscard]] bool matchesQuery(const Archetype& components) const noexcept;

    /** @brief Adds @p id to the member set. @return false if already a member. */
    bool addEntity(EntityId id);

    /** @brief Removes @p id from the member set. @return false if not a member. */
    bool removeEntity(EntityId id);

    [[nodiscard]] bool hasEntity(EntityId id) const noexcept;

    /** @brief Members in insertion order. */
    [[nodiscard]] const std::vector<EntityId>& entities() const noexcept { return _entities; }

    [[nodiscard]] core::usize entityCount() const noexcept { return _entities.size(); }

    void clearEntities();

    // --------------------------------------------------------------------- //
    //  Lifecycle hooks                                                       //
    // --------------------------------------------------------------------- //

    /** @brief Called once when the system is added to a World. */
    virtual void onInitialize() {}

    /** @brief Called when the system is removed or the World is cleared. */
    virtual void onShutdown() {}

    // --------------------------------------------------------------------- //
    //  State                                                                 //
    // --------------------------------------------------------------------- //

    [[nodiscard]] const std::string& name()     const noexcept { return _name; }
    [[nodiscard]] SystemPriority     priority() const noexcept { return _priority; }
    [[nodiscard]] const Query&       query()    const noexcept { return _query; }

    void setActive(bool active) noexcept { _active = active; }
    void setEnabled(bool enabled) noexcept { _enabled = enabled; }
    [[nodiscard]] bool isActive()  const noexcept { return _active && _enabled; }
    [[nodiscard]] bool isEnabled() const noexcept { return _enabled; }

    [[nodiscard]] PerformanceReport performanceReport() const;
    void resetMetrics() noexcept;

protected:
    virtual core::Expected<void> onUpdate(core::f32 dt);
    virtual core::Expected<void> onFixedUpdate(core::f32 fixedDt);
    virtual core::Expected<void> onLateUpdate(core::f32 dt);

    virtual void onEntityAdded(EntityId /*id*/) {}
    virtual void onEntityRemoved(EntityId /*id*/) {}

    [[nodiscard]] World& world() const noexcept { return _world; }

    /**
     * @brief Snapshot of the members that are still active.
     *
     * Hooks iterate this copy so that entities created or destroyed during
     * the pass do not invalidate the loop.
     */
    [[nodiscard]] std::vector<EntityId> activeEntities() const;

private:
    enum class Pass : core::u8 { kUpdate, kFixed, kLate };

    core::Expected<void> run(Pass pass, core::f32 dt);
    void recordTiming(core::f64 ms) noexcept;

    World&                       _world;
    std::string                  _name;
    SystemPriority               _priority;
    Query                        _query;
    bool                         _active{true};
    bool                         _enabled{true};

    std::vector<EntityId>        _entities;
    std::unordered_set<EntityId> _members;

    core::u64                    _updateCount{0};
    core::f64                    _lastMs{0.0};
    core::f64                    _totalMs{0.0};
    core::f64                    _maxMs{0.0};
    core::f64                    _minMs{0.0};
};

} // namespace dz::ecs

#endif // DZ_ECS_SYSTEM_HPP
