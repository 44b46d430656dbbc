/**
 * @file EntityRegistry.hpp
 * @brief Entity slot arena: creates, deactivates, releases and locates
 *        entities.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ECS_ENTITYREGISTRY_HPP
    #define DZ_ECS_ENTITYREGISTRY_HPP

#include <dz/ecs/Entity.hpp>
#include <dz/core/Expected.hpp>
#include <dz/core/NonCopyable.hpp>
#include <dz/core/Types.hpp>

#include <functional>
#include <memory>
#include <string>

namespace dz::ecs {

/**
 * @class EntityRegistry
 * @brief Owns the entity slots, the free-list and the generation table.
 *
 * Destruction is two-phase. destroy() only clears the active flag; the
 * World later calls release(), which bumps the slot generation and
 * recycles the slot, so every EntityId handed out before the release
 * stops resolving.
 */
class EntityRegistry final : public core::NonCopyable<EntityRegistry>
{
public:
    /**
     * @param capacity Maximum number of simultaneously live entities
     *                 (clamped to the slot space of EntityId).
     */
    explicit EntityRegistry(core::u32 capacity = core::kMaxEntities);
    ~EntityRegistry();

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /**
     * @brief Creates a new active entity.
     * @param name Display name.
     * @param now  Creation timestamp (World clock, ms).
     * @return Entity identifier, or kOutOfMemory when every slot is taken.
     */
    [[nodiscard]] core::Expected<EntityId> create(std::string name, core::TimeMs now);

    /**
     * @brief Marks an entity inactive.
     * @return false if the id does not resolve; true otherwise, including
     *         when the entity was already inactive.
     */
    bool destroy(EntityId id) noexcept;

    /**
     * @brief Structurally removes an entity and recycles its slot.
     * @return false if the id does not resolve.
     */
    bool release(EntityId id) noexcept;

    // --------------------------------------------------------------------- //
    //  Lookup                                                                //
    // --------------------------------------------------------------------- //

    /** @brief Tests whether the id resolves to an unreleased entity. */
    [[nodiscard]] bool exists(EntityId id) const noexcept;

    /** @brief Tests whether the entity exists and is still active. */
    [[nodiscard]] bool isActive(EntityId id) const noexcept;

    [[nodiscard]] Entity*       get(EntityId id) noexcept;
    [[nodiscard]] const Entity* get(EntityId id) const noexcept;

    /** @brief Number of unreleased entities (active or pending removal). */
    [[nodiscard]] core::u32 liveCount() const noexcept;

    /** @brief Number of active entities. */
    [[nodiscard]] core::u32 activeCount() const noexcept;

    [[nodiscard]] core::u32 capacity() const noexcept;

    /** @brief Visits every unreleased entity in slot order. */
    void forEach(const std::function<void(const Entity&)>& fn) const;

    /** @brief Releases every entity. */
    void clear() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace dz::ecs

#endif // DZ_ECS_ENTITYREGISTRY_HPP
