/**
 * @file ComponentStore.hpp
 * @brief Per-entity table of owned components, indexed by ComponentId.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ECS_COMPONENTSTORE_HPP
    #define DZ_ECS_COMPONENTSTORE_HPP

#include <dz/ecs/Archetype.hpp>
#include <dz/ecs/Component.hpp>
#include <dz/ecs/Entity.hpp>
#include <dz/core/NonCopyable.hpp>
#include <dz/core/Types.hpp>

#include <array>
#include <functional>
#include <memory>
#include <vector>

namespace dz::ecs {

/**
 * @class ComponentStore
 * @brief Maps (entity slot, ComponentId) to an owned component instance.
 *
 * The store is keyed by slot only and does not check generations or
 * liveness; the World validates every handle before reaching it and
 * erases a slot's row when the entity is purged.
 */
class ComponentStore final : public core::NonCopyable<ComponentStore>
{
public:
    ComponentStore() = default;

    /**
     * @brief Stores @p component under its type tag, replacing any previous
     *        component of the same type.
     * @return Non-owning pointer to the stored component.
     */
    Component* attach(EntityId entity, std::unique_ptr<Component> component);

    /**
     * @brief Destroys the component of type @p id.
     * @return false if the entity has no such component.
     */
    bool detach(EntityId entity, ComponentId id);

    [[nodiscard]] Component* get(EntityId entity, ComponentId id) const noexcept;

    template <ComponentType T>
    [[nodiscard]] T* get(EntityId entity) const noexcept
    {
        return static_cast<T*>(get(entity, T::kId));
    }

    [[nodiscard]] bool has(EntityId entity, ComponentId id) const noexcept;

    /** @brief Component types currently attached to @p entity. */
    [[nodiscard]] Archetype archetypeOf(EntityId entity) const noexcept;

    /** @brief Visits every component of @p entity in ComponentId order. */
    void forEach(EntityId entity, const std::function<void(const Component&)>& fn) const;

    /**
     * @brief Drops every component of @p entity.
     * @return Number of components destroyed.
     */
    core::usize erase(EntityId entity);

    /** @brief Total number of stored components. */
    [[nodiscard]] core::usize size() const noexcept { return _size; }

    /** @brief Number of stored components of type @p id. */
    [[nodiscard]] core::usize countOf(ComponentId id) const noexcept;

    void clear() noexcept;

private:
    struct Row
    {
        std::array<std::unique_ptr<Component>, kComponentCount> components{};
        Archetype                                               archetype{};
    };

    [[nodiscard]] const Row* row(EntityId entity) const noexcept;

    std::vector<Row> _rows;
    core::usize      _size{0};
};

} // namespace dz::ecs

#endif // DZ_ECS_COMPONENTSTORE_HPP
