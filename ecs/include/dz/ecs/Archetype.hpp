/**
 * @file Archetype.hpp
 * @brief Archetype definition: a set of component types.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ECS_ARCHETYPE_HPP
    #define DZ_ECS_ARCHETYPE_HPP

#include <dz/ecs/Component.hpp>
#include <dz/core/Types.hpp>

#include <bitset>
#include <initializer_list>
#include <vector>

namespace dz::ecs {

/**
 * @class Archetype
 * @brief Describes a combination of component types.
 *
 * Internally a fixed-size bitset where bit N corresponds to
 * @c ComponentId(N). Used both as the component set of an entity and as
 * the clauses of a Query.
 */
class Archetype final
{
public:
    static constexpr core::usize kMaxComponents = kComponentCount;

    using Mask = std::bitset<kMaxComponents>;

    /** @brief Default-constructs an empty archetype. */
    Archetype() noexcept = default;

    /**
     * @brief Constructs from a list of component IDs.
     * @param ids Component IDs that define this archetype.
     */
    Archetype(std::initializer_list<ComponentId> ids) noexcept;

    /** @brief Adds a component to the archetype. */
    void add(ComponentId id) noexcept;

    /** @brief Removes a component from the archetype. */
    void remove(ComponentId id) noexcept;

    /** @brief Tests whether the archetype contains a given component. */
    [[nodiscard]] bool has(ComponentId id) const noexcept;

    /** @brief Tests whether this archetype is a superset of @p other. */
    [[nodiscard]] bool contains(const Archetype& other) const noexcept;

    /** @brief Tests whether the two archetypes share at least one component. */
    [[nodiscard]] bool intersects(const Archetype& other) const noexcept;

    /** @brief Returns the raw bitmask. */
    [[nodiscard]] const Mask& mask() const noexcept;

    /** @brief Returns the number of component types in this archetype. */
    [[nodiscard]] core::usize count() const noexcept;

    [[nodiscard]] bool empty() const noexcept;

    /** @brief Lists the component ids in ascending order. */
    [[nodiscard]] std::vector<ComponentId> ids() const;

    [[nodiscard]] bool operator==(const Archetype& other) const noexcept;

private:
    Mask _mask{};
};

} // namespace dz::ecs

#include "Archetype.inl"

#endif // DZ_ECS_ARCHETYPE_HPP
