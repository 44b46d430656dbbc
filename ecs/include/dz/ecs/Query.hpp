/**
 * @file Query.hpp
 * @brief {all, any, none} filter over component types.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ECS_QUERY_HPP
    #define DZ_ECS_QUERY_HPP

#include <dz/ecs/Archetype.hpp>

#include <initializer_list>

namespace dz::ecs {

/**
 * @struct Query
 * @brief Component filter deciding system membership and ad-hoc lookups.
 *
 * - @c all  : the entity carries every listed type.
 * - @c any  : the entity carries at least one listed type (vacuously true
 *             when empty).
 * - @c none : the entity carries none of the listed types.
 *
 * The three clauses combine with AND.
 */
struct Query
{
    Archetype all{};
    Archetype any{};
    Archetype none{};

    /** @brief Starts a query from its @c all clause. */
    [[nodiscard]] static Query with(std::initializer_list<ComponentId> ids)
    {
        Query q;
        q.all = Archetype(ids);
        return q;
    }

    /** @brief Returns a copy with @p ids appended to the @c any clause. */
    [[nodiscard]] Query anyOf(std::initializer_list<ComponentId> ids) const
    {
        Query q = *this;
        for (auto id : ids)
            q.any.add(id);
        return q;
    }

    /** @brief Returns a copy with @p ids appended to the @c none clause. */
    [[nodiscard]] Query without(std::initializer_list<ComponentId> ids) const
    {
        Query q = *this;
        for (auto id : ids)
            q.none.add(id);
        return q;
    }

    [[nodiscard]] bool matches(const Archetype& components) const noexcept
    {
        if (!components.contains(all))
            return false;
        if (!any.empty() && !components.intersects(any))
            return false;
        return !components.intersects(none);
    }
};

} // namespace dz::ecs

#endif // DZ_ECS_QUERY_HPP
