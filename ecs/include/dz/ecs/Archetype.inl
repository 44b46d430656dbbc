/**
 * @file Archetype.inl
 * @brief Inline implementations for Archetype.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-27
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ECS_ARCHETYPE_INL
    #define DZ_ECS_ARCHETYPE_INL

namespace dz::ecs {

inline Archetype::Archetype(std::initializer_list<ComponentId> ids) noexcept
{
    for (auto id : ids)
    {
        _mask.set(static_cast<core::usize>(id));
    }
}

inline void Archetype::add(ComponentId id) noexcept
{
    _mask.set(static_cast<core::usize>(id));
}

inline void Archetype::remove(ComponentId id) noexcept
{
    _mask.reset(static_cast<core::usize>(id));
}

inline bool Archetype::has(ComponentId id) const noexcept
{
    return _mask.test(static_cast<core::usize>(id));
}

inline bool Archetype::contains(const Archetype& other) const noexcept
{
    return (_mask & other._mask) == other._mask;
}

inline bool Archetype::intersects(const Archetype& other) const noexcept
{
    return (_mask & other._mask).any();
}

inline const Archetype::Mask& Archetype::mask() const noexcept
{
    return _mask;
}

inline core::usize Archetype::count() const noexcept
{
    return _mask.count();
}

inline bool Archetype::empty() const noexcept
{
    return _mask.none();
}

inline std::vector<ComponentId> Archetype::ids() const
{
    std::vector<ComponentId> out;
    out.reserve(_mask.count());
    for (core::usize i = 0; i < kMaxComponents; ++i)
    {
        if (_mask.test(i))
        {
            out.push_back(static_cast<ComponentId>(i));
        }
    }
    return out;
}

inline bool Archetype::operator==(const Archetype& other) const noexcept
{
    return _mask == other._mask;
}

} // namespace dz::ecs

#endif // DZ_ECS_ARCHETYPE_INL
