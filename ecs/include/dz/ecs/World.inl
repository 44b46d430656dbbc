/**
 * @file World.inl
 * @brief Template members of World.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-27
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ECS_WORLD_INL
    #define DZ_ECS_WORLD_INL

namespace dz::ecs {

template <ComponentType T, typename... Args>
T* World::emplaceComponent(EntityId id, Args&&... args)
{
    auto component = std::make_unique<T>(std::forward<Args>(args)...);
    T* raw = component.get();
    return addComponent(id, std::move(component)) ? raw : nullptr;
}

template <ComponentType T>
T* World::getComponent(EntityId id) const noexcept
{
    return static_cast<T*>(getComponent(id, T::kId));
}

template <typename T, typename... Args>
T& World::emplaceSystem(Args&&... args)
{
    static_assert(std::is_base_of_v<System, T>, "T must derive from ecs::System");
    auto system = std::make_unique<T>(*this, std::forward<Args>(args)...);
    T& ref = *system;
    addSystem(std::move(system));
    return ref;
}

template <typename T>
T* World::getSystem(std::string_view name) const noexcept
{
    return dynamic_cast<T*>(getSystem(name));
}

} // namespace dz::ecs

#endif // DZ_ECS_WORLD_INL
