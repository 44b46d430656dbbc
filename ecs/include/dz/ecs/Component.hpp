/**
 * @file Component.hpp
 * @brief Component type tags and the polymorphic component base.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_ECS_COMPONENT_HPP
    #define DZ_ECS_COMPONENT_HPP

#include <dz/ecs/Entity.hpp>
#include <dz/core/Types.hpp>

#include <concepts>
#include <string_view>

namespace dz::ecs {

/**
 * @enum ComponentId
 * @brief Compile-time enumeration of all known component types.
 *
 * Adding a new component requires appending to this enum and to
 * componentName().
 */
enum class ComponentId : core::u16
{
    Transform    = 0,
    Physics      = 1,
    Input        = 2,
    Camera       = 3,
    Render       = 4,
    Health       = 5,
    Weapon       = 6,
    Collision    = 7,
    Destructible = 8,
    AI           = 9,
    BattleRoyale = 10,
    Progression  = 11,
    Audio        = 12,
    Loot         = 13,

    Count
};

inline constexpr core::usize kComponentCount = static_cast<core::usize>(ComponentId::Count);

/** @brief Display name of a component type (logs, debug dumps). */
[[nodiscard]] constexpr std::string_view componentName(ComponentId id) noexcept
{
    switch (id)
    {
    case ComponentId::Transform:    return "Transform";
    case ComponentId::Physics:      return "Physics";
    case ComponentId::Input:        return "Input";
    case ComponentId::Camera:       return "Camera";
    case ComponentId::Render:       return "Render";
    case ComponentId::Health:       return "Health";
    case ComponentId::Weapon:       return "Weapon";
    case ComponentId::Collision:    return "Collision";
    case ComponentId::Destructible: return "Destructible";
    case ComponentId::AI:           return "AI";
    case ComponentId::BattleRoyale: return "BattleRoyale";
    case ComponentId::Progression:  return "Progression";
    case ComponentId::Audio:        return "Audio";
    case ComponentId::Loot:         return "Loot";
    case ComponentId::Count:        break;
    }
    return "Unknown";
}

/**
 * @class Component
 * @brief Base of every component instance.
 *
 * A component belongs to at most one entity. It knows its owner id but
 * never the World; all structural changes go through the World.
 */
class Component
{
public:
    virtual ~Component() = default;

    /** @brief Returns the type tag of the concrete component. */
    [[nodiscard]] virtual ComponentId componentId() const noexcept = 0;

    /** @brief Returns the owning entity, or a null id when detached. */
    [[nodiscard]] EntityId owner() const noexcept { return _owner; }

    /** @brief Set by the ComponentStore on attach / detach. */
    void setOwner(EntityId owner) noexcept { _owner = owner; }

protected:
    Component() = default;
    Component(const Component &) = default;
    Component &operator=(const Component &) = default;

private:
    EntityId _owner{};
};

/**
 * @class ComponentBase
 * @brief Binds a concrete component type to its ComponentId tag.
 * @tparam Id Type tag exposed as @c kId.
 */
template <ComponentId Id>
class ComponentBase : public Component
{
public:
    static constexpr ComponentId kId = Id;

    [[nodiscard]] ComponentId componentId() const noexcept override { return Id; }
};

/**
 * @brief A concrete component type usable with the typed World accessors.
 */
template <typename T>
concept ComponentType = std::derived_from<T, Component> && requires {
    { T::kId } -> std::convertible_to<ComponentId>;
};

} // namespace dz::ecs

#endif // DZ_ECS_COMPONENT_HPP
