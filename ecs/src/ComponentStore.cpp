/**
 * @file ComponentStore.cpp
 * @brief ComponentStore implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/core/Assert.hpp>
#include <dz/ecs/ComponentStore.hpp>

namespace dz::ecs {

Component* ComponentStore::attach(EntityId entity, std::unique_ptr<Component> component)
{
    if (!component || !entity.isValid())
    {
        return nullptr;
    }

    const core::u32 slot = entity.slot();
    if (slot >= _rows.size())
    {
        _rows.resize(static_cast<core::usize>(slot) + 1);
    }

    const ComponentId id = component->componentId();
    const auto idx = static_cast<core::usize>(id);
    DZ_ASSERT(idx < kComponentCount);
    auto& r = _rows[slot];

    if (r.components[idx])
    {
        r.components[idx]->setOwner(EntityId{});
    }
    else
    {
        ++_size;
    }

    component->setOwner(entity);
    r.components[idx] = std::move(component);
    r.archetype.add(id);
    return r.components[idx].get();
}

bool ComponentStore::detach(EntityId entity, ComponentId id)
{
    if (!entity.isValid() || entity.slot() >= _rows.size())
    {
        return false;
    }

    auto& r = _rows[entity.slot()];
    auto& slot = r.components[static_cast<core::usize>(id)];
    if (!slot)
    {
        return false;
    }

    slot->setOwner(EntityId{});
    slot.reset();
    r.archetype.remove(id);
    --_size;
    return true;
}

Component* ComponentStore::get(EntityId entity, ComponentId id) const noexcept
{
    const Row* r = row(entity);
    return r ? r->components[static_cast<core::usize>(id)].get() : nullptr;
}

bool ComponentStore::has(EntityId entity, ComponentId id) const noexcept
{
    const Row* r = row(entity);
    return r != nullptr && r->archetype.has(id);
}

Archetype ComponentStore::archetypeOf(EntityId entity) const noexcept
{
    const Row* r = row(entity);
    return r ? r->archetype : Archetype{};
}

void ComponentStore::forEach(EntityId entity, const std::function<void(const Component&)>& fn) const
{
    const Row* r = row(entity);
    if (r == nullptr)
    {
        return;
    }
    for (const auto& c : r->components)
    {
        if (c)
        {
            fn(*c);
        }
    }
}

core::usize ComponentStore::erase(EntityId entity)
{
    if (!entity.isValid() || entity.slot() >= _rows.size())
    {
        return 0;
    }

    auto& r = _rows[entity.slot()];
    core::usize removed = 0;
    for (auto& c : r.components)
    {
        if (c)
        {
            c->setOwner(EntityId{});
            c.reset();
            ++removed;
        }
    }
    r.archetype = Archetype{};
    _size -= removed;
    return removed;
}

core::usize ComponentStore::countOf(ComponentId id) const noexcept
{
    core::usize n = 0;
    for (const auto& r : _rows)
    {
        if (r.archetype.has(id))
        {
            ++n;
        }
    }
    return n;
}

void ComponentStore::clear() noexcept
{
    _rows.clear();
    _size = 0;
}

const ComponentStore::Row* ComponentStore::row(EntityId entity) const noexcept
{
    if (!entity.isValid() || entity.slot() >= _rows.size())
    {
        return nullptr;
    }
    return &_rows[entity.slot()];
}

} // namespace dz::ecs
