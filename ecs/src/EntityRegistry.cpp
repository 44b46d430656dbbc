/**
 * @file EntityRegistry.cpp
 * @brief Entity slot arena with a LIFO free-list and generation counters.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/ecs/EntityRegistry.hpp>

#include <algorithm>
#include <vector>

namespace dz::ecs {

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct EntityRegistry::Impl
{
    struct Slot
    {
        core::u32 generation{0};
        bool      occupied{false};
        Entity    entity{};
    };

    std::vector<Slot>      slots;
    std::vector<core::u32> freeList;
    core::u32              capacity{0};
    core::u32              liveCount{0};

    explicit Impl(core::u32 cap)
        // The last slot index is reserved so that no handle equals EntityId::kNull.
        : capacity{std::min(cap, EntityId::kSlotMask)}
    {}

    Slot* resolve(EntityId id) noexcept
    {
        if (!id.isValid() || id.slot() >= slots.size())
        {
            return nullptr;
        }
        auto& s = slots[id.slot()];
        if (!s.occupied || s.generation != id.generation())
        {
            return nullptr;
        }
        return &s;
    }
};

// ========================================================================== //
//  EntityRegistry                                                            //
// ========================================================================== //

EntityRegistry::EntityRegistry(core::u32 capacity)
    : _impl{std::make_unique<Impl>(capacity)}
{}

EntityRegistry::~EntityRegistry() = default;

core::Expected<EntityId> EntityRegistry::create(std::string name, core::TimeMs now)
{
    core::u32 slot = 0;
    if (!_impl->freeList.empty())
    {
        slot = _impl->freeList.back();
        _impl->freeList.pop_back();
    }
    else
    {
        if (_impl->slots.size() >= _impl->capacity)
        {
            return core::makeError(core::ErrorCode::kOutOfMemory, "Entity slot pool exhausted");
        }
        slot = static_cast<core::u32>(_impl->slots.size());
        _impl->slots.emplace_back();
    }

    auto& s = _impl->slots[slot];
    s.occupied = true;

    const EntityId id{s.generation, slot};
    s.entity = Entity{id, std::move(name), true, now, now};

    ++_impl->liveCount;
    return id;
}

bool EntityRegistry::destroy(EntityId id) noexcept
{
    auto* s = _impl->resolve(id);
    if (s == nullptr)
    {
        return false;
    }
    s->entity.active = false;
    return true;
}

bool EntityRegistry::release(EntityId id) noexcept
{
    auto* s = _impl->resolve(id);
    if (s == nullptr)
    {
        return false;
    }

    s->occupied = false;
    s->entity   = Entity{};
    // Bump generation so stale EntityIds stop matching after recycle.
    s->generation = (s->generation + 1) & EntityId::kGenerationMask;
    _impl->freeList.push_back(id.slot());
    --_impl->liveCount;
    return true;
}

bool EntityRegistry::exists(EntityId id) const noexcept
{
    return _impl->resolve(id) != nullptr;
}

bool EntityRegistry::isActive(EntityId id) const noexcept
{
    const auto* s = _impl->resolve(id);
    return s != nullptr && s->entity.active;
}

Entity* EntityRegistry::get(EntityId id) noexcept
{
    auto* s = _impl->resolve(id);
    return s ? &s->entity : nullptr;
}

const Entity* EntityRegistry::get(EntityId id) const noexcept
{
    const auto* s = _impl->resolve(id);
    return s ? &s->entity : nullptr;
}

core::u32 EntityRegistry::liveCount() const noexcept
{
    return _impl->liveCount;
}

core::u32 EntityRegistry::activeCount() const noexcept
{
    return static_cast<core::u32>(std::count_if(
        _impl->slots.begin(), _impl->slots.end(),
        [](const Impl::Slot& s) { return s.occupied && s.entity.active; }));
}

core::u32 EntityRegistry::capacity() const noexcept
{
    return _impl->capacity;
}

void EntityRegistry::forEach(const std::function<void(const Entity&)>& fn) const
{
    for (const auto& s : _impl->slots)
    {
        if (s.occupied)
        {
            fn(s.entity);
        }
    }
}

void EntityRegistry::clear() noexcept
{
    for (core::u32 i = 0; i < _impl->slots.size(); ++i)
    {
        auto& s = _impl->slots[i];
        if (s.occupied)
        {
            release(s.entity.id);
        }
    }
}

} // namespace dz::ecs
