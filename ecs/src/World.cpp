/**
 * @file World.cpp
 * @brief World scheduler implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/ecs/World.hpp>
#include <dz/core/Log.hpp>

#include <algorithm>
#include <chrono>

namespace dz::ecs {

World::World()
    : World(Settings{})
{}

World::World(Settings settings)
    : _settings{settings}
    , _registry{settings.maxEntities}
    , _random{settings.randomSeed}
{
    if (_settings.fixedTimeStep <= 0.0f)
    {
        _settings.fixedTimeStep = static_cast<core::f32>(core::kFixedTimeStep);
    }
}

World::~World()
{
    clear();
}

// ========================================================================== //
//  Entities                                                                  //
// ========================================================================== //

EntityId World::createEntity(std::string name)
{
    auto result = _registry.create(std::move(name), _timeMs);
    if (!result.has_value())
    {
        core::Log::error("World", "createEntity failed: " + result.error().message());
        return EntityId{};
    }
    _pendingAdditions.push_back(*result);
    return *result;
}

bool World::destroyEntity(EntityId id)
{
    Entity* entity = _registry.get(id);
    if (entity == nullptr)
    {
        return false;
    }
    if (!entity->active)
    {
        return true;
    }

    _registry.destroy(id);
    entity->lastModified = _timeMs;
    _pendingRemovals.push_back(id);
    return true;
}

const Entity* World::getEntity(EntityId id) const noexcept
{
    return _registry.get(id);
}

bool World::hasEntity(EntityId id) const noexcept
{
    return _registry.exists(id);
}

bool World::isActive(EntityId id) const noexcept
{
    return _registry.isActive(id);
}

void World::forEachEntity(const std::function<void(const Entity&)>& fn) const
{
    _registry.forEach(fn);
}

// ========================================================================== //
//  Components                                                                //
// ========================================================================== //

bool World::addComponent(EntityId id, std::unique_ptr<Component> component)
{
    if (!component || !_registry.isActive(id))
    {
        return false;
    }

    _store.attach(id, std::move(component));
    _registry.get(id)->lastModified = _timeMs;
    notifyComponentChange(id);
    return true;
}

bool World::removeComponent(EntityId id, ComponentId cid)
{
    if (!_registry.exists(id) || !_store.has(id, cid))
    {
        return false;
    }

    // Members that stop matching leave before the detach so their removal
    // hook can still read the component.
    Archetype remaining = _store.archetypeOf(id);
    remaining.remove(cid);
    const bool active = _registry.isActive(id);
    for (auto& system : _systems)
    {
        if (system->hasEntity(id) && !(active && system->matchesQuery(remaining)))
        {
            system->removeEntity(id);
        }
    }

    _store.detach(id, cid);
    _registry.get(id)->lastModified = _timeMs;
    notifyComponentChange(id);
    return true;
}

Component* World::getComponent(EntityId id, ComponentId cid) const noexcept
{
    return _registry.exists(id) ? _store.get(id, cid) : nullptr;
}

bool World::hasComponent(EntityId id, ComponentId cid) const noexcept
{
    return _registry.exists(id) && _store.has(id, cid);
}

Archetype World::archetypeOf(EntityId id) const noexcept
{
    return _registry.exists(id) ? _store.archetypeOf(id) : Archetype{};
}

void World::forEachComponent(EntityId id, const std::function<void(const Component&)>& fn) const
{
    if (_registry.exists(id))
    {
        _store.forEach(id, fn);
    }
}

void World::notifyComponentChange(EntityId id)
{
    const Archetype components = _store.archetypeOf(id);
    const bool active = _registry.isActive(id);

    for (auto& system : _systems)
    {
        const bool matches = active && system->matchesQuery(components);
        const bool member  = system->hasEntity(id);

        if (matches && !member)
        {
            system->addEntity(id);
        }
        else if (!matches && member)
        {
            system->removeEntity(id);
        }
    }
}

// ========================================================================== //
//  Systems                                                                   //
// ========================================================================== //

System* World::addSystem(std::unique_ptr<System> system)
{
    if (!system)
    {
        core::Log::error("World", "addSystem called with a null system");
        return nullptr;
    }

    if (hasSystem(system->name()))
    {
        core::Log::warn("World", "Replacing system " + system->name());
        removeSystem(system->name());
    }

    System* raw = system.get();
    _systems.push_back(std::move(system));
    sortSystems();

    _registry.forEach([&](const Entity& e) {
        if (e.active && raw->matchesQuery(_store.archetypeOf(e.id)))
        {
            raw->addEntity(e.id);
        }
    });

    raw->onInitialize();
    core::Log::debug("World", "Added system " + raw->name() + " (" +
                              std::string(priorityName(raw->priority())) + ")");
    return raw;
}

bool World::removeSystem(std::string_view name)
{
    auto it = std::find_if(_systems.begin(), _systems.end(),
                           [&](const auto& s) { return s->name() == name; });
    if (it == _systems.end())
    {
        return false;
    }

    (*it)->onShutdown();
    _systems.erase(it);
    sortSystems();
    return true;
}

System* World::getSystem(std::string_view name) const noexcept
{
    for (const auto& s : _systems)
    {
        if (s->name() == name)
        {
            return s.get();
        }
    }
    return nullptr;
}

bool World::hasSystem(std::string_view name) const noexcept
{
    return getSystem(name) != nullptr;
}

std::vector<PerformanceReport> World::systemReports() const
{
    std::vector<PerformanceReport> reports;
    reports.reserve(_systems.size());
    for (const auto& s : _systems)
    {
        reports.push_back(s->performanceReport());
    }
    return reports;
}

void World::sortSystems()
{
    // Stable: systems of equal priority keep their insertion order.
    std::stable_sort(_systems.begin(), _systems.end(), [](const auto& a, const auto& b) {
        return static_cast<core::u8>(a->priority()) > static_cast<core::u8>(b->priority());
    });
}

// ========================================================================== //
//  Frame                                                                     //
// ========================================================================== //

void World::update(core::f32 dt)
{
    const auto start = std::chrono::steady_clock::now();

    _timeMs += static_cast<core::f64>(dt) * 1000.0;

    processPending();

    for (core::usize i = 0; i < _systems.size(); ++i)
    {
        System& system = *_systems[i];
        if (!system.isActive())
            continue;
        if (auto r = system.update(dt); !r)
            report(system, "update", r.error());
    }

    const core::f32 step = _settings.fixedTimeStep;
    std::vector<const System*> failed;
    _accumulator += dt;
    while (_accumulator >= step)
    {
        for (core::usize i = 0; i < _systems.size(); ++i)
        {
            System& system = *_systems[i];
            if (!system.isActive())
                continue;
            if (std::find(failed.begin(), failed.end(), &system) != failed.end())
                continue;
            if (auto r = system.fixedUpdate(step); !r)
            {
                report(system, "fixedUpdate", r.error());
                failed.push_back(&system);
            }
        }
        _accumulator -= step;
        ++_fixedStepCount;
    }

    for (core::usize i = 0; i < _systems.size(); ++i)
    {
        System& system = *_systems[i];
        if (!system.isActive())
            continue;
        if (auto r = system.lateUpdate(dt); !r)
            report(system, "lateUpdate", r.error());
    }

    ++_frameCount;
    const auto end = std::chrono::steady_clock::now();
    _lastUpdateMs   = std::chrono::duration<core::f64, std::milli>(end - start).count();
    _totalUpdateMs += _lastUpdateMs;
}

void World::processPending()
{
    for (auto id : _pendingAdditions)
    {
        if (!_registry.isActive(id))
            continue;

        const Archetype components = _store.archetypeOf(id);
        for (auto& system : _systems)
        {
            if (system->matchesQuery(components))
            {
                system->addEntity(id);
            }
        }
    }
    _pendingAdditions.clear();

    // Removal hooks may destroy further entities; those are purged next frame.
    std::vector<EntityId> removals;
    removals.swap(_pendingRemovals);
    for (auto id : removals)
    {
        purge(id);
    }
}

void World::purge(EntityId id)
{
    for (auto& system : _systems)
    {
        system->removeEntity(id);
    }
    _store.erase(id);
    _registry.release(id);
}

void World::report(const System& system, std::string_view pass, const core::Error& error) const
{
    core::Log::error("World", system.name() + " " + std::string(pass) + " failed: " +
                              std::string(core::errorCodeName(error.code())) + ": " + error.message());
}

std::vector<EntityId> World::query(const Query& q) const
{
    std::vector<EntityId> result;
    _registry.forEach([&](const Entity& e) {
        if (e.active && q.matches(_store.archetypeOf(e.id)))
        {
            result.push_back(e.id);
        }
    });
    return result;
}

WorldStats World::stats() const
{
    WorldStats s;
    s.entityCount       = _registry.liveCount();
    s.activeEntityCount = _registry.activeCount();
    s.componentCount    = _store.size();
    s.systemCount       = _systems.size();
    s.activeSystemCount = static_cast<core::usize>(std::count_if(
        _systems.begin(), _systems.end(), [](const auto& sys) { return sys->isActive(); }));
    s.frameCount        = _frameCount;
    s.fixedStepCount    = _fixedStepCount;
    s.lastUpdateMs      = _lastUpdateMs;
    s.avgUpdateMs       = _frameCount ? _totalUpdateMs / static_cast<core::f64>(_frameCount) : 0.0;
    s.simulatedTimeMs   = _timeMs;
    return s;
}

void World::setFixedTimeStep(core::f32 step) noexcept
{
    if (step > 0.0f)
    {
        _settings.fixedTimeStep = step;
    }
}

void World::clear()
{
    for (auto& system : _systems)
    {
        system->onShutdown();
    }
    _systems.clear();
    _store.clear();
    _registry.clear();
    _pendingAdditions.clear();
    _pendingRemovals.clear();
    _accumulator = 0.0f;
}

} // namespace dz::ecs
