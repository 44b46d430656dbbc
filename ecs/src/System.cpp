/**
 * @file System.cpp
 * @brief System base implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/ecs/System.hpp>
#include <dz/ecs/World.hpp>

#include <algorithm>
#include <chrono>
#include <exception>

namespace dz::ecs {

System::System(World& world, std::string name, SystemPriority priority, Query query)
    : _world{world}
    , _name{std::move(name)}
    , _priority{priority}
    , _query{query}
{}

System::~System() = default;

// ========================================================================== //
//  Passes                                                                    //
// ========================================================================== //

core::Expected<void> System::update(core::f32 dt)        { return run(Pass::kUpdate, dt); }
core::Expected<void> System::fixedUpdate(core::f32 dt)   { return run(Pass::kFixed, dt); }
core::Expected<void> System::lateUpdate(core::f32 dt)    { return run(Pass::kLate, dt); }

core::Expected<void> System::onUpdate(core::f32)         { return {}; }
core::Expected<void> System::onFixedUpdate(core::f32)    { return {}; }
core::Expected<void> System::onLateUpdate(core::f32)     { return {}; }

core::Expected<void> System::run(Pass pass, core::f32 dt)
{
    if (!isActive() || _entities.empty())
    {
        return {};
    }

    const auto start = std::chrono::steady_clock::now();

    core::Expected<void> result{};
    try
    {
        switch (pass)
        {
        case Pass::kUpdate: result = onUpdate(dt);      break;
        case Pass::kFixed:  result = onFixedUpdate(dt); break;
        case Pass::kLate:   result = onLateUpdate(dt);  break;
        }
    }
    catch (const std::exception& e)
    {
        result = core::makeError(core::ErrorCode::kInternalError, e.what());
    }
    catch (...)
    {
        result = core::makeError(core::ErrorCode::kInternalError, "unknown exception");
    }

    const auto end = std::chrono::steady_clock::now();
    recordTiming(std::chrono::duration<core::f64, std::milli>(end - start).count());

    return result;
}

void System::recordTiming(core::f64 ms) noexcept
{
    _lastMs   = ms;
    _totalMs += ms;
    _maxMs    = std::max(_maxMs, ms);
    _minMs    = (_updateCount == 0) ? ms : std::min(_minMs, ms);
    ++_updateCount;
}

// ========================================================================== //
//  Membership                                                                //
// ========================================================================== //

bool System::matchesQuery(const Archetype& components) const noexcept
{
    return _query.matches(components);
}

bool System::addEntity(EntityId id)
{
    if (!_members.insert(id).second)
    {
        return false;
    }
    _entities.push_back(id);
    onEntityAdded(id);
    return true;
}

bool System::removeEntity(EntityId id)
{
    if (_members.erase(id) == 0)
    {
        return false;
    }
    _entities.erase(std::find(_entities.begin(), _entities.end(), id));
    onEntityRemoved(id);
    return true;
}

bool System::hasEntity(EntityId id) const noexcept
{
    return _members.contains(id);
}

void System::clearEntities()
{
    const auto members = _entities;
    for (auto id : members)
    {
        removeEntity(id);
    }
}

std::vector<EntityId> System::activeEntities() const
{
    std::vector<EntityId> out;
    out.reserve(_entities.size());
    for (auto id : _entities)
    {
        if (_world.isActive(id))
        {
            out.push_back(id);
        }
    }
    return out;
}

// ========================================================================== //
//  Metrics                                                                   //
// ========================================================================== //

PerformanceReport System::performanceReport() const
{
    PerformanceReport r;
    r.name        = _name;
    r.entityCount = _entities.size();
    r.updateCount = _updateCount;
    r.lastMs      = _lastMs;
    r.avgMs       = _updateCount ? _totalMs / static_cast<core::f64>(_updateCount) : 0.0;
    r.maxMs       = _maxMs;
    r.minMs       = _minMs;
    return r;
}

void System::resetMetrics() noexcept
{
    _updateCount = 0;
    _lastMs      = 0.0;
    _totalMs     = 0.0;
    _maxMs       = 0.0;
    _minMs       = 0.0;
}

} // namespace dz::ecs
