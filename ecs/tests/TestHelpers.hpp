/**
 * @file TestHelpers.hpp
 * @brief Components, systems and a capturing logger shared by the ECS tests.
 */

#pragma once

#ifndef DZ_ECS_TESTS_TEST_HELPERS_HPP
    #define DZ_ECS_TESTS_TEST_HELPERS_HPP

#include "dz/core/Log.hpp"
#include "dz/ecs/World.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace dz::ecs::test {

// Three stand-in component types, reusing existing tags.
struct A final : ComponentBase<ComponentId::Transform> { int value{0}; };
struct B final : ComponentBase<ComponentId::Physics>   { int value{0}; };
struct C final : ComponentBase<ComponentId::Health>    { int value{0}; };

struct CapturingLogger final : core::ILogger {
    std::vector<std::string> lines;

    void write(core::LogLevel, std::string_view tag, std::string_view message) override
    {
        lines.push_back(std::string(tag) + ": " + std::string(message));
    }

    [[nodiscard]] bool contains(std::string_view needle) const
    {
        for (const auto& l : lines)
            if (l.find(needle) != std::string::npos)
                return true;
        return false;
    }
};

/// Installs a CapturingLogger for the lifetime of the guard.
struct ScopedLogger {
    CapturingLogger logger;
    ScopedLogger()  { core::Log::setLogger(&logger); }
    ~ScopedLogger() { core::Log::setLogger(nullptr); }
};

/// Records every hook invocation into a shared trace.
class RecordingSystem : public System {
public:
    RecordingSystem(World& world, std::string name, SystemPriority priority, Query query,
                    std::vector<std::string>* trace = nullptr)
        : System(world, std::move(name), priority, query), _trace{trace}
    {}

    int updates{0};
    int fixedUpdates{0};
    int lateUpdates{0};
    int added{0};
    int removed{0};
    int initialized{0};
    int shutdowns{0};
    std::vector<EntityId> seen;

    void onInitialize() override { ++initialized; }
    void onShutdown() override { ++shutdowns; }

protected:
    core::Expected<void> onUpdate(core::f32) override
    {
        ++updates;
        for (auto id : activeEntities())
            seen.push_back(id);
        if (_trace)
            _trace->push_back(name());
        return {};
    }

    core::Expected<void> onFixedUpdate(core::f32) override { ++fixedUpdates; return {}; }
    core::Expected<void> onLateUpdate(core::f32) override { ++lateUpdates; return {}; }

    void onEntityAdded(EntityId) override { ++added; }
    void onEntityRemoved(EntityId) override { ++removed; }

private:
    std::vector<std::string>* _trace;
};

/// Fails every pass, either through an Error or by throwing.
class FailingSystem final : public System {
public:
    FailingSystem(World& world, bool throws)
        : System(world, throws ? "Throwing" : "Failing", SystemPriority::kCritical, Query::with({ComponentId::Transform}))
        , _throws{throws}
    {}

    int fixedCalls{0};

protected:
    core::Expected<void> onUpdate(core::f32) override { return fail(); }
    core::Expected<void> onFixedUpdate(core::f32) override { ++fixedCalls; return fail(); }

private:
    core::Expected<void> fail()
    {
        if (_throws)
            throw std::runtime_error("exploded");
        return core::makeError(core::ErrorCode::kInvalidState, "broken");
    }

    bool _throws;
};

} // namespace dz::ecs::test

#endif // DZ_ECS_TESTS_TEST_HELPERS_HPP
