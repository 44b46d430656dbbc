/**
 * @file TestEntityRegistry.cpp
 * @brief Unit tests for ecs::EntityRegistry and ecs::ComponentStore.
 */

#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.hpp"
#include "dz/ecs/ComponentStore.hpp"
#include "dz/ecs/EntityRegistry.hpp"

namespace dz::ecs {

TEST_CASE("EntityRegistry create, destroy and release", "[ecs][registry]")
{
    EntityRegistry registry(16);

    auto created = registry.create("Player", 10.0);
    REQUIRE(created.has_value());
    const EntityId id = *created;

    REQUIRE(registry.exists(id));
    REQUIRE(registry.isActive(id));
    REQUIRE(registry.get(id)->name == "Player");
    REQUIRE(registry.get(id)->createdAt == 10.0);
    REQUIRE(registry.get(id)->age(25.0) == 15.0);

    REQUIRE(registry.destroy(id));
    REQUIRE(registry.exists(id));
    REQUIRE_FALSE(registry.isActive(id));
    REQUIRE(registry.destroy(id));

    REQUIRE(registry.release(id));
    REQUIRE_FALSE(registry.exists(id));
    REQUIRE_FALSE(registry.destroy(id));
    REQUIRE(registry.liveCount() == 0);
}

TEST_CASE("EntityRegistry recycles slots with a new generation", "[ecs][registry]")
{
    EntityRegistry registry(16);

    const EntityId first = *registry.create("a", 0.0);
    REQUIRE(registry.release(first));

    const EntityId second = *registry.create("b", 0.0);
    REQUIRE(second.slot() == first.slot());
    REQUIRE(second.generation() != first.generation());
    REQUIRE_FALSE(registry.exists(first));
    REQUIRE(registry.exists(second));
}

TEST_CASE("EntityRegistry reports exhaustion", "[ecs][registry]")
{
    EntityRegistry registry(2);
    REQUIRE(registry.create("a", 0.0).has_value());
    REQUIRE(registry.create("b", 0.0).has_value());

    auto third = registry.create("c", 0.0);
    REQUIRE_FALSE(third.has_value());
    REQUIRE(third.error().code() == core::ErrorCode::kOutOfMemory);
}

TEST_CASE("ComponentStore overwrites components of the same type", "[ecs][store]")
{
    ComponentStore store;
    const EntityId id{0, 3};

    auto first = std::make_unique<test::A>();
    first->value = 1;
    store.attach(id, std::move(first));

    auto second = std::make_unique<test::A>();
    second->value = 2;
    store.attach(id, std::move(second));

    REQUIRE(store.size() == 1);
    REQUIRE(store.get<test::A>(id)->value == 2);
    REQUIRE(store.get<test::A>(id)->owner() == id);
    REQUIRE(store.archetypeOf(id) == Archetype{ComponentId::Transform});

    REQUIRE(store.detach(id, ComponentId::Transform));
    REQUIRE_FALSE(store.detach(id, ComponentId::Transform));
    REQUIRE(store.size() == 0);
}

TEST_CASE("ComponentStore erase drops every component of an entity", "[ecs][store]")
{
    ComponentStore store;
    const EntityId id{0, 1};
    store.attach(id, std::make_unique<test::A>());
    store.attach(id, std::make_unique<test::B>());
    store.attach(EntityId{0, 2}, std::make_unique<test::B>());

    REQUIRE(store.countOf(ComponentId::Physics) == 2);
    REQUIRE(store.erase(id) == 2);
    REQUIRE(store.size() == 1);
    REQUIRE_FALSE(store.has(id, ComponentId::Transform));
}

} // namespace dz::ecs
