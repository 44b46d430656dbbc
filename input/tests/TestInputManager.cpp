/**
 * @file TestInputManager.cpp
 * @brief Unit tests for input::InputManager.
 */

#include <catch2/catch_test_macros.hpp>

#include "dz/input/InputManager.hpp"

namespace dz::input {

namespace {

class ScriptedSource final : public IInputSource {
public:
    explicit ScriptedSource(bool failPoll) : _failPoll{failPoll} {}

    int polls{0};
    bool shutDown{false};

    core::Expected<void> init() override { return {}; }

    core::Expected<void> poll(InputState& state) override
    {
        ++polls;
        if (_failPoll)
            return core::makeError(core::ErrorCode::kIoError, "device unplugged");
        state.forward = true;
        state.lookX   = 0.5f;
        return {};
    }

    void shutdown() override { shutDown = true; }
    const char* name() const noexcept override { return "Scripted"; }

private:
    bool _failPoll;
};

class BrokenSource final : public IInputSource {
public:
    core::Expected<void> init() override
    {
        return core::makeError(core::ErrorCode::kNotFound, "no device");
    }
    core::Expected<void> poll(InputState&) override { return {}; }
    void shutdown() override {}
    const char* name() const noexcept override { return "Broken"; }
};

} // namespace

TEST_CASE("InputManager polls sources into the shared state", "[input]")
{
    InputManager manager;
    auto source = std::make_unique<ScriptedSource>(false);
    auto* raw = source.get();
    manager.addSource(std::move(source));
    manager.addSource(std::make_unique<ScriptedSource>(true));

    REQUIRE(manager.init().has_value());
    manager.poll();

    REQUIRE(raw->polls == 1);
    REQUIRE(manager.state().forward);
    REQUIRE(manager.state().lookX == 0.5f);
    REQUIRE(manager.sequence() == 1);

    manager.shutdown();
    REQUIRE(raw->shutDown);
}

TEST_CASE("InputManager init surfaces the first failing source", "[input]")
{
    InputManager manager;
    manager.addSource(std::make_unique<BrokenSource>());

    auto result = manager.init();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kNotFound);
}

TEST_CASE("InputState clearActions keeps pointer deltas", "[input]")
{
    InputState state;
    state.fire  = true;
    state.left  = true;
    state.lookX = 0.25f;

    REQUIRE(state.hasMovement());
    state.clearActions();
    REQUIRE_FALSE(state.fire);
    REQUIRE_FALSE(state.hasMovement());
    REQUIRE(state.lookX == 0.25f);
}

} // namespace dz::input
