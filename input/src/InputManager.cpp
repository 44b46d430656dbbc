/**
 * @file InputManager.cpp
 * @brief InputManager implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/input/InputManager.hpp>
#include <dz/core/Log.hpp>

#include <string>
#include <vector>

namespace dz::input {

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct InputManager::Impl
{
    std::vector<std::unique_ptr<IInputSource>> sources;
    InputState                                 state{};
    core::u64                                  sequence{0};
};

// ========================================================================== //
//  Source management                                                         //
// ========================================================================== //

InputManager::InputManager()
    : _impl{std::make_unique<Impl>()}
{}

InputManager::~InputManager() = default;

void InputManager::addSource(std::unique_ptr<IInputSource> source)
{
    if (source)
    {
        _impl->sources.push_back(std::move(source));
    }
}

core::Expected<void> InputManager::init()
{
    for (auto& source : _impl->sources)
    {
        auto result = source->init();
        if (!result.has_value())
        {
            return result;
        }
        core::Log::debug("Input", std::string("Initialized source ") + source->name());
    }
    return {};
}

void InputManager::poll()
{
    for (auto& source : _impl->sources)
    {
        auto result = source->poll(_impl->state);
        if (!result.has_value())
        {
            core::Log::warn("Input", std::string("Poll failed for ") + source->name() + ": " +
                                     result.error().message());
        }
    }
    ++_impl->sequence;
}

void InputManager::shutdown()
{
    for (auto& source : _impl->sources)
    {
        source->shutdown();
    }
}

// ========================================================================== //
//  State                                                                     //
// ========================================================================== //

const InputState& InputManager::state() const noexcept
{
    return _impl->state;
}

InputState& InputManager::mutableState() noexcept
{
    return _impl->state;
}

core::u64 InputManager::sequence() const noexcept
{
    return _impl->sequence;
}

core::usize InputManager::sourceCount() const noexcept
{
    return _impl->sources.size();
}

} // namespace dz::input
