/**
 * @file NonCopyable.hpp
 * @brief CRTP bases for ECS objects that must keep a single identity.
 *
 * Systems hold a reference to their World, so a World may neither be
 * copied nor moved. Stores and the frame driver may still be moved.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef DZ_CORE_NON_COPYABLE_HPP
    #define DZ_CORE_NON_COPYABLE_HPP

namespace dz::core {

/** @brief Copy disabled, move allowed. */
template <typename Derived>
class NonCopyable {
public:
    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(NonCopyable &&) noexcept            = default;
    NonCopyable &operator=(NonCopyable &&) noexcept = default;
};

/** @brief Copy and move disabled: the object is referenced by address. */
template <typename Derived>
class NonMovable {
public:
    NonMovable(const NonMovable &)            = delete;
    NonMovable &operator=(const NonMovable &) = delete;
    NonMovable(NonMovable &&)                 = delete;
    NonMovable &operator=(NonMovable &&)      = delete;

protected:
    NonMovable()  = default;
    ~NonMovable() = default;
};

} // namespace dz::core

#endif // DZ_CORE_NON_COPYABLE_HPP
