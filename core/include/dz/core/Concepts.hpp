/**
 * @file Concepts.hpp
 * @brief C++20 concepts shared across modules.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef DZ_CORE_CONCEPTS_HPP
    #define DZ_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace dz::core {

/**
 * @brief A type that supports basic arithmetic operations.
 */
template <typename T>
concept Arithmetic = std::is_arithmetic_v<T> || requires(T a, T b) {
    { a + b } -> std::convertible_to<T>;
    { a - b } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
};

/**
 * @brief A floating-point scalar (length, normalisation and trigonometry
 *        are only provided for these).
 */
template <typename T>
concept FloatingPoint = std::is_floating_point_v<T>;

} // namespace dz::core

#endif // DZ_CORE_CONCEPTS_HPP
