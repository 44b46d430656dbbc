/**
 * @file Vec3.hpp
 * @brief 3-component vector template used for positions, velocities and
 *        directions.
 *
 * @tparam T Scalar type satisfying dz::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef DZ_MATH_VEC3_HPP
    #define DZ_MATH_VEC3_HPP

    #include <dz/core/Concepts.hpp>

namespace dz::math {

template <core::Arithmetic T>
struct Vec3 final {
    T x{};
    T y{};
    T z{};

    constexpr Vec3() = default;
    constexpr Vec3(T x, T y, T z);

    [[nodiscard]] constexpr Vec3 operator+(Vec3 rhs) const;
    [[nodiscard]] constexpr Vec3 operator-(Vec3 rhs) const;
    [[nodiscard]] constexpr Vec3 operator*(T scalar)  const;
    [[nodiscard]] constexpr Vec3 operator/(T scalar)  const;
    [[nodiscard]] constexpr Vec3 operator-()          const;

    constexpr Vec3 &operator+=(Vec3 rhs);
    constexpr Vec3 &operator-=(Vec3 rhs);
    constexpr Vec3 &operator*=(T scalar);

    [[nodiscard]] constexpr bool operator==(const Vec3 &rhs) const = default;

    [[nodiscard]] constexpr T    dot(Vec3 rhs)      const;
    [[nodiscard]] constexpr Vec3 cross(Vec3 rhs)    const;
    [[nodiscard]] constexpr T    lengthSquared()    const;
    [[nodiscard]] T              length()           const;
    [[nodiscard]] T              distance(Vec3 rhs) const;
    [[nodiscard]] Vec3           normalize()        const;
    [[nodiscard]] constexpr bool isZero()           const;

    static constexpr Vec3 zero();
    static constexpr Vec3 one();
    static constexpr Vec3 unitX();
    static constexpr Vec3 unitY();
    static constexpr Vec3 unitZ();
};

using Vec3f  = Vec3<float>;
using Vec3d  = Vec3<double>;

} // namespace dz::math

    #include "Vec3.inl"

#endif // DZ_MATH_VEC3_HPP
