/**
 * @file Quat.hpp
 * @brief Quaternion type for 3D rotation, parameterised on scalar type.
 *
 * Uses Hamilton convention (w, x, y, z) where w is the real part.
 *
 * @tparam T Scalar type satisfying dz::core::FloatingPoint.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef DZ_MATH_QUAT_HPP
    #define DZ_MATH_QUAT_HPP

    #include "Vec3.hpp"

namespace dz::math {

template <core::FloatingPoint T>
struct Quat final {
    T w{1};
    T x{};
    T y{};
    T z{};

    constexpr Quat() = default;
    constexpr Quat(T w, T x, T y, T z);

    [[nodiscard]] constexpr Quat    operator*(Quat rhs)  const;
    [[nodiscard]] constexpr Vec3<T> rotate(Vec3<T> v)    const;
    [[nodiscard]] constexpr Quat    conjugate()          const;
    [[nodiscard]] constexpr T       dot(Quat rhs)        const;
    [[nodiscard]] constexpr T       lengthSquared()      const;
    [[nodiscard]] Quat              normalize()          const;

    /// @brief Rotate this orientation about the world Y axis (yaw).
    [[nodiscard]] Quat              rotatedY(T angleRad) const;

    static constexpr Quat identity();
    static Quat fromAxisAngle(Vec3<T> axis, T angleRad);
};

using Quatf = Quat<float>;

} // namespace dz::math

    #include "Quat.inl"

#endif // DZ_MATH_QUAT_HPP
