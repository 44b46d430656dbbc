/**
 * @file Quat.inl
 * @brief Inline implementation of quaternion operations.
 * @see   Quat.hpp
 */

#ifndef DZ_MATH_QUAT_INL
    #define DZ_MATH_QUAT_INL

#include <cmath>

namespace dz::math {

template <core::FloatingPoint T>
constexpr Quat<T>::Quat(T w_, T x_, T y_, T z_) : w(w_), x(x_), y(y_), z(z_) {}

template <core::FloatingPoint T>
constexpr Quat<T> Quat<T>::operator*(Quat rhs) const
{
    return {
        w * rhs.w - x * rhs.x - y * rhs.y - z * rhs.z,
        w * rhs.x + x * rhs.w + y * rhs.z - z * rhs.y,
        w * rhs.y - x * rhs.z + y * rhs.w + z * rhs.x,
        w * rhs.z + x * rhs.y - y * rhs.x + z * rhs.w
    };
}

template <core::FloatingPoint T>
constexpr Vec3<T> Quat<T>::rotate(Vec3<T> v) const
{
    Vec3<T> qVec{x, y, z};
    Vec3<T> t = qVec.cross(v) * (T{2});
    return v + t * w + qVec.cross(t);
}

template <core::FloatingPoint T>
constexpr Quat<T> Quat<T>::conjugate() const { return {w, -x, -y, -z}; }

template <core::FloatingPoint T>
constexpr T Quat<T>::dot(Quat rhs) const
{
    return w * rhs.w + x * rhs.x + y * rhs.y + z * rhs.z;
}

template <core::FloatingPoint T>
constexpr T Quat<T>::lengthSquared() const { return dot(*this); }

template <core::FloatingPoint T>
Quat<T> Quat<T>::normalize() const
{
    T lenSq = lengthSquared();
    if (lenSq <= T{})
        return identity();
    T inv = T(1) / std::sqrt(lenSq);
    return {w * inv, x * inv, y * inv, z * inv};
}

template <core::FloatingPoint T>
Quat<T> Quat<T>::rotatedY(T angleRad) const
{
    return (fromAxisAngle(Vec3<T>::unitY(), angleRad) * *this).normalize();
}

template <core::FloatingPoint T>
constexpr Quat<T> Quat<T>::identity() { return {T{1}, T{}, T{}, T{}}; }

template <core::FloatingPoint T>
Quat<T> Quat<T>::fromAxisAngle(Vec3<T> axis, T angleRad)
{
    Vec3<T> n = axis.normalize();
    T half = angleRad * T(0.5);
    T s = std::sin(half);
    return {std::cos(half), n.x * s, n.y * s, n.z * s};
}

} // namespace dz::math

#endif // DZ_MATH_QUAT_INL
