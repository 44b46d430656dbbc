/**
 * @file TestMath.cpp
 * @brief Unit tests for math::Vec3 and math::Quat.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "dz/math/Quat.hpp"

#include <numbers>

namespace dz::math {

using Catch::Matchers::WithinAbs;

TEST_CASE("Vec3 arithmetic and length", "[math][vec3]")
{
    Vec3f a{1.0f, 2.0f, 2.0f};
    Vec3f b{1.0f, 0.0f, 0.0f};

    REQUIRE(a + b == Vec3f{2.0f, 2.0f, 2.0f});
    REQUIRE(a * 2.0f == Vec3f{2.0f, 4.0f, 4.0f});
    REQUIRE_THAT(a.length(), WithinAbs(3.0, 1e-6));
    REQUIRE_THAT(a.distance(b), WithinAbs(std::sqrt(8.0), 1e-5));
    REQUIRE(Vec3f::unitX().cross(Vec3f::unitY()) == Vec3f::unitZ());
}

TEST_CASE("Vec3 normalize leaves the zero vector untouched", "[math][vec3]")
{
    Vec3f zero = Vec3f::zero().normalize();
    REQUIRE(zero.isZero());

    Vec3f n = Vec3f{0.0f, 3.0f, 4.0f}.normalize();
    REQUIRE_THAT(n.length(), WithinAbs(1.0, 1e-6));
}

TEST_CASE("Quat rotates forward vector about Y", "[math][quat]")
{
    const float halfPi = std::numbers::pi_v<float> * 0.5f;
    Quatf q = Quatf::fromAxisAngle(Vec3f::unitY(), halfPi);

    Vec3f forward{0.0f, 0.0f, -1.0f};
    Vec3f rotated = q.rotate(forward);

    REQUIRE_THAT(rotated.x, WithinAbs(-1.0, 1e-5));
    REQUIRE_THAT(rotated.y, WithinAbs(0.0, 1e-5));
    REQUIRE_THAT(rotated.z, WithinAbs(0.0, 1e-5));
}

TEST_CASE("Quat identity leaves vectors unchanged", "[math][quat]")
{
    Vec3f v{1.0f, -2.0f, 3.0f};
    Vec3f r = Quatf::identity().rotate(v);
    REQUIRE_THAT(r.x, WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(r.y, WithinAbs(-2.0, 1e-6));
    REQUIRE_THAT(r.z, WithinAbs(3.0, 1e-6));

    Quatf yawed = Quatf::identity().rotatedY(0.3f).rotatedY(-0.3f);
    REQUIRE_THAT(yawed.w, WithinAbs(1.0, 1e-5));
}

} // namespace dz::math
