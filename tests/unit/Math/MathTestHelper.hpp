#pragma once

#include <gtest/gtest.h>

#include <geo_kernel/core/math.hpp>

namespace MathTestHelper
{
    using geo_kernel::math::DVec2;
    using geo_kernel::math::DVec3;

    constexpr double kEpsVec = 1e-9;
    constexpr double kEpsBasis = 1e-6;

    inline void ExpectVec3Near(const DVec3& a, const DVec3& b, double eps = kEpsVec)
    {
        EXPECT_NEAR(a.x, b.x, eps) << "Vec3.x";
        EXPECT_NEAR(a.y, b.y, eps) << "Vec3.y";
        EXPECT_NEAR(a.z, b.z, eps) << "Vec3.z";
    }

    inline void ExpectVec2Near(const DVec2& a, const DVec2& b, double eps = kEpsVec)
    {
        EXPECT_NEAR(a.x, b.x, eps) << "Vec2.x";
        EXPECT_NEAR(a.y, b.y, eps) << "Vec2.y";
    }

    // Ângulo sólido de um triângulo visto de p (Van Oosterom & Strackee).
    inline double TriangleSolidAngle(const DVec3& p, const DVec3& a, const DVec3& b, const DVec3& c)
    {
        const DVec3 r1 = a - p;
        const DVec3 r2 = b - p;
        const DVec3 r3 = c - p;

        const double l1 = glm::length(r1);
        const double l2 = glm::length(r2);
        const double l3 = glm::length(r3);

        const double numerator = std::abs(glm::dot(r1, glm::cross(r2, r3)));
        const double denominator = l1 * l2 * l3 + glm::dot(r1, r2) * l3 + glm::dot(r1, r3) * l2 + glm::dot(r2, r3) * l1;

        return 2.0 * std::atan2(numerator, denominator);
    }

    // Centro do estrato (i, j) de uma grade n x n em [0, 1)^2.
    inline DVec2 Stratum(int i, int j, int n)
    {
        return DVec2((i + 0.5) / n, (j + 0.5) / n);
    }
}
