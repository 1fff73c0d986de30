#include <gtest/gtest.h>

#include <geo_kernel/shapes/surfaceSample.hpp>

#include "Math/MathTestHelper.hpp"

using namespace geo_kernel;
using SurfaceSample = shapes3D::SurfaceSample<double>;
using math::DVec3;
using MathTestHelper::ExpectVec3Near;

namespace
{
    struct TransformPair
    {
        glm::dmat4 objectToWorld;
        glm::dmat4 worldToObject;
    };

    TransformPair MakeTransform()
    {
        glm::dmat4 m(1.0);
        m = glm::translate(m, DVec3(0.0, 0.0, 5.0));
        m = glm::rotate(m, glm::half_pi<double>(), DVec3(0.0, 0.0, 1.0));
        m = glm::scale(m, DVec3(2.0, 2.0, 2.0));
        return { m, glm::inverse(m) };
    }
}

TEST(SurfaceSample, Accessors)
{
    const SurfaceSample sample(DVec3(1.0, 2.0, 3.0), DVec3(0.0, 1.0, 0.0), 0.25);

    ExpectVec3Near(sample.GetPoint(), { 1.0, 2.0, 3.0 });
    ExpectVec3Near(sample.GetNormal(), { 0.0, 1.0, 0.0 });
    EXPECT_DOUBLE_EQ(sample.GetPdf(), 0.25);
}

TEST(SurfaceSample, ToWorldSpaceMovesPointAndRotatesNormal)
{
    const auto [objectToWorld, worldToObject] = MakeTransform();
    const SurfaceSample sample(DVec3(1.0, 0.0, 0.0), DVec3(1.0, 0.0, 0.0), 0.5);

    const SurfaceSample world = sample.TransformToWorldSpace(objectToWorld, worldToObject);

    // Escala 2, rotação de 90 graus em z e translação em z.
    ExpectVec3Near(world.GetPoint(), { 0.0, 2.0, 5.0 }, 1e-12);
    ExpectVec3Near(world.GetNormal(), { 0.0, 1.0, 0.0 }, 1e-12);
    EXPECT_DOUBLE_EQ(world.GetPdf(), 0.5);
}

TEST(SurfaceSample, NormalStaysPerpendicularUnderNonUniformScale)
{
    const glm::dmat4 objectToWorld = glm::scale(glm::dmat4(1.0), DVec3(4.0, 1.0, 1.0));
    const glm::dmat4 worldToObject = glm::inverse(objectToWorld);

    // Plano x + y = 1: tangente (1, -1, 0), normal (1, 1, 0) / sqrt(2).
    const SurfaceSample sample(DVec3(0.5, 0.5, 0.0), glm::normalize(DVec3(1.0, 1.0, 0.0)), 1.0);
    const SurfaceSample world = sample.TransformToWorldSpace(objectToWorld, worldToObject);

    const DVec3 worldTangent = math::TransformVector(objectToWorld, DVec3(1.0, -1.0, 0.0));
    EXPECT_NEAR(glm::dot(world.GetNormal(), worldTangent), 0.0, 1e-12);
    EXPECT_NEAR(glm::length(world.GetNormal()), 1.0, 1e-12);
}

TEST(SurfaceSample, ObjectWorldRoundTrip)
{
    const auto [objectToWorld, worldToObject] = MakeTransform();
    const SurfaceSample sample(DVec3(0.3, -0.7, 1.1), glm::normalize(DVec3(0.2, 0.9, -0.4)), 3.0);

    const SurfaceSample back = sample
        .TransformToWorldSpace(objectToWorld, worldToObject)
        .TransformToObjectSpace(objectToWorld, worldToObject);

    ExpectVec3Near(back.GetPoint(), sample.GetPoint(), 1e-12);
    ExpectVec3Near(back.GetNormal(), sample.GetNormal(), 1e-12);
    EXPECT_DOUBLE_EQ(back.GetPdf(), sample.GetPdf());
}
