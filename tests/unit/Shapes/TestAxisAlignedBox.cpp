#include <gtest/gtest.h>

#include <geo_kernel/shapes/axisAlignedBox.hpp>

#include "Math/MathTestHelper.hpp"

using namespace geo_kernel;
using Box = shapes3D::AxisAlignedBox<double>;
using Face = Box::Face;
using Ray = physics3D::Ray3D;
using math::DVec3;
using MathTestHelper::ExpectVec2Near;
using MathTestHelper::ExpectVec3Near;

namespace
{
    const Box kCube(DVec3(-1.0), DVec3(1.0));
}

TEST(AxisAlignedBox, ScenarioHitAtEntryFace)
{
    const Ray ray(DVec3(0.0, 0.0, -5.0), DVec3(0.0, 0.0, 1.0));
    EXPECT_NEAR(kCube.IntersectionT(ray), 4.0, 1e-12);
}

TEST(AxisAlignedBox, HitPointIsContained)
{
    const Ray ray(DVec3(-4.0, 0.3, -3.0), glm::normalize(DVec3(1.0, -0.1, 0.8)));
    const double t = kCube.IntersectionT(ray);

    ASSERT_FALSE(std::isnan(t));
    // Tolerância: o ponto pode cair um ulp fora da face.
    const DVec3 point = ray.GetPoint(t);
    EXPECT_TRUE(Box(DVec3(-1.0 - 1e-9), DVec3(1.0 + 1e-9)).Contains(point));
}

TEST(AxisAlignedBox, RayInFacePlaneIsMiss)
{
    // Raio contido no plano x = 1: o slab gera 0 * inf.
    const Ray tangent(DVec3(1.0, 0.0, -5.0), DVec3(0.0, 0.0, 1.0));
    EXPECT_TRUE(std::isnan(kCube.IntersectionT(tangent)));
    EXPECT_FALSE(kCube.Intersects(tangent));
}

TEST(AxisAlignedBox, ParallelRayOutsideSlabIsMiss)
{
    const Ray outside(DVec3(2.0, 0.0, -5.0), DVec3(0.0, 0.0, 1.0));
    EXPECT_TRUE(std::isnan(kCube.IntersectionT(outside)));

    const Ray behind(DVec3(0.0, 0.0, 5.0), DVec3(0.0, 0.0, 1.0));
    EXPECT_TRUE(std::isnan(kCube.IntersectionT(behind)));
}

TEST(AxisAlignedBox, OriginInsideReturnsExit)
{
    const Ray ray(DVec3(0.0), DVec3(1.0, 0.0, 0.0));
    EXPECT_NEAR(kCube.IntersectionT(ray), 1.0, 1e-12);

    ExpectVec3Near(kCube.CalculateSurfaceNormal(ray, 1.0), { 1.0, 0.0, 0.0 });

    const auto intersection = kCube.Intersect(ray);
    ASSERT_TRUE(intersection.has_value());
    ExpectVec3Near(intersection->GetSurfaceNormal(), { -1.0, 0.0, 0.0 });
}

TEST(AxisAlignedBox, RayLeavingFaceDoesNotHitItself)
{
    // Origem sobre a face +x, saindo da caixa: a saída está em t = 0.
    const Ray leaving(DVec3(1.0, 0.3, 0.2), DVec3(1.0, 0.5, 0.0));
    EXPECT_TRUE(std::isnan(kCube.IntersectionT(leaving)));
    EXPECT_FALSE(kCube.Intersects(leaving));
    EXPECT_FALSE(kCube.Intersect(leaving).has_value());

    // Sobre a face de entrada, apontando para dentro: o acerto é a face oposta.
    const Ray entering(DVec3(-1.0, 0.3, 0.2), DVec3(1.0, 0.0, 0.0));
    EXPECT_NEAR(kCube.IntersectionT(entering), 2.0, 1e-12);
    ExpectVec3Near(kCube.CalculateSurfaceNormal(entering, 2.0), { 1.0, 0.0, 0.0 });
}

TEST(AxisAlignedBox, CornersAreReordered)
{
    const Box box(DVec3(1.0, -2.0, 3.0), DVec3(-1.0, 2.0, -3.0));

    ExpectVec3Near(box.GetMinimum(), { -1.0, -2.0, -3.0 });
    ExpectVec3Near(box.GetMaximum(), { 1.0, 2.0, 3.0 });
    EXPECT_EQ(box, Box(DVec3(-1.0, -2.0, -3.0), DVec3(1.0, 2.0, 3.0)));
}

TEST(AxisAlignedBox, DefaultIsUnitCube)
{
    const Box box;
    ExpectVec3Near(box.GetMinimum(), DVec3(-0.5));
    ExpectVec3Near(box.GetMaximum(), DVec3(0.5));
    EXPECT_NEAR(box.GetVolume(), 1.0, 1e-12);
}

TEST(AxisAlignedBox, OutwardFaceNormals)
{
    ExpectVec3Near(Box::GetFaceNormal(Face::NegativeX), { -1.0, 0.0, 0.0 });
    ExpectVec3Near(Box::GetFaceNormal(Face::PositiveX), { 1.0, 0.0, 0.0 });
    ExpectVec3Near(Box::GetFaceNormal(Face::NegativeY), { 0.0, -1.0, 0.0 });
    ExpectVec3Near(Box::GetFaceNormal(Face::PositiveY), { 0.0, 1.0, 0.0 });
    ExpectVec3Near(Box::GetFaceNormal(Face::NegativeZ), { 0.0, 0.0, -1.0 });
    ExpectVec3Near(Box::GetFaceNormal(Face::PositiveZ), { 0.0, 0.0, 1.0 });
    ExpectVec3Near(Box::GetFaceNormal(Face::None), { 0.0, 0.0, 0.0 });

    // Entrando pela face de menor z: normal -z.
    const Ray ray(DVec3(0.5, 0.25, -5.0), DVec3(0.0, 0.0, 1.0));
    EXPECT_EQ(kCube.CalculateFace(ray.GetPoint(4.0)), Face::NegativeZ);
    ExpectVec3Near(kCube.CalculateSurfaceNormal(ray, 4.0), { 0.0, 0.0, -1.0 });
    ExpectVec3Near(kCube.CalculateSurfaceNormal(ray, 4.0, true), { 0.0, 0.0, -1.0 });

    const Ray fromAbove(DVec3(0.2, 7.0, 0.1), DVec3(0.0, -2.0, 0.0));
    EXPECT_NEAR(kCube.IntersectionT(fromAbove), 3.0, 1e-12);
    ExpectVec3Near(kCube.CalculateSurfaceNormal(fromAbove, 3.0), { 0.0, 1.0, 0.0 });
}

TEST(AxisAlignedBox, FaceTextureCoordinates)
{
    const Ray zRay(DVec3(0.5, 0.25, -5.0), DVec3(0.0, 0.0, 1.0));
    ExpectVec2Near(kCube.CalculateTextureCoordinates(zRay, 4.0), { 0.75, 0.625 });

    // Face x: (z, y).
    const Ray xRay(DVec3(5.0, 0.5, -0.5), DVec3(-1.0, 0.0, 0.0));
    ExpectVec2Near(kCube.CalculateTextureCoordinates(xRay, 4.0), { 0.25, 0.75 });

    // Face y: (x, z).
    const Ray yRay(DVec3(0.0, -5.0, 0.5), DVec3(0.0, 1.0, 0.0));
    ExpectVec2Near(kCube.CalculateTextureCoordinates(yRay, 4.0), { 0.5, 0.75 });

    const auto intersection = kCube.Intersect(zRay);
    ASSERT_TRUE(intersection.has_value());
    ExpectVec2Near(intersection->GetTextureCoordinates(), { 0.75, 0.625 });
    ExpectVec3Near(intersection->GetOrthonormalBasis().GetW(), { 0.0, 0.0, -1.0 });
}

TEST(AxisAlignedBox, ClosestPointAndContains)
{
    ExpectVec3Near(kCube.GetClosestPointTo(DVec3(5.0, 0.0, -5.0)), { 1.0, 0.0, -1.0 });
    ExpectVec3Near(kCube.GetClosestPointTo(DVec3(0.3, -0.2, 0.1)), { 0.3, -0.2, 0.1 });

    EXPECT_TRUE(kCube.Contains(DVec3(1.0, 1.0, 1.0)));
    EXPECT_TRUE(kCube.Contains(DVec3(0.0)));
    EXPECT_FALSE(kCube.Contains(DVec3(1.0001, 0.0, 0.0)));
}

TEST(AxisAlignedBox, Measures)
{
    const Box box(DVec3(0.0), DVec3(2.0, 3.0, 4.0));

    EXPECT_NEAR(box.GetSurfaceArea(), 2.0 * (6.0 + 12.0 + 8.0), 1e-12);
    EXPECT_NEAR(box.GetVolume(), 24.0, 1e-12);
    EXPECT_NEAR(box.GetSurfaceAreaPdf(), 1.0 / 52.0, 1e-12);
    ExpectVec3Near(box.Center(), { 1.0, 1.5, 2.0 });
    ExpectVec3Near(box.Extents(), { 1.0, 1.5, 2.0 });
}

TEST(AxisAlignedBox, UnionAndTransform)
{
    const Box a(DVec3(0.0), DVec3(1.0));
    const Box b(DVec3(-2.0, 0.5, 0.5), DVec3(0.5, 3.0, 0.7));

    const Box merged = Box::Union(a, b);
    ExpectVec3Near(merged.GetMinimum(), { -2.0, 0.0, 0.0 });
    ExpectVec3Near(merged.GetMaximum(), { 1.0, 3.0, 1.0 });

    // Rotação de 90 graus em z: o cubo [0,1]^3 vai para x em [-1, 0].
    const auto rotation = glm::rotate(glm::dmat4(1.0), glm::half_pi<double>(), DVec3(0.0, 0.0, 1.0));
    const Box rotated = a.Transform(rotation);
    ExpectVec3Near(rotated.GetMinimum(), { -1.0, 0.0, 0.0 }, 1e-12);
    ExpectVec3Near(rotated.GetMaximum(), { 0.0, 1.0, 1.0 }, 1e-12);
}

TEST(AxisAlignedBox, SamplingPicksFaceByArea)
{
    // Faces x: área 1; faces y e z: área 2. Total 10.
    const Box box(DVec3(0.0), DVec3(2.0, 1.0, 1.0));
    const DVec3 reference(5.0, 4.0, 3.0);

    const auto negativeX = box.Sample(reference, DVec3(0.0, 1.0, 0.0), 0.05, 0.5);
    ASSERT_TRUE(negativeX.has_value());
    EXPECT_DOUBLE_EQ(negativeX->GetPoint().x, 0.0);
    ExpectVec3Near(negativeX->GetNormal(), { -1.0, 0.0, 0.0 });

    const auto positiveY = box.Sample(reference, DVec3(0.0, 1.0, 0.0), 0.45, 0.5);
    ASSERT_TRUE(positiveY.has_value());
    EXPECT_DOUBLE_EQ(positiveY->GetPoint().y, 1.0);
    ExpectVec3Near(positiveY->GetNormal(), { 0.0, 1.0, 0.0 });

    const auto positiveZ = box.Sample(reference, DVec3(0.0, 1.0, 0.0), 0.95, 0.5);
    ASSERT_TRUE(positiveZ.has_value());
    EXPECT_DOUBLE_EQ(positiveZ->GetPoint().z, 1.0);
    ExpectVec3Near(positiveZ->GetNormal(), { 0.0, 0.0, 1.0 });
}

TEST(AxisAlignedBox, SamplesLieOnSurfaceWithConsistentPdf)
{
    const Box box(DVec3(-1.0, 0.0, 2.0), DVec3(1.0, 0.5, 3.0));
    const DVec3 reference(4.0, 3.0, -2.0);
    const DVec3 referenceNormal(0.0, 0.0, 1.0);

    for (int i = 0; i < 20; ++i) {
        for (int j = 0; j < 5; ++j) {
            const auto uv = MathTestHelper::Stratum(i, j, 20);
            const auto sample = box.Sample(reference, referenceNormal, uv.x, uv.y);
            ASSERT_TRUE(sample.has_value());

            const DVec3 p = sample->GetPoint();
            EXPECT_TRUE(box.Contains(p));
            EXPECT_TRUE(p.x == -1.0 || p.x == 1.0 || p.y == 0.0 || p.y == 0.5 || p.z == 2.0 || p.z == 3.0);
            ExpectVec3Near(sample->GetNormal(), Box::GetFaceNormal(box.CalculateFace(p)));

            EXPECT_NEAR(sample->GetPdf(),
                        box.CalculateSolidAnglePdf(reference, referenceNormal, p, sample->GetNormal()),
                        1e-12);
        }
    }
}
