#include <gtest/gtest.h>

#include <geo_kernel/physics/boundingVolume.hpp>
#include <geo_kernel/shapes/axisAlignedBox.hpp>
#include <geo_kernel/shapes/sphere.hpp>

#include "Math/MathTestHelper.hpp"

using namespace geo_kernel;
using Box = shapes3D::AxisAlignedBox<double>;
using Sphere = shapes3D::Sphere<double>;
using Ray = physics3D::Ray3D;
using math::DVec3;
using MathTestHelper::ExpectVec3Near;

TEST(BoundingVolume, RayIntersectsFollowsIntersectionT)
{
    const Box box(DVec3(-1.0), DVec3(1.0));
    const Sphere sphere(DVec3(0.0), 1.0);

    const physics3D::BoundingVolume<double>& boxVolume = box;
    const physics3D::BoundingVolume<double>& sphereVolume = sphere;

    EXPECT_TRUE(boxVolume.Intersects(Ray(DVec3(0.0, 0.0, -5.0), DVec3(0.0, 0.0, 1.0))));
    EXPECT_TRUE(sphereVolume.Intersects(Ray(DVec3(0.0, 0.0, -5.0), DVec3(0.0, 0.0, 1.0))));

    EXPECT_FALSE(boxVolume.Intersects(Ray(DVec3(0.0, 3.0, -5.0), DVec3(0.0, 0.0, 1.0))));
    EXPECT_FALSE(sphereVolume.Intersects(Ray(DVec3(0.0, 3.0, -5.0), DVec3(0.0, 0.0, 1.0))));
}

TEST(BoundingVolume, MidpointDefaultsToCenterOfExtent)
{
    const Box box(DVec3(0.0, 2.0, -4.0), DVec3(2.0, 4.0, 0.0));
    const physics3D::BoundingVolume<double>& volume = box;

    ExpectVec3Near(volume.GetMidpoint(), { 1.0, 3.0, -2.0 });
    ExpectVec3Near(Sphere(DVec3(1.0, 2.0, 3.0), 2.0).GetMidpoint(), { 1.0, 2.0, 3.0 });
}

TEST(BoundingVolume, OverlappingVolumesIntersect)
{
    const Sphere sphere(DVec3(0.0), 1.0);
    const Box box(DVec3(0.5), DVec3(2.0));

    EXPECT_TRUE(sphere.Intersects(box));
    EXPECT_TRUE(box.Intersects(sphere));
}

TEST(BoundingVolume, DisjointVolumesDoNotIntersect)
{
    const Box a(DVec3(0.0), DVec3(1.0));
    const Box b(DVec3(2.0), DVec3(3.0));
    const Sphere sphere(DVec3(10.0), 1.0);

    EXPECT_FALSE(a.Intersects(b));
    EXPECT_FALSE(b.Intersects(a));
    EXPECT_FALSE(a.Intersects(sphere));
    EXPECT_FALSE(sphere.Intersects(a));
}

TEST(BoundingVolume, VolumeIntersectsIsOneSided)
{
    // Os volumes se sobrepõem (o ponto (0.6, 0.6, 0) está nos dois), mas o ponto da esfera mais
    // próximo do centro distante da caixa cai fora dela: falso negativo conhecido do teste aproximado.
    const Sphere sphere(DVec3(0.0), 1.0);
    const Box box(DVec3(0.5, 0.5, -1.0), DVec3(10.0, 100.0, 1.0));

    ASSERT_TRUE(sphere.Contains(DVec3(0.6, 0.6, 0.0)));
    ASSERT_TRUE(box.Contains(DVec3(0.6, 0.6, 0.0)));

    EXPECT_FALSE(sphere.Intersects(box));
    EXPECT_TRUE(box.Intersects(sphere));
}
