// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>

#include <cmath>

#include "engine/gfx/Curve.hpp"
#include "engine/gfx/MeshFactory.hpp"
#include "engine/math/Ray.hpp"
#include "engine/render/RenderPrimitives.hpp"
#include "engine/scene/Scene.hpp"

using namespace Engine;
using Engine::Math::Vec3;

namespace
{
    void ExpectVecNear(const Vec3 &a, const Vec3 &b, float eps = 1e-4f)
    {
        EXPECT_NEAR(a.x, b.x, eps);
        EXPECT_NEAR(a.y, b.y, eps);
        EXPECT_NEAR(a.z, b.z, eps);
    }
}

TEST(Mat4, InverseTRSUndoesComposeTRS)
{
    const Vec3 t{1.0f, -2.0f, 0.5f};
    const Vec3 r{0.3f, -1.1f, 0.7f};
    const Vec3 s{2.0f, 2.0f, 2.0f};
    const auto m = Math::multiply(Math::inverseTRS(t, r, s), Math::composeTRS(t, r, s));
    const Vec3 p{0.25f, 3.0f, -4.0f};
    ExpectVecNear(Math::transformPoint(m, p), p);
}

TEST(Mat4, EulerAligningZToMapsZOntoDirection)
{
    const Vec3 dirs[] = {{1, 0, 0}, {0, 1, 0}, {0, 0, -1}, {0.3f, -0.4f, 0.5f}, {-1, 2, 3}};
    for (const auto &d : dirs)
    {
        const auto n = Math::normalize(d);
        const auto mapped = Math::transformDirection(Math::eulerXYZ(Math::eulerAligningZTo(n)), {0, 0, 1});
        ExpectVecNear(mapped, n);
    }
}

TEST(Ray, IntersectSphereReturnsNearestHit)
{
    Math::Ray ray{{0, 0, 5}, {0, 0, -1}};
    auto t = Math::intersectSphere(ray, {0, 0, 0}, 1.0f);
    ASSERT_TRUE(t.has_value());
    EXPECT_NEAR(*t, 4.0f, 1e-5f);
    EXPECT_FALSE(Math::intersectSphere(ray, {3, 0, 0}, 1.0f).has_value());
}

TEST(Ray, IntersectTriangleIsDoubleSided)
{
    const Vec3 a{-1, -1, 0}, b{1, -1, 0}, c{0, 1, 0};
    EXPECT_TRUE(Math::intersectTriangle({{0, 0, 1}, {0, 0, -1}}, a, b, c).has_value());
    EXPECT_TRUE(Math::intersectTriangle({{0, 0, -1}, {0, 0, 1}}, a, b, c).has_value());
    EXPECT_FALSE(Math::intersectTriangle({{5, 0, 1}, {0, 0, -1}}, a, b, c).has_value());
}

TEST(MeshFactory, SphereVerticesLieOnRadius)
{
    const auto m = Gfx::CreateSphere(0.3f, 12, 12);
    EXPECT_EQ(m.vertices.size(), 13u * 13u);
    for (const auto &v : m.vertices)
        EXPECT_NEAR(std::sqrt(v.px * v.px + v.py * v.py + v.pz * v.pz), 0.3f, 1e-5f);
}

TEST(MeshFactory, UncappedCylinderSpansUnitLengthAlongZ)
{
    const auto m = Gfx::CreateCylinder(0.1f, 1.0f, 8, false);
    EXPECT_EQ(m.vertices.size(), 18u);
    EXPECT_EQ(m.triangleCount(), 16u);
    for (const auto &v : m.vertices)
        EXPECT_NEAR(std::fabs(v.pz), 0.5f, 1e-6f);
}

TEST(MeshFactory, RingSectorStaysBetweenRadii)
{
    const auto m = Gfx::CreateRingSector(0.35f, 0.5f, 32, 0.0f, Math::kPi * 0.5f);
    for (const auto &v : m.vertices)
    {
        const float r = std::sqrt(v.px * v.px + v.py * v.py);
        EXPECT_GE(r, 0.35f - 1e-5f);
        EXPECT_LE(r, 0.5f + 1e-5f);
        EXPECT_GE(v.px, -1e-5f);
        EXPECT_GE(v.py, -1e-5f);
    }
}

TEST(MeshFactory, TubeKeepsRadiusAroundCurve)
{
    Gfx::CatmullRomCurve curve({{0, 0, 0}, {1, 0, 0}, {2, 1, 0}, {3, 1, 1}});
    const auto m = Gfx::CreateTube(curve, 12, 0.2f, 8);
    ASSERT_EQ(m.vertices.size(), 13u * 9u);
    EXPECT_EQ(m.triangleCount(), 12u * 8u * 2u);

    // First ring is centred on the first control point
    for (int j = 0; j < 9; ++j)
    {
        const auto &v = m.vertices[static_cast<std::size_t>(j)];
        EXPECT_NEAR(std::sqrt(v.px * v.px + v.py * v.py + v.pz * v.pz), 0.2f, 1e-3f);
    }
}

TEST(CatmullRomCurve, PassesThroughControlPoints)
{
    Gfx::CatmullRomCurve curve({{0, 0, 0}, {1, 2, 0}, {3, 2, 1}});
    ExpectVecNear(curve.point(0.0f), {0, 0, 0});
    ExpectVecNear(curve.point(0.5f), {1, 2, 0});
    ExpectVecNear(curve.point(1.0f), {3, 2, 1});
}

TEST(SceneData, AddIgnoresDuplicatesAndRemoveReportsMembership)
{
    Scene::SceneData scene;
    auto g = std::make_shared<Scene::RenderGroup>();
    scene.add(g);
    scene.add(g);
    scene.add(nullptr);
    EXPECT_EQ(scene.groups.size(), 1u);
    EXPECT_TRUE(scene.remove(g.get()));
    EXPECT_FALSE(scene.remove(g.get()));
}

TEST(RenderGroup, ReleaseResourcesDropsBuffers)
{
    Scene::RenderGroup g;
    Scene::RenderableEntity r;
    r.mesh = g.addMesh(Gfx::CreateSphere(1.0f));
    r.material = g.addMaterial(ECS::SolidMaterial(0xff0000));
    g.renderables.push_back(r);
    ASSERT_FALSE(g.empty());

    g.releaseResources();
    EXPECT_TRUE(g.isReleased());
    EXPECT_TRUE(g.empty());
    EXPECT_TRUE(g.meshes.empty());
    EXPECT_TRUE(g.materials.empty());
}

TEST(RenderPrimitives, ScreenCenterRayFollowsCameraForward)
{
    Engine::ECS::Transform cam;
    cam.position = {0.0f, 1.6f, 3.0f};
    Engine::ECS::Camera lens;

    auto ray = Render::ScreenPointToRay(cam, lens, 0.0f, 0.0f);
    EXPECT_FLOAT_EQ(ray.origin.y, 1.6f);
    EXPECT_NEAR(ray.direction.z, -1.0f, 1e-6f);

    // Top edge of the screen tilts up by half the vertical field of view
    ray = Render::ScreenPointToRay(cam, lens, 0.0f, 1.0f);
    EXPECT_NEAR(std::atan2(ray.direction.y, -ray.direction.z), lens.fovYRadians * 0.5f, 1e-5f);
}
