// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/repr/builders.hpp"

#include "engine/gfx/Curve.hpp"
#include "engine/gfx/MeshFactory.hpp"
#include "molxr/chem/element_style.hpp"
#include "molxr/repr/bonds.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>
#include <utility>

namespace molxr::repr
{
    using Engine::ECS::Material;
    using Engine::ECS::MeshData;
    using Engine::ECS::RenderStyle;
    using Engine::Scene::RenderableEntity;
    using Engine::Scene::RenderGroup;

    namespace detail
    {
        // Materials are shared between all atoms of the same color within one group
        class MaterialCache
        {
        public:
            explicit MaterialCache(RenderGroup &group) : m_group(group) {}

            Material *get(std::uint32_t hex)
            {
                auto it = m_byColor.find(hex);
                if (it != m_byColor.end())
                    return it->second;
                Material *mat = m_group.addMaterial(Engine::ECS::SolidMaterial(hex));
                m_byColor.emplace(hex, mat);
                return mat;
            }

        private:
            RenderGroup &m_group;
            std::unordered_map<std::uint32_t, Material *> m_byColor;
        };

        static GroupPtr atom_spheres(const std::vector<chem::Atom> &atoms, float radius, int segments, RenderStyle style)
        {
            auto group = std::make_shared<RenderGroup>();
            const MeshData *sphere = group->addMesh(Engine::Gfx::CreateSphere(radius, segments, segments));
            MaterialCache materials(*group);

            group->renderables.reserve(atoms.size());
            for (const auto &atom : atoms)
            {
                RenderableEntity r;
                r.transform.position = atom.position;
                r.mesh = sphere;
                r.material = materials.get(chem::element_color_hex(atom.element));
                r.style = style;
                group->renderables.push_back(r);
            }
            return group;
        }
    }

    GroupPtr build_ball_and_stick(const std::vector<chem::Atom> &atoms)
    {
        auto group = detail::atom_spheres(atoms, kAtomSphereRadius, 12, RenderStyle::Solid);
        if (atoms.size() >= kMaxAtomsForBonds)
            return group;

        const auto bonds = infer_bonds(atoms);
        if (bonds.empty())
            return group;

        // Unit-length cylinder along Z, stretched per bond
        const MeshData *cylinder = group->addMesh(Engine::Gfx::CreateCylinder(kBondRadius, 1.0f, kBondSlices, false));
        Material *bondMaterial = group->addMaterial(Engine::ECS::SolidMaterial(kBondColor));

        group->renderables.reserve(group->renderables.size() + bonds.size());
        for (const auto &bond : bonds)
        {
            const auto &p1 = atoms[bond.a].position;
            const auto &p2 = atoms[bond.b].position;
            const auto dir = Engine::Math::normalize(p2 - p1);

            RenderableEntity r;
            r.transform.position = Engine::Math::lerp(p1, p2, 0.5f);
            r.transform.rotationEulerRad = Engine::Math::eulerAligningZTo(dir);
            r.transform.scale = {1.0f, 1.0f, bond.length};
            r.mesh = cylinder;
            r.material = bondMaterial;
            group->renderables.push_back(r);
        }
        return group;
    }

    GroupPtr build_space_fill(const std::vector<chem::Atom> &atoms)
    {
        auto group = std::make_shared<RenderGroup>();
        detail::MaterialCache materials(*group);
        // One sphere mesh per distinct radius
        std::unordered_map<float, const MeshData *> spheres;

        group->renderables.reserve(atoms.size());
        for (const auto &atom : atoms)
        {
            const float radius = chem::element_radius(atom.element);
            auto it = spheres.find(radius);
            if (it == spheres.end())
                it = spheres.emplace(radius, group->addMesh(Engine::Gfx::CreateSphere(radius, 16, 16))).first;

            RenderableEntity r;
            r.transform.position = atom.position;
            r.mesh = it->second;
            r.material = materials.get(chem::element_color_hex(atom.element));
            group->renderables.push_back(r);
        }
        return group;
    }

    GroupPtr build_wireframe(const std::vector<chem::Atom> &atoms)
    {
        return detail::atom_spheres(atoms, kAtomSphereRadius, 8, RenderStyle::Wireframe);
    }

    GroupPtr build_transparent_surface(const std::vector<chem::Atom> &atoms)
    {
        if (atoms.size() > kMaxAtomsForSurface)
            return build_wireframe(atoms);

        auto group = build_space_fill(atoms);
        for (auto &mat : group->materials)
        {
            mat->transparent = true;
            mat->opacity = kSurfaceOpacity;
        }
        return group;
    }

    std::vector<Engine::Math::Vec3> ribbon_samples(const std::vector<chem::Atom> &atoms)
    {
        std::vector<Engine::Math::Vec3> points;
        if (atoms.size() < 2)
            return points;

        const std::size_t stride = std::max<std::size_t>(1, atoms.size() / kRibbonTargetSamples);
        points.reserve(atoms.size() / stride + 1);
        for (std::size_t i = 0; i < atoms.size(); i += stride)
            points.push_back(atoms[i].position);
        points.push_back(atoms.back().position);
        return points;
    }

    GroupPtr build_ribbon(const std::vector<chem::Atom> &atoms)
    {
        auto group = std::make_shared<RenderGroup>();
        auto points = ribbon_samples(atoms);
        if (points.empty())
            return group;

        const int tubular = std::min(static_cast<int>(points.size()) * 3, kRibbonMaxTubularSegments);
        Engine::Gfx::CatmullRomCurve curve(std::move(points));

        RenderableEntity r;
        r.mesh = group->addMesh(Engine::Gfx::CreateTube(curve, tubular, kRibbonRadius, kRibbonRadialSegments));
        Material mat = Engine::ECS::SolidMaterial(kRibbonColor);
        mat.doubleSided = true;
        r.material = group->addMaterial(mat);
        group->renderables.push_back(r);
        return group;
    }

    GroupPtr build_point_cloud(const std::vector<chem::Atom> &atoms)
    {
        auto group = std::make_shared<RenderGroup>();
        group->points.pointSize = kPointSize;
        group->points.points.reserve(atoms.size());
        for (const auto &atom : atoms)
        {
            const std::uint32_t hex = chem::element_color_hex(atom.element);
            group->points.points.push_back(Engine::ECS::VertexPC{
                atom.position.x, atom.position.y, atom.position.z,
                static_cast<float>((hex >> 16) & 0xffu) / 255.0f,
                static_cast<float>((hex >> 8) & 0xffu) / 255.0f,
                static_cast<float>(hex & 0xffu) / 255.0f});
        }
        return group;
    }

    Builder builder_for(RepresentationKind kind)
    {
        static constexpr std::array<std::pair<RepresentationKind, Builder>, 6> kBuilders{{
            {RepresentationKind::BallAndStick, &build_ball_and_stick},
            {RepresentationKind::SpaceFill, &build_space_fill},
            {RepresentationKind::Wireframe, &build_wireframe},
            {RepresentationKind::TransparentSurface, &build_transparent_surface},
            {RepresentationKind::Ribbon, &build_ribbon},
            {RepresentationKind::PointCloud, &build_point_cloud},
        }};
        for (const auto &entry : kBuilders)
        {
            if (entry.first == kind)
                return entry.second;
        }
        return &build_ball_and_stick;
    }

    GroupPtr build_representation(RepresentationKind kind, const std::vector<chem::Atom> &atoms)
    {
        return builder_for(kind)(atoms);
    }

} // namespace molxr::repr
