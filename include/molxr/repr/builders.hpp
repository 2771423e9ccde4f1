// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "engine/scene/Scene.hpp"
#include "molxr/chem/atom.hpp"
#include "molxr/repr/representation.hpp"

namespace molxr::repr
{
    using GroupPtr = std::shared_ptr<Engine::Scene::RenderGroup>;
    using Builder = GroupPtr (*)(const std::vector<chem::Atom> &);

    // Geometry constants shared by the builders and their callers
    constexpr float kAtomSphereRadius = 0.3f;
    constexpr float kBondRadius = 0.1f;
    constexpr int kBondSlices = 8;
    constexpr std::uint32_t kBondColor = 0xdddddd;
    constexpr std::size_t kMaxAtomsForBonds = 2000;
    constexpr std::size_t kMaxAtomsForSurface = 2000;
    constexpr float kSurfaceOpacity = 0.4f;
    constexpr float kRibbonRadius = 0.2f;
    constexpr int kRibbonRadialSegments = 8;
    constexpr std::size_t kRibbonTargetSamples = 300;
    constexpr int kRibbonMaxTubularSegments = 1000;
    constexpr std::uint32_t kRibbonColor = 0x00ccff;
    constexpr float kPointSize = 0.15f;

    GroupPtr build_ball_and_stick(const std::vector<chem::Atom> &atoms);
    GroupPtr build_space_fill(const std::vector<chem::Atom> &atoms);
    GroupPtr build_wireframe(const std::vector<chem::Atom> &atoms);
    GroupPtr build_transparent_surface(const std::vector<chem::Atom> &atoms);
    GroupPtr build_ribbon(const std::vector<chem::Atom> &atoms);
    GroupPtr build_point_cloud(const std::vector<chem::Atom> &atoms);

    // Backbone trace used by the ribbon: every stride-th atom plus the final atom
    std::vector<Engine::Math::Vec3> ribbon_samples(const std::vector<chem::Atom> &atoms);

    Builder builder_for(RepresentationKind kind);

    GroupPtr build_representation(RepresentationKind kind, const std::vector<chem::Atom> &atoms);

} // namespace molxr::repr
