// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace molxr::repr
{
    enum class RepresentationKind : std::uint8_t
    {
        BallAndStick,
        SpaceFill,
        Wireframe,
        TransparentSurface,
        Ribbon,
        PointCloud
    };

    // Order used by the "cycle style" action. PointCloud is only ever chosen by size.
    constexpr std::array<RepresentationKind, 5> kRepresentationCycle{
        RepresentationKind::BallAndStick,
        RepresentationKind::SpaceFill,
        RepresentationKind::Wireframe,
        RepresentationKind::TransparentSurface,
        RepresentationKind::Ribbon,
    };

    constexpr std::size_t kMaxAtoms = 50000;
    constexpr std::size_t kPointCloudThreshold = 20000;
    constexpr std::size_t kWireframeThreshold = 5000;

    // Level-of-detail choice for a freshly loaded structure.
    // Throws molxr::StructureTooLarge above kMaxAtoms.
    RepresentationKind select_representation(std::size_t atomCount);

    // Position of `kind` in kRepresentationCycle, or -1 when it is not cycled
    int cycle_index_of(RepresentationKind kind);

    // Following position in the cycle; -1 (no cycled style yet) maps to 0
    int next_representation_index(int index);

    RepresentationKind representation_at(int index);

    std::string_view to_string(RepresentationKind kind);

} // namespace molxr::repr
