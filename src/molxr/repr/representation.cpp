// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/repr/representation.hpp"

#include "molxr/error.hpp"

namespace molxr::repr
{

    RepresentationKind select_representation(std::size_t atomCount)
    {
        if (atomCount > kMaxAtoms)
            throw StructureTooLarge(atomCount, kMaxAtoms);
        if (atomCount > kPointCloudThreshold)
            return RepresentationKind::PointCloud;
        if (atomCount > kWireframeThreshold)
            return RepresentationKind::Wireframe;
        return RepresentationKind::BallAndStick;
    }

    int cycle_index_of(RepresentationKind kind)
    {
        for (std::size_t i = 0; i < kRepresentationCycle.size(); ++i)
        {
            if (kRepresentationCycle[i] == kind)
                return static_cast<int>(i);
        }
        return -1;
    }

    int next_representation_index(int index)
    {
        const int n = static_cast<int>(kRepresentationCycle.size());
        if (index < 0)
            return 0;
        return (index + 1) % n;
    }

    RepresentationKind representation_at(int index)
    {
        const int n = static_cast<int>(kRepresentationCycle.size());
        int i = index % n;
        if (i < 0)
            i += n;
        return kRepresentationCycle[static_cast<std::size_t>(i)];
    }

    std::string_view to_string(RepresentationKind kind)
    {
        switch (kind)
        {
        case RepresentationKind::BallAndStick:
            return "Ball and Stick";
        case RepresentationKind::SpaceFill:
            return "Space Fill";
        case RepresentationKind::Wireframe:
            return "Wireframe";
        case RepresentationKind::TransparentSurface:
            return "Transparent Surface";
        case RepresentationKind::Ribbon:
            return "Ribbon";
        case RepresentationKind::PointCloud:
            return "Point Cloud";
        default:
            return "Unknown";
        }
    }

} // namespace molxr::repr
