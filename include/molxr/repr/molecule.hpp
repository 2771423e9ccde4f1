// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <string>
#include <vector>

#include "molxr/chem/atom.hpp"
#include "molxr/repr/builders.hpp"
#include "molxr/repr/representation.hpp"

namespace molxr::repr
{

    // The structure currently on display and the representation it is shown with
    struct Molecule
    {
        std::vector<chem::Atom> atoms;
        std::string sourceId;
        RepresentationKind activeKind{RepresentationKind::BallAndStick};
        int activeRepresentationIndex{0}; // -1 while shown as a point cloud
        float uniformScale{1.0f};
        GroupPtr currentGroup;
    };

} // namespace molxr::repr
