// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <vector>

#include "molxr/chem/atom.hpp"

namespace molxr::repr
{
    constexpr float kBondCutoff = 1.8f;

    // Distance-only bond between atoms[a] and atoms[b] (a < b)
    struct Bond
    {
        std::size_t a;
        std::size_t b;
        float length;
    };

    // All pairs closer than `cutoff` (strict), in (a, b) lexicographic order. O(n^2).
    std::vector<Bond> infer_bonds(const std::vector<chem::Atom> &atoms, float cutoff = kBondCutoff);

} // namespace molxr::repr
