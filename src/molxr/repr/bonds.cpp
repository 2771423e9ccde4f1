// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/repr/bonds.hpp"

#include <cmath>

namespace molxr::repr
{

    std::vector<Bond> infer_bonds(const std::vector<chem::Atom> &atoms, float cutoff)
    {
        std::vector<Bond> bonds;
        const float cutoffSq = cutoff * cutoff;
        for (std::size_t i = 0; i < atoms.size(); ++i)
        {
            for (std::size_t j = i + 1; j < atoms.size(); ++j)
            {
                float d2 = Engine::Math::distanceSquared(atoms[i].position, atoms[j].position);
                // NaN compares false, so malformed atoms never bond
                if (d2 < cutoffSq)
                    bonds.push_back(Bond{i, j, std::sqrt(d2)});
            }
        }
        return bonds;
    }

} // namespace molxr::repr
