// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "molxr/chem/atom.hpp"

namespace molxr::chem
{
    // Ratio between the record format's length unit (angstrom) and scene units
    constexpr float kAngstromsPerSceneUnit = 10.0f;

    struct ParseOptions
    {
        // Throw MalformedRecord on a non-numeric coordinate instead of storing NaN
        bool strict{false};
    };

    struct ParseReport
    {
        std::vector<Atom> atoms;
        // 1-based line numbers of atom records with an unreadable coordinate
        std::vector<std::size_t> malformedLines;
    };

    // Parse ATOM/HETATM records from fixed-column PDB text. All other records are skipped.
    ParseReport parse_pdb_report(std::string_view text, const ParseOptions &options = {});

    std::vector<Atom> parse_pdb(std::string_view text);

    // Divide every coordinate by `divisor` (unit conversion done by the load path)
    void scale_atoms(std::vector<Atom> &atoms, float divisor = kAngstromsPerSceneUnit);

    Engine::Math::Vec3 geometric_center(const std::vector<Atom> &atoms);

    // Translate atoms so their geometric center sits at the origin
    void recenter(std::vector<Atom> &atoms);

    // Largest distance of any atom from the origin
    float bounding_radius(const std::vector<Atom> &atoms);

} // namespace molxr::chem
