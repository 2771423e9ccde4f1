// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdio>
#include <string>
#include <vector>

#include "molxr/chem/atom.hpp"

namespace molxr::testing
{

    // Fixed-column ATOM/HETATM record: coordinates at [30,54), element at [76,78)
    inline std::string AtomLine(float x, float y, float z, const char *element,
                                const char *atomName = " CA ", const char *record = "ATOM", int serial = 1)
    {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "%-6s%5d %-4s%c%3s %c%4d%c   %8.3f%8.3f%8.3f%6.2f%6.2f          %2s",
                      record, serial, atomName, ' ', "ALA", 'A', 1, ' ', x, y, z, 1.0, 0.0, element);
        return buf;
    }

    // Atoms spaced `spacing` apart along X, all carbon
    inline std::vector<chem::Atom> AtomChain(std::size_t count, float spacing)
    {
        std::vector<chem::Atom> atoms;
        atoms.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
            atoms.push_back(chem::Atom{{static_cast<float>(i) * spacing, 0.0f, 0.0f}, "C"});
        return atoms;
    }

    // PDB text with one carbon record per atom, spaced along X (angstroms)
    inline std::string ChainText(std::size_t count, float spacing = 1.5f)
    {
        std::string text = "HEADER    TEST STRUCTURE\n";
        text.reserve(count * 82 + 64);
        for (std::size_t i = 0; i < count; ++i)
        {
            text += AtomLine(static_cast<float>(i) * spacing, 0.0f, 0.0f, "C", " CA ", "ATOM", static_cast<int>(i % 99999) + 1);
            text += '\n';
        }
        text += "END\n";
        return text;
    }

} // namespace molxr::testing
