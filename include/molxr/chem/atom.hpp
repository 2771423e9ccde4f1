// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <string>

#include "engine/math/Mat4.hpp"

namespace molxr::chem
{
    // One parsed atom record: a position and its element symbol (e.g. "C", "FE")
    struct Atom
    {
        Engine::Math::Vec3 position;
        std::string element;
    };

} // namespace molxr::chem
