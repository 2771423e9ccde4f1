// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <string_view>

namespace molxr::chem
{
    constexpr std::uint32_t kFallbackElementColor = 0x888888;
    constexpr float kFallbackElementRadius = 0.8f;

    // Display color for an element symbol as 0xRRGGBB. Unknown symbols get neutral gray.
    std::uint32_t element_color_hex(std::string_view symbol);

    // Space-filling radius in scene units
    float element_radius(std::string_view symbol);

} // namespace molxr::chem
