// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/chem/element_style.hpp"

#include <array>

namespace molxr::chem
{

    namespace detail
    {
        struct ElementStyle
        {
            std::string_view symbol;
            std::uint32_t color;
            float radius;
        };

        // Symbols are matched exactly as they appear in the element column
        static constexpr std::array<ElementStyle, 6> kStyles{{
            {"H", 0xffffff, 0.5f},
            {"C", 0xaaaaaa, 0.77f},
            {"N", 0x0000ff, 0.75f},
            {"O", 0xff0000, 0.73f},
            {"S", 0xffff00, 1.02f},
            {"P", 0xff8000, 1.06f},
        }};

        static inline const ElementStyle *find(std::string_view symbol)
        {
            for (const auto &s : kStyles)
            {
                if (s.symbol == symbol)
                    return &s;
            }
            return nullptr;
        }
    }

    std::uint32_t element_color_hex(std::string_view symbol)
    {
        const auto *s = detail::find(symbol);
        return s ? s->color : kFallbackElementColor;
    }

    float element_radius(std::string_view symbol)
    {
        const auto *s = detail::find(symbol);
        return s ? s->radius : kFallbackElementRadius;
    }

} // namespace molxr::chem
