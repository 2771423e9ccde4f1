// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace molxr::net
{

    // Instruction shared between viewers through the relay: show structure `pdbId`
    struct LoadMessage
    {
        std::string pdbId;
    };

    // {"type":"load","pdbId":"<id>"}
    std::string encode_load_message(std::string_view pdbId);

    // Empty for invalid JSON, other message types, or a missing/empty/non-string pdbId
    std::optional<LoadMessage> decode_message(std::string_view text);

} // namespace molxr::net
