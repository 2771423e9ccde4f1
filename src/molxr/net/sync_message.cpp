// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/net/sync_message.hpp"

#include <nlohmann/json.hpp>

namespace molxr::net
{
    using nlohmann::json;

    std::string encode_load_message(std::string_view pdbId)
    {
        json j;
        j["type"] = "load";
        j["pdbId"] = std::string(pdbId);
        return j.dump();
    }

    std::optional<LoadMessage> decode_message(std::string_view text)
    {
        const json j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object())
            return std::nullopt;

        auto type = j.find("type");
        if (type == j.end() || !type->is_string() || type->get<std::string>() != "load")
            return std::nullopt;

        auto id = j.find("pdbId");
        if (id == j.end() || !id->is_string())
            return std::nullopt;

        LoadMessage msg{id->get<std::string>()};
        if (msg.pdbId.empty())
            return std::nullopt;
        return msg;
    }

} // namespace molxr::net
