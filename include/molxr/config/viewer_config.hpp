// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace molxr::config
{

    struct ViewerConfig
    {
        // Relay the load messages are exchanged through
        std::string syncHost{"localhost"};
        int syncPort{8080};

        std::string fetchBaseUrl{"https://files.rcsb.org/download/"};
        int fetchTimeoutSeconds{30};

        float panelDistance{1.0f};
        float stickDeadZone{0.2f};
        double longPressSeconds{0.4};
        std::vector<std::string> quickLoadIds{"1CRN", "2POR", "5PTI", "4HHB", "1A4W"};

        float transitionSeconds{0.5f};

        std::string logLevel{"info"};
    };

    ViewerConfig default_config();

    // Fills a config from JSON, keeping defaults for absent keys.
    // Throws molxr::ConfigError when a present key has the wrong type or an invalid value.
    ViewerConfig config_from_json(const nlohmann::json &j);

    // Missing file yields the defaults; an unreadable or invalid file throws molxr::ConfigError
    ViewerConfig load_config(const std::string &path);

    // PORT overrides sync.port when it holds a valid port number
    void apply_environment(ViewerConfig &config);

    // <assets>/config/viewer.json
    std::string default_config_path();

} // namespace molxr::config
