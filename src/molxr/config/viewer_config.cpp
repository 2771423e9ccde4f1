// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/config/viewer_config.hpp"

#include "molxr/error.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace molxr::config
{
// Define a default assets root if the build didn't provide one
#ifndef MOLXR_ASSETS_DIR
#define MOLXR_ASSETS_DIR "assets"
#endif

    using nlohmann::json;

    namespace detail
    {
        static const json *section(const json &j, const char *name)
        {
            auto it = j.find(name);
            if (it == j.end())
                return nullptr;
            if (!it->is_object())
                throw ConfigError(std::string("Config section '") + name + "' must be an object");
            return &*it;
        }

        // Reads `sec.key` into `out` when present; type mismatches become ConfigError
        template <typename T>
        static void read(const json *sec, const char *secName, const char *key, T &out)
        {
            if (!sec)
                return;
            auto it = sec->find(key);
            if (it == sec->end())
                return;
            try
            {
                out = it->get<T>();
            }
            catch (const json::exception &e)
            {
                throw ConfigError(std::string("Config key '") + secName + "." + key + "': " + e.what());
            }
        }

        static bool valid_port(long port) { return port > 0 && port <= 65535; }
    }

    ViewerConfig default_config()
    {
        return ViewerConfig{};
    }

    ViewerConfig config_from_json(const json &j)
    {
        if (!j.is_object())
            throw ConfigError("Config root must be an object");

        ViewerConfig cfg;
        const json *sync = detail::section(j, "sync");
        detail::read(sync, "sync", "host", cfg.syncHost);
        detail::read(sync, "sync", "port", cfg.syncPort);

        const json *fetch = detail::section(j, "fetch");
        detail::read(fetch, "fetch", "baseUrl", cfg.fetchBaseUrl);
        detail::read(fetch, "fetch", "timeoutSeconds", cfg.fetchTimeoutSeconds);

        const json *ui = detail::section(j, "ui");
        detail::read(ui, "ui", "panelDistance", cfg.panelDistance);
        detail::read(ui, "ui", "stickDeadZone", cfg.stickDeadZone);
        detail::read(ui, "ui", "longPressSeconds", cfg.longPressSeconds);
        detail::read(ui, "ui", "quickLoadIds", cfg.quickLoadIds);

        const json *transition = detail::section(j, "transition");
        detail::read(transition, "transition", "seconds", cfg.transitionSeconds);

        const json *log = detail::section(j, "log");
        detail::read(log, "log", "level", cfg.logLevel);

        if (!detail::valid_port(cfg.syncPort))
            throw ConfigError("sync.port out of range: " + std::to_string(cfg.syncPort));
        if (cfg.fetchTimeoutSeconds <= 0)
            throw ConfigError("fetch.timeoutSeconds must be positive");
        if (cfg.panelDistance <= 0.0f)
            throw ConfigError("ui.panelDistance must be positive");
        if (cfg.stickDeadZone < 0.0f || cfg.stickDeadZone >= 1.0f)
            throw ConfigError("ui.stickDeadZone must be in [0, 1)");
        if (cfg.longPressSeconds <= 0.0)
            throw ConfigError("ui.longPressSeconds must be positive");
        if (cfg.transitionSeconds <= 0.0f)
            throw ConfigError("transition.seconds must be positive");
        return cfg;
    }

    ViewerConfig load_config(const std::string &path)
    {
        std::ifstream f(path);
        if (!f)
        {
            spdlog::debug("[Config] {} not found, using defaults", path);
            return default_config();
        }

        json j = json::parse(f, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded())
            throw ConfigError("Invalid JSON in " + path);

        ViewerConfig cfg = config_from_json(j);
        spdlog::info("[Config] Loaded {}", path);
        return cfg;
    }

    void apply_environment(ViewerConfig &config)
    {
        const char *port = std::getenv("PORT");
        if (!port || *port == '\0')
            return;

        long value = 0;
        const char *end = port + std::strlen(port);
        auto [ptr, ec] = std::from_chars(port, end, value);
        if (ec != std::errc{} || ptr != end || !detail::valid_port(value))
        {
            spdlog::warn("[Config] Ignoring invalid PORT value '{}'", port);
            return;
        }
        config.syncPort = static_cast<int>(value);
    }

    std::string default_config_path()
    {
        return std::string(MOLXR_ASSETS_DIR) + "/config/viewer.json";
    }

} // namespace molxr::config
