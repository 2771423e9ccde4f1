// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/net/structure_fetcher.hpp"

#include "molxr/error.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdio>
#include <sys/wait.h>

namespace molxr::net
{

    std::optional<std::string> normalize_structure_id(std::string_view id)
    {
        while (!id.empty() && std::isspace(static_cast<unsigned char>(id.front())))
            id.remove_prefix(1);
        while (!id.empty() && std::isspace(static_cast<unsigned char>(id.back())))
            id.remove_suffix(1);
        if (id.size() != 4)
            return std::nullopt;

        std::string out;
        out.reserve(id.size());
        for (char c : id)
        {
            if (!std::isalnum(static_cast<unsigned char>(c)))
                return std::nullopt;
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
        return out;
    }

    std::string structure_url(std::string_view baseUrl, std::string_view normalizedId)
    {
        std::string url(baseUrl);
        if (!url.empty() && url.back() != '/')
            url.push_back('/');
        url.append(normalizedId);
        url.append(".pdb");
        return url;
    }

    CurlStructureFetcher::CurlStructureFetcher(std::string baseUrl, int timeoutSeconds)
        : m_baseUrl(std::move(baseUrl)),
          m_timeoutSeconds(timeoutSeconds > 0 ? timeoutSeconds : kDefaultFetchTimeoutSeconds)
    {
    }

    std::string CurlStructureFetcher::fetch(const std::string &structureId)
    {
        auto id = normalize_structure_id(structureId);
        if (!id)
            throw FetchFailed(structureId, "not a four-character structure id");

        const std::string url = structure_url(m_baseUrl, *id);
        // The URL is single-quoted for the shell, so it must not contain one itself
        if (url.find('\'') != std::string::npos)
            throw FetchFailed(*id, "base URL contains a quote character");

        // -f turns HTTP errors into a non-zero exit status
        const std::string cmd = "curl -sfL -m " + std::to_string(m_timeoutSeconds) + " '" + url + "' 2>/dev/null";
        spdlog::info("[Fetch] GET {}", url);

        FILE *pipe = popen(cmd.c_str(), "r");
        if (!pipe)
            throw FetchFailed(*id, "could not start curl");

        std::string body;
        char buf[4096];
        std::size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0)
            body.append(buf, n);

        const int status = pclose(pipe);
        if (status == -1)
            throw FetchFailed(*id, "could not read curl exit status");
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
        {
            const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            throw FetchFailed(*id, "curl exited with status " + std::to_string(code));
        }
        if (body.empty())
            throw FetchFailed(*id, "empty response");

        spdlog::debug("[Fetch] {} bytes for {}", body.size(), *id);
        return body;
    }

} // namespace molxr::net
