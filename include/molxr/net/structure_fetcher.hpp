// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace molxr::net
{
    constexpr std::string_view kDefaultStructureBaseUrl = "https://files.rcsb.org/download/";
    constexpr int kDefaultFetchTimeoutSeconds = 30;

    // Source of raw structure text by id. Implementations throw molxr::FetchFailed.
    class StructureFetcher
    {
    public:
        virtual ~StructureFetcher() = default;
        virtual std::string fetch(const std::string &structureId) = 0;
    };

    // Trimmed and uppercased id, or empty when it is not four letters/digits
    std::optional<std::string> normalize_structure_id(std::string_view id);

    // <baseUrl><ID>.pdb, inserting a '/' when the base lacks one
    std::string structure_url(std::string_view baseUrl, std::string_view normalizedId);

    // Blocking download through the curl command-line tool
    class CurlStructureFetcher : public StructureFetcher
    {
    public:
        explicit CurlStructureFetcher(std::string baseUrl = std::string(kDefaultStructureBaseUrl),
                                      int timeoutSeconds = kDefaultFetchTimeoutSeconds);

        std::string fetch(const std::string &structureId) override;

        const std::string &baseUrl() const { return m_baseUrl; }

    private:
        std::string m_baseUrl;
        int m_timeoutSeconds;
    };

} // namespace molxr::net
