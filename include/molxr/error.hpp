// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace molxr
{
    // Base for every failure the viewer core reports by exception
    class Error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Remote structure could not be retrieved (transport error or non-success response)
    class FetchFailed : public Error
    {
    public:
        FetchFailed(std::string structureId, const std::string &reason)
            : Error("Failed to fetch structure " + structureId + ": " + reason),
              m_structureId(std::move(structureId)) {}

        const std::string &structureId() const { return m_structureId; }

    private:
        std::string m_structureId;
    };

    class StructureTooLarge : public Error
    {
    public:
        StructureTooLarge(std::size_t atomCount, std::size_t limit)
            : Error("Structure too large for viewer: " + std::to_string(atomCount) +
                    " atoms (limit " + std::to_string(limit) + ")"),
              m_atomCount(atomCount), m_limit(limit) {}

        std::size_t atomCount() const { return m_atomCount; }
        std::size_t limit() const { return m_limit; }

    private:
        std::size_t m_atomCount;
        std::size_t m_limit;
    };

    // Raised only by the strict parser; the default parser records NaN instead
    class MalformedRecord : public Error
    {
    public:
        MalformedRecord(std::size_t lineNumber, const std::string &field)
            : Error("Malformed " + field + " field on line " + std::to_string(lineNumber)),
              m_lineNumber(lineNumber) {}

        std::size_t lineNumber() const { return m_lineNumber; }

    private:
        std::size_t m_lineNumber;
    };

    class ConfigError : public Error
    {
    public:
        using Error::Error;
    };

} // namespace molxr
