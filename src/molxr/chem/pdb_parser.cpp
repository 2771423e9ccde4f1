// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/chem/pdb_parser.hpp"

#include "molxr/error.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace molxr::chem
{

    namespace detail
    {
        // Fixed PDB columns (0-based start, width)
        constexpr std::size_t kXStart = 30;
        constexpr std::size_t kYStart = 38;
        constexpr std::size_t kZStart = 46;
        constexpr std::size_t kCoordWidth = 8;
        constexpr std::size_t kElementStart = 76;
        constexpr std::size_t kAtomNameStart = 12;
        constexpr std::size_t kSymbolWidth = 2;

        static inline std::string_view column(std::string_view line, std::size_t start, std::size_t width)
        {
            if (start >= line.size())
                return {};
            return line.substr(start, width);
        }

        static inline std::string_view trim(std::string_view s)
        {
            const char *ws = " \t\n\r\f\v";
            auto first = s.find_first_not_of(ws);
            if (first == std::string_view::npos)
                return {};
            auto last = s.find_last_not_of(ws);
            return s.substr(first, last - first + 1);
        }

        static inline bool is_atom_record(std::string_view line)
        {
            return line.rfind("ATOM", 0) == 0 || line.rfind("HETATM", 0) == 0;
        }

        // Leading number of the field, like a lenient float parse; NaN when absent
        static inline float parse_coordinate(std::string_view field, bool &ok)
        {
            std::string_view s = trim(field);
            float value = std::numeric_limits<float>::quiet_NaN();
            if (s.empty())
            {
                ok = false;
                return value;
            }
            if (s.front() == '+')
                s.remove_prefix(1);
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
            if (ec != std::errc{} || ptr == s.data())
            {
                ok = false;
                return std::numeric_limits<float>::quiet_NaN();
            }
            ok = true;
            return value;
        }
    }

    ParseReport parse_pdb_report(std::string_view text, const ParseOptions &options)
    {
        ParseReport report;
        std::size_t lineNumber = 0;
        std::size_t pos = 0;

        while (pos <= text.size())
        {
            std::size_t end = text.find('\n', pos);
            if (end == std::string_view::npos)
                end = text.size();
            std::string_view line = text.substr(pos, end - pos);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            ++lineNumber;
            pos = end + 1;

            if (!detail::is_atom_record(line))
                continue;

            bool okX = false, okY = false, okZ = false;
            Atom atom;
            atom.position.x = detail::parse_coordinate(detail::column(line, detail::kXStart, detail::kCoordWidth), okX);
            atom.position.y = detail::parse_coordinate(detail::column(line, detail::kYStart, detail::kCoordWidth), okY);
            atom.position.z = detail::parse_coordinate(detail::column(line, detail::kZStart, detail::kCoordWidth), okZ);

            if (!(okX && okY && okZ))
            {
                if (options.strict)
                    throw MalformedRecord(lineNumber, !okX ? "x coordinate" : (!okY ? "y coordinate" : "z coordinate"));
                report.malformedLines.push_back(lineNumber);
            }

            std::string_view element = detail::trim(detail::column(line, detail::kElementStart, detail::kSymbolWidth));
            if (element.empty())
            {
                // Older files leave the element column blank; fall back to the atom name
                element = detail::trim(detail::column(line, detail::kAtomNameStart, detail::kSymbolWidth));
            }
            atom.element = std::string(element);

            report.atoms.push_back(std::move(atom));
        }
        return report;
    }

    std::vector<Atom> parse_pdb(std::string_view text)
    {
        return parse_pdb_report(text).atoms;
    }

    void scale_atoms(std::vector<Atom> &atoms, float divisor)
    {
        for (auto &a : atoms)
            a.position = a.position / divisor;
    }

    Engine::Math::Vec3 geometric_center(const std::vector<Atom> &atoms)
    {
        Engine::Math::Vec3 sum{0.0f, 0.0f, 0.0f};
        std::size_t counted = 0;
        for (const auto &a : atoms)
        {
            const auto &p = a.position;
            if (std::isnan(p.x) || std::isnan(p.y) || std::isnan(p.z))
                continue;
            sum = sum + p;
            ++counted;
        }
        if (counted == 0)
            return {0.0f, 0.0f, 0.0f};
        return sum / static_cast<float>(counted);
    }

    void recenter(std::vector<Atom> &atoms)
    {
        const auto center = geometric_center(atoms);
        for (auto &a : atoms)
            a.position = a.position - center;
    }

    float bounding_radius(const std::vector<Atom> &atoms)
    {
        float maxSq = 0.0f;
        for (const auto &a : atoms)
        {
            float d = Engine::Math::lengthSquared(a.position);
            if (d > maxSq)
                maxSq = d;
        }
        return std::sqrt(maxSq);
    }

} // namespace molxr::chem
