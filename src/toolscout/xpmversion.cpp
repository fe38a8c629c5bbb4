#include <toolscout/base/strings.h>

#include <toolscout/xpmversion.h>

#include <algorithm>
#include <iterator>

namespace
{
    using namespace toolscout;

    std::array<int, 3> parse_version_triple(StringView dotted)
    {
        std::array<int, 3> result{};
        size_t component = 0;
        auto first = dotted.begin();
        const auto last = dotted.end();
        while (component < result.size())
        {
            const auto dot = std::find(first, last, '.');
            result[component] = Strings::parse_leading_int(StringView{first, dot}).value_or(0);
            ++component;
            if (dot == last)
            {
                break;
            }

            first = dot + 1;
        }

        return result;
    }

    // -1, 0 or 1 as lhs is less than, equal to, or greater than rhs
    int compare_triples(const std::array<int, 3>& lhs, const std::array<int, 3>& rhs) noexcept
    {
        for (size_t idx = 0; idx < lhs.size(); ++idx)
        {
            if (lhs[idx] > rhs[idx]) return 1;
            if (lhs[idx] < rhs[idx]) return -1;
        }

        return 0;
    }
}

namespace toolscout
{
    std::string XpmToolVersion::to_string() const { return adapt_to_string(*this); }
    void XpmToolVersion::to_string(std::string& out) const
    {
        fmt::format_to(std::back_inserter(out),
                       "{}.{}.{}-{}.{}.{}",
                       tool_version[0],
                       tool_version[1],
                       tool_version[2],
                       xpm_version[0],
                       xpm_version[1],
                       xpm_version[2]);
    }

    bool operator==(const XpmToolVersion& lhs, const XpmToolVersion& rhs) noexcept
    {
        return lhs.tool_version == rhs.tool_version && lhs.xpm_version == rhs.xpm_version &&
               lhs.source_name == rhs.source_name;
    }

    bool operator!=(const XpmToolVersion& lhs, const XpmToolVersion& rhs) noexcept { return !(lhs == rhs); }

    XpmToolVersion parse_xpm_version(StringView directory_name)
    {
        const auto parts = Strings::split_once(directory_name, '-');
        XpmToolVersion result;
        result.tool_version = parse_version_triple(parts.first);
        result.xpm_version = parse_version_triple(parts.second);
        result.source_name = directory_name.to_string();
        return result;
    }

    bool is_real_version(const XpmToolVersion& version) noexcept
    {
        return version.tool_version[0] != 0 || version.tool_version[1] != 0 || version.tool_version[2] != 0;
    }

    XpmToolVersion newer_version(const Optional<XpmToolVersion>& current, const XpmToolVersion& candidate)
    {
        const auto existing = current.get();
        if (!existing)
        {
            return candidate;
        }

        int cmp = compare_triples(existing->tool_version, candidate.tool_version);
        if (cmp == 0)
        {
            cmp = compare_triples(existing->xpm_version, candidate.xpm_version);
        }

        return cmp < 0 ? candidate : *existing;
    }
}
