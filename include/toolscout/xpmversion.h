#pragma once

#include <toolscout/base/fmt.h>
#include <toolscout/base/optional.h>
#include <toolscout/base/stringview.h>

#include <array>
#include <string>

namespace toolscout
{
    // The version encoded in an xpm install directory name, "<tool version>-<package version>",
    // for example "12.2.1-1.2" is tool 12.2.1 packaged as xpm release 1.2.0.
    struct XpmToolVersion
    {
        std::array<int, 3> tool_version{}; // major, middle, minor
        std::array<int, 3> xpm_version{};  // major, middle, minor
        std::string source_name;           // the directory name this was parsed from

        std::string to_string() const;
        void to_string(std::string& out) const;
    };

    bool operator==(const XpmToolVersion& lhs, const XpmToolVersion& rhs) noexcept;
    bool operator!=(const XpmToolVersion& lhs, const XpmToolVersion& rhs) noexcept;

    // Never fails; segments that are missing or do not start with a digit become 0.
    XpmToolVersion parse_xpm_version(StringView directory_name);

    // A version whose tool_version is 0.0.0 did not come from a version-named directory.
    bool is_real_version(const XpmToolVersion& version) noexcept;

    // Reducer for a max-fold over candidate versions: returns `candidate` when `current` is empty, otherwise
    // whichever is greater by tool_version then xpm_version, preferring `current` on a tie.
    XpmToolVersion newer_version(const Optional<XpmToolVersion>& current, const XpmToolVersion& candidate);
}

TOOLSCOUT_FORMAT_WITH_TO_STRING(toolscout::XpmToolVersion);
