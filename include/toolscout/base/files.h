#pragma once

#include <toolscout/base/path.h>
#include <toolscout/base/stringview.h>

#include <string>
#include <system_error>
#include <vector>

namespace toolscout
{
    enum class FileType
    {
        none,
        not_found,
        regular,
        directory,
        symlink,
        other
    };

    StringLiteral to_string_literal(FileType type) noexcept;

    struct DirectoryEntry
    {
        std::string name;
        FileType type;

        friend bool operator==(const DirectoryEntry& lhs, const DirectoryEntry& rhs) noexcept
        {
            return lhs.type == rhs.type && lhs.name == rhs.name;
        }
        friend bool operator!=(const DirectoryEntry& lhs, const DirectoryEntry& rhs) noexcept { return !(lhs == rhs); }
    };

    // The filesystem queries the resolvers need; tests substitute an in-memory tree.
    struct ReadOnlyFilesystem
    {
        // Immediate children of `dir` without "." and "..", each classified by what it points at.
        // Only a dangling symlink is reported as FileType::symlink.
        virtual std::vector<DirectoryEntry> read_directory(const Path& dir, std::error_code& ec) const = 0;

        // Follows symlinks; a missing target is FileType::not_found and not an error.
        virtual FileType status(const Path& target, std::error_code& ec) const = 0;

        // A regular file the current user may execute.
        virtual bool is_executable(const Path& target) const = 0;

        // Prefixes a relative `target` with the working directory.
        virtual Path absolute(const Path& target, std::error_code& ec) const = 0;

    protected:
        ~ReadOnlyFilesystem() = default;
    };

    extern const ReadOnlyFilesystem& real_filesystem;
}

TOOLSCOUT_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(toolscout::FileType);
