#include <toolscout/base/checks.h>
#include <toolscout/base/files.h>
#include <toolscout/base/system.debug.h>

#include <dirent.h>
#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>

namespace
{
    using namespace toolscout;

    std::error_code last_error() { return std::error_code(errno, std::generic_category()); }

    bool missing(int error) noexcept { return error == ENOENT || error == ENOTDIR; }

    FileType type_of(mode_t mode) noexcept
    {
        if (S_ISREG(mode)) return FileType::regular;
        if (S_ISDIR(mode)) return FileType::directory;
        if (S_ISLNK(mode)) return FileType::symlink;
        return FileType::other;
    }

    // What readdir already knows; none means ask stat.
    FileType type_hint(const dirent& entry) noexcept
    {
#if defined(_DIRENT_HAVE_D_TYPE)
        if (entry.d_type == DT_DIR) return FileType::directory;
        if (entry.d_type == DT_REG) return FileType::regular;
        if (entry.d_type != DT_UNKNOWN && entry.d_type != DT_LNK) return FileType::other;
#else
        (void)entry;
#endif
        return FileType::none;
    }

    // Owns an open directory stream.
    struct DirectoryHandle
    {
        explicit DirectoryHandle(const Path& dir) : stream(::opendir(dir.c_str())) { }
        DirectoryHandle(const DirectoryHandle&) = delete;
        DirectoryHandle& operator=(const DirectoryHandle&) = delete;
        ~DirectoryHandle()
        {
            if (stream) Checks::check_exit(TOOLSCOUT_LINE_INFO, ::closedir(stream) == 0);
        }

        DIR* stream;
    };

    struct PosixFilesystem final : ReadOnlyFilesystem
    {
        std::vector<DirectoryEntry> read_directory(const Path& dir, std::error_code& ec) const override
        {
            ec.clear();
            std::vector<DirectoryEntry> entries;
            DirectoryHandle handle{dir};
            if (!handle.stream)
            {
                ec = last_error();
                return entries;
            }

            for (;;)
            {
                errno = 0;
                const dirent* entry = ::readdir(handle.stream);
                if (!entry)
                {
                    if (errno != 0)
                    {
                        ec = last_error();
                        entries.clear();
                    }

                    return entries;
                }

                const StringView name = entry->d_name;
                if (name == "." || name == "..") continue;

                auto type = type_hint(*entry);
                if (type == FileType::none)
                {
                    const auto full = dir / name;
                    struct stat info;
                    if (::stat(full.c_str(), &info) == 0 || ::lstat(full.c_str(), &info) == 0)
                    {
                        type = type_of(info.st_mode);
                    }
                    else if (missing(errno))
                    {
                        Debug::println(full, " disappeared while listing ", dir);
                        continue;
                    }
                    else
                    {
                        ec = last_error();
                        entries.clear();
                        return entries;
                    }
                }

                entries.push_back(DirectoryEntry{name.to_string(), type});
            }
        }

        FileType status(const Path& target, std::error_code& ec) const override
        {
            ec.clear();
            struct stat info;
            if (::stat(target.c_str(), &info) == 0) return type_of(info.st_mode);
            if (missing(errno)) return FileType::not_found;
            ec = last_error();
            return FileType::none;
        }

        bool is_executable(const Path& target) const override
        {
            struct stat info;
            return ::stat(target.c_str(), &info) == 0 && S_ISREG(info.st_mode) && ::access(target.c_str(), X_OK) == 0;
        }

        Path absolute(const Path& target, std::error_code& ec) const override
        {
            ec.clear();
            if (target.is_absolute()) return target;

            std::string cwd(256, '\0');
            while (!::getcwd(&cwd[0], cwd.size()))
            {
                if (errno != ERANGE)
                {
                    ec = last_error();
                    return Path{};
                }

                cwd.resize(cwd.size() * 2);
            }

            cwd.resize(strlen(cwd.c_str()));
            return Path{std::move(cwd)} / target;
        }
    };

    const PosixFilesystem posix_filesystem;
}

namespace toolscout
{
    StringLiteral to_string_literal(FileType type) noexcept
    {
        switch (type)
        {
            case FileType::none: return "none";
            case FileType::not_found: return "not_found";
            case FileType::regular: return "regular";
            case FileType::directory: return "directory";
            case FileType::symlink: return "symlink";
            case FileType::other: return "other";
            default: Checks::unreachable(TOOLSCOUT_LINE_INFO);
        }
    }

    const ReadOnlyFilesystem& real_filesystem = posix_filesystem;
}
