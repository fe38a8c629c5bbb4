#include <toolscout-test/util.h>

#include <toolscout/base/checks.h>

#include <fcntl.h>
#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>

namespace
{
    int remove_entry(const char* fpath, const struct stat*, int, struct FTW*) { return ::remove(fpath); }
}

namespace toolscout::Test
{
    void MockFilesystem::add_directory(const Path& parent, StringView name)
    {
        directories[parent.native()].push_back(DirectoryEntry{name.to_string(), FileType::directory});
        directories[(parent / name).native()];
    }

    void MockFilesystem::add_file(const Path& parent, StringView name, bool executable)
    {
        directories[parent.native()].push_back(DirectoryEntry{name.to_string(), FileType::regular});
        const auto full = (parent / name).native();
        regular_files.insert(full);
        if (executable)
        {
            executables.insert(full);
        }
    }

    std::vector<DirectoryEntry> MockFilesystem::read_directory(const Path& dir, std::error_code& ec) const
    {
        const auto it = directories.find(dir.native());
        if (it == directories.end())
        {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
            return {};
        }

        ec.clear();
        return it->second;
    }

    FileType MockFilesystem::status(const Path& target, std::error_code& ec) const
    {
        ec.clear();
        if (directories.count(target.native()) != 0)
        {
            return FileType::directory;
        }

        if (regular_files.count(target.native()) != 0 || executables.count(target.native()) != 0)
        {
            return FileType::regular;
        }

        return FileType::not_found;
    }

    bool MockFilesystem::is_executable(const Path& target) const { return executables.count(target.native()) != 0; }

    Path MockFilesystem::absolute(const Path& target, std::error_code& ec) const
    {
        ec.clear();
        if (target.is_absolute())
        {
            return target;
        }

        return working_directory / target;
    }

    Optional<Path> MockExecutableLocator::locate(StringView candidate) const
    {
        queries.push_back(candidate.to_string());
        const auto it = resolutions.find(candidate.to_string());
        if (it == resolutions.end())
        {
            return nullopt;
        }

        return it->second;
    }

    static Path internal_base_temporary_directory()
    {
        std::string templ = "/tmp/toolscout-test-XXXXXX";
        Checks::check_exit(TOOLSCOUT_LINE_INFO, ::mkdtemp(&templ[0]) != nullptr);
        return templ;
    }

    const Path& base_temporary_directory()
    {
        static const Path BASE_TEMPORARY_DIRECTORY = internal_base_temporary_directory();
        return BASE_TEMPORARY_DIRECTORY;
    }

    void make_directory(const Path& target) { REQUIRE(::mkdir(target.c_str(), 0755) == 0); }

    void make_file(const Path& target, bool executable)
    {
        const int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC, executable ? 0755 : 0644);
        REQUIRE(fd >= 0);
        ::close(fd);
    }

    void make_symlink(const Path& target, const Path& link) { REQUIRE(::symlink(target.c_str(), link.c_str()) == 0); }

    void remove_all(const Path& target) { CHECK(::nftw(target.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS) == 0); }
}
