#include <toolscout-test/util.h>

#include <toolscout/base/files.h>

#include <algorithm>

using namespace toolscout;

namespace
{
    std::vector<DirectoryEntry> sorted_listing(const Path& dir)
    {
        std::error_code ec;
        auto entries = real_filesystem.read_directory(dir, ec);
        CHECK_EC(ec);
        std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& lhs, const DirectoryEntry& rhs) {
            return lhs.name < rhs.name;
        });
        return entries;
    }
}

TEST_CASE ("read_directory classifies entries", "[files]")
{
    const auto base = Test::base_temporary_directory() / "read-directory";
    Test::make_directory(base);
    Test::make_directory(base / "12.2.1-1.2.1");
    Test::make_file(base / "readme.txt", false);
    Test::make_symlink("12.2.1-1.2.1", base / "latest");
    Test::make_symlink("readme.txt", base / "notes");
    Test::make_symlink("does-not-exist", base / "dangling");

    CHECK(sorted_listing(base) == std::vector<DirectoryEntry>{
                                      {"12.2.1-1.2.1", FileType::directory},
                                      {"dangling", FileType::symlink},
                                      {"latest", FileType::directory},
                                      {"notes", FileType::regular},
                                      {"readme.txt", FileType::regular},
                                  });

    CHECK(sorted_listing(base / "12.2.1-1.2.1").empty());
    Test::remove_all(base);
}

TEST_CASE ("read_directory on a missing directory is an error", "[files]")
{
    std::error_code ec;
    const auto entries = real_filesystem.read_directory(Test::base_temporary_directory() / "no-such-directory", ec);
    CHECK(ec);
    CHECK(entries.empty());
}

TEST_CASE ("status and is_executable", "[files]")
{
    const auto base = Test::base_temporary_directory() / "status";
    Test::make_directory(base);
    Test::make_file(base / "tool", true);
    Test::make_file(base / "data", false);
    Test::make_symlink("tool", base / "tool-link");

    std::error_code ec;
    CHECK(real_filesystem.status(base, ec) == FileType::directory);
    CHECK_EC(ec);
    CHECK(real_filesystem.status(base / "tool-link", ec) == FileType::regular);
    CHECK_EC(ec);
    CHECK(real_filesystem.status(base / "missing", ec) == FileType::not_found);
    CHECK_EC(ec);

    CHECK(real_filesystem.status(base / "tool", ec) == FileType::regular);
    CHECK_EC(ec);

    CHECK(real_filesystem.is_executable(base / "tool"));
    CHECK(real_filesystem.is_executable(base / "tool-link"));
    CHECK_FALSE(real_filesystem.is_executable(base / "data"));
    CHECK_FALSE(real_filesystem.is_executable(base));
    CHECK_FALSE(real_filesystem.is_executable(base / "missing"));
    Test::remove_all(base);
}

TEST_CASE ("absolute", "[files]")
{
    std::error_code ec;
    CHECK(real_filesystem.absolute("/already/absolute", ec) == Path{"/already/absolute"});
    CHECK_EC(ec);

    const auto relative = real_filesystem.absolute("relative/tool", ec);
    CHECK_EC(ec);
    CHECK(relative.is_absolute());
    CHECK(relative.filename() == "tool");
    CHECK(Path{relative.parent_path()}.filename() == "relative");
}

TEST_CASE ("FileType formats", "[files]")
{
    CHECK(fmt::format("{}", FileType::directory) == "directory");
    CHECK(fmt::format("{}", FileType::not_found) == "not_found");
}
