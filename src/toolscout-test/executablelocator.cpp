#include <toolscout-test/util.h>

#include <toolscout/executablelocator.h>

using namespace toolscout;

TEST_CASE ("PathExecutableLocator with the real filesystem", "[executablelocator]")
{
    const auto base = Test::base_temporary_directory() / "locator";
    const auto first_bin = base / "first";
    const auto second_bin = base / "second";
    Test::make_directory(base);
    Test::make_directory(first_bin);
    Test::make_directory(second_bin);
    Test::make_file(first_bin / "data", false);
    Test::make_file(second_bin / "data", true);
    Test::make_file(first_bin / "tool", true);
    Test::make_file(second_bin / "tool", true);
    Test::make_directory(second_bin / "folder");

    const PathExecutableLocator locator{real_filesystem, {first_bin.native(), second_bin.native()}};

    CHECK(locator.locate("tool") == Optional<Path>{first_bin / "tool"});
    CHECK(locator.locate("data") == Optional<Path>{second_bin / "data"});
    CHECK_FALSE(locator.locate("folder").has_value());
    CHECK_FALSE(locator.locate("missing").has_value());
    CHECK_FALSE(locator.locate("").has_value());

    CHECK(locator.locate((second_bin / "tool").native()) == Optional<Path>{second_bin / "tool"});
    CHECK(locator.locate((first_bin / "../second/./tool").native()) == Optional<Path>{second_bin / "tool"});
    CHECK_FALSE(locator.locate((first_bin / "data").native()).has_value());
    CHECK_FALSE(locator.locate((second_bin / "folder").native()).has_value());
    Test::remove_all(base);
}

TEST_CASE ("PathExecutableLocator makes relative paths absolute", "[executablelocator]")
{
    Test::MockFilesystem fs;
    fs.executables.insert("bin/../tools/openocd");

    const PathExecutableLocator locator{fs, {}};
    CHECK(locator.locate("bin/../tools/openocd") == Optional<Path>{Path{"/work/tools/openocd"}});
    CHECK_FALSE(locator.locate("openocd").has_value());
}

TEST_CASE ("PathExecutableLocator searches in order", "[executablelocator]")
{
    Test::MockFilesystem fs;
    fs.executables.insert("/usr/local/bin/make");
    fs.executables.insert("/usr/bin/make");
    fs.executables.insert("/usr/bin/gmake");

    const PathExecutableLocator locator{fs, {"/usr/local/bin", "/usr/bin"}};
    CHECK(locator.locate("make") == Optional<Path>{Path{"/usr/local/bin/make"}});
    CHECK(locator.locate("gmake") == Optional<Path>{Path{"/usr/bin/gmake"}});
    CHECK_FALSE(locator.locate("mingw32-make").has_value());
}

TEST_CASE ("PathExecutableLocator treats an empty search entry as the working directory", "[executablelocator]")
{
    Test::MockFilesystem fs;
    fs.executables.insert("/usr/bin/make");
    fs.executables.insert("./flash");

    const PathExecutableLocator locator{fs, Strings::split_paths("/usr/bin::")};
    CHECK(locator.locate("make") == Optional<Path>{Path{"/usr/bin/make"}});
    CHECK(locator.locate("flash") == Optional<Path>{Path{"/work/flash"}});
    CHECK_FALSE(locator.locate("gmake").has_value());
}
