#include <toolscout-test/util.h>

#include <toolscout/base/system.h>

#include <toolscout/buildtools.h>
#include <toolscout/commands.h>

using namespace toolscout;

TEST_CASE ("choose_command", "[commands]")
{
    for (auto&& name : {"managed", "newest", "check", "list", "help"})
    {
        const auto registration = choose_command(name);
        REQUIRE(registration != nullptr);
        CHECK(registration->name == name);
    }

    CHECK(choose_command("fetch") == nullptr);
    CHECK(choose_command("") == nullptr);
}

TEST_CASE ("get_xpm_root", "[commands]")
{
    set_environment_variable(EnvironmentVariableXpmRoot, nullopt);
    CHECK_FALSE(get_xpm_root(nullopt).has_value());
    CHECK_FALSE(get_xpm_root(std::string()).has_value());
    CHECK(get_xpm_root(std::string("/opt/xpm")) == Optional<Path>{Path{"/opt/xpm"}});

    set_environment_variable(EnvironmentVariableXpmRoot, std::string("/from/env"));
    CHECK(get_xpm_root(nullopt) == Optional<Path>{Path{"/from/env"}});
    CHECK(get_xpm_root(std::string()) == Optional<Path>{Path{"/from/env"}});
    CHECK(get_xpm_root(std::string("/opt/xpm")) == Optional<Path>{Path{"/opt/xpm"}});

    set_environment_variable(EnvironmentVariableXpmRoot, std::string());
    CHECK_FALSE(get_xpm_root(nullopt).has_value());
    set_environment_variable(EnvironmentVariableXpmRoot, nullopt);
}

TEST_CASE ("format_tool_definition", "[commands]")
{
    CHECK(format_tool_definition(*find_builtin_tool_definition("openocd")) ==
          "openocd: package openocd, command .content/bin/openocd");
    CHECK(format_tool_definition(*find_builtin_tool_definition("make")) ==
          "make: package windows-build-tools, command .content/bin/make (alternates: mingw32-make, gmake)");
}

TEST_CASE ("alternate_command_policy", "[commands]")
{
    CHECK(alternate_command_policy(false) == AlternateCommandPolicy::FirstMatch);
    CHECK(alternate_command_policy(true) == AlternateCommandPolicy::LastMatch);
}

TEST_CASE ("check_tool_path", "[commands]")
{
    Test::MockExecutableLocator locator;

    SECTION ("--last-alternate-match picks the last resolving alternate")
    {
        const auto& make = *find_builtin_tool_definition("make");
        locator.resolutions.emplace("/opt/make/mingw32-make", "/opt/make/mingw32-make");
        locator.resolutions.emplace("/opt/make/gmake", "/opt/make/gmake");

        const auto first = check_tool_path(locator, make, "/opt/make", alternate_command_policy(false));
        CHECK(first.kind == ToolPathKind::Found);
        CHECK(first.path == Path{"/opt/make/mingw32-make"});

        const auto last = check_tool_path(locator, make, "/opt/make", alternate_command_policy(true));
        CHECK(last.kind == ToolPathKind::Found);
        CHECK(last.path == Path{"/opt/make/gmake"});
    }

    SECTION ("the cross compiler yields its directory")
    {
        const auto& toolchain = *find_builtin_tool_definition("arm-none-eabi");
        locator.resolutions.emplace("/opt/gcc/bin/arm-none-eabi-gcc", "/opt/gcc/bin/arm-none-eabi-gcc");
        const auto result = check_tool_path(locator, toolchain, "/opt/gcc/bin", AlternateCommandPolicy::FirstMatch);
        CHECK(result.kind == ToolPathKind::Found);
        CHECK(result.path == Path{"/opt/gcc/bin"});
    }

    SECTION ("failures")
    {
        const auto& openocd = *find_builtin_tool_definition("openocd");
        CHECK(check_tool_path(locator, openocd, "", AlternateCommandPolicy::FirstMatch).kind ==
              ToolPathKind::Invalid);
        CHECK(check_tool_path(locator, openocd, "/nonexistent", AlternateCommandPolicy::FirstMatch).kind ==
              ToolPathKind::NotFound);
    }
}
