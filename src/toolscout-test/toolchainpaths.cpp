#include <toolscout-test/util.h>

#include <toolscout/base/diagnostics.h>
#include <toolscout/base/message_sinks.h>

#include <toolscout/buildtools.h>
#include <toolscout/toolchainpaths.h>

using namespace toolscout;
using Test::MockExecutableLocator;
using Test::MockFilesystem;

namespace
{
    const Path XPM_ROOT = "/home/user/.xpm";

    BuildToolDefinition make_tool(StringView name, StringView package_name)
    {
        BuildToolDefinition tool;
        tool.name = name.to_string();
        tool.package_name = package_name.to_string();
        tool.installed_path_suffix = ".content/bin";
        tool.standard_command_name = name.to_string();
        return tool;
    }

    const BuildToolDefinition& builtin(StringView name)
    {
        const auto definition = find_builtin_tool_definition(name);
        REQUIRE(definition != nullptr);
        return *definition;
    }
}

TEST_CASE ("check_settings_path_validity", "[toolchainpaths]")
{
    CHECK_FALSE(check_settings_path_validity("").has_value());
    CHECK(check_settings_path_validity("/opt/gcc").value_or_exit(TOOLSCOUT_LINE_INFO) == "/opt/gcc");
    CHECK(check_settings_path_validity(" ").value_or_exit(TOOLSCOUT_LINE_INFO) == " ");
}

TEST_CASE ("get_tool_base_path", "[toolchainpaths]")
{
    CHECK(get_tool_base_path(builtin("openocd"), XPM_ROOT).native() == "/home/user/.xpm/@xpack-dev-tools/openocd");
    CHECK(get_tool_base_path(builtin("arm-none-eabi"), "relative/").native() ==
          "relative/@xpack-dev-tools/arm-none-eabi-gcc");
}

TEST_CASE ("get_tool_version_folders", "[toolchainpaths]")
{
    MockFilesystem fs;
    const auto tool = make_tool("openocd", "openocd");
    const auto base = get_tool_base_path(tool, XPM_ROOT);
    fs.add_directory(base, "0.12.0-1");
    fs.add_file(base, "notes.txt", false);

    Test::RecordingSink status;
    BufferedDiagnosticContext context{status};
    const auto folders = get_tool_version_folders(context, fs, tool, XPM_ROOT);
    REQUIRE(folders.has_value());
    CHECK(*folders.get() ==
          std::vector<DirectoryEntry>{{"0.12.0-1", FileType::directory}, {"notes.txt", FileType::regular}});
    CHECK(status.text == "scanning tool versions in /home/user/.xpm/@xpack-dev-tools/openocd\n");
    CHECK(context.empty());

    SECTION ("a missing directory is reported")
    {
        BufferedDiagnosticContext bdc{null_sink};
        CHECK_FALSE(get_tool_version_folders(bdc, fs, tool, "/elsewhere").has_value());
        REQUIRE(bdc.errors.size() == 1);
        CHECK_THAT(bdc.errors[0].data(),
                   Catch::StartsWith("failed to list tool versions in /elsewhere/@xpack-dev-tools/openocd"));
    }

    SECTION ("a tool without a package name is never listed")
    {
        BufferedDiagnosticContext bdc{null_sink};
        CHECK_FALSE(get_tool_version_folders(bdc, fs, make_tool("custom", ""), XPM_ROOT).has_value());
        CHECK_FALSE(bdc.empty());
        CHECK_THAT(bdc.to_string(), Catch::Contains("custom has no xpm package name"));
    }
}

TEST_CASE ("find_newest_tool_version picks the greatest directory", "[toolchainpaths]")
{
    MockFilesystem fs;
    const auto tool = make_tool("arm-none-eabi", "arm-none-eabi-gcc");
    const auto base = get_tool_base_path(tool, XPM_ROOT);
    fs.add_directory(base, "1.0.0-0.1.0");
    fs.add_directory(base, "1.2.0-0.1.0");
    fs.add_file(base, "readme.txt", false);

    BufferedDiagnosticContext context{null_sink};
    auto newest = find_newest_tool_version(context, fs, tool, XPM_ROOT);
    REQUIRE(newest.get() != nullptr);
    CHECK(newest.get()->source_name == "1.2.0-0.1.0");
    CHECK(newest.get()->tool_version == std::array<int, 3>{1, 2, 0});
    CHECK(context.empty());
}

TEST_CASE ("find_newest_tool_version ignores everything but directories", "[toolchainpaths]")
{
    MockFilesystem fs;
    const auto tool = make_tool("openocd", "openocd");
    const auto base = get_tool_base_path(tool, XPM_ROOT);
    fs.add_directory(base, "0.11.0-1");
    fs.add_file(base, "99.0.0-1", true);
    fs.directories[base.native()].push_back(DirectoryEntry{"98.0.0-1", FileType::symlink});
    fs.directories[base.native()].push_back(DirectoryEntry{"97.0.0-1", FileType::other});

    BufferedDiagnosticContext quiet{null_sink};
    auto newest = find_newest_tool_version(quiet, fs, tool, XPM_ROOT);
    REQUIRE(newest.get() != nullptr);
    CHECK(newest.get()->source_name == "0.11.0-1");
}

TEST_CASE ("find_newest_tool_version prefers the newer package release", "[toolchainpaths]")
{
    MockFilesystem fs;
    const auto tool = make_tool("openocd", "openocd");
    const auto base = get_tool_base_path(tool, XPM_ROOT);
    fs.add_directory(base, "0.12.0-2");
    fs.add_directory(base, "0.12.0-1");
    fs.add_directory(base, ".cache");

    BufferedDiagnosticContext quiet{null_sink};
    auto newest = find_newest_tool_version(quiet, fs, tool, XPM_ROOT);
    REQUIRE(newest.get() != nullptr);
    CHECK(newest.get()->source_name == "0.12.0-2");
}

TEST_CASE ("find_newest_tool_version failures", "[toolchainpaths]")
{
    MockFilesystem fs;
    const auto tool = make_tool("openocd", "openocd");
    const auto base = get_tool_base_path(tool, XPM_ROOT);

    SECTION ("only all-zero versions")
    {
        fs.add_directory(base, "0.0.0-1.0.0");
        BufferedDiagnosticContext context{null_sink};
        auto newest = find_newest_tool_version(context, fs, tool, XPM_ROOT);
        REQUIRE_FALSE(newest.get());
        CHECK(newest.error() == ToolScanFailure::NoVersionFound);
        REQUIRE(context.errors.size() == 1);
        CHECK_THAT(context.errors[0].data(), Catch::StartsWith("no tool found"));
    }

    SECTION ("an empty directory")
    {
        fs.directories[base.native()];
        BufferedDiagnosticContext context{null_sink};
        auto newest = find_newest_tool_version(context, fs, tool, XPM_ROOT);
        REQUIRE_FALSE(newest.get());
        CHECK(newest.error() == ToolScanFailure::NoVersionFound);
        CHECK_THAT(context.to_string(), Catch::Contains("no tool found"));
    }

    SECTION ("only files")
    {
        fs.add_file(base, "1.0.0-1", true);
        BufferedDiagnosticContext quiet{null_sink};
        auto newest = find_newest_tool_version(quiet, fs, tool, XPM_ROOT);
        REQUIRE_FALSE(newest.get());
        CHECK(newest.error() == ToolScanFailure::NoVersionFound);
    }

    SECTION ("a missing directory")
    {
        BufferedDiagnosticContext context{null_sink};
        auto newest = find_newest_tool_version(context, fs, tool, XPM_ROOT);
        REQUIRE_FALSE(newest.get());
        CHECK(newest.error() == ToolScanFailure::DirectoryMissing);
        REQUIRE(context.errors.size() == 1);
        CHECK_THAT(context.to_string(), !Catch::Contains("no tool found"));
    }

    SECTION ("no package name")
    {
        BufferedDiagnosticContext quiet{null_sink};
        auto newest = find_newest_tool_version(quiet, fs, make_tool("custom", ""), XPM_ROOT);
        REQUIRE_FALSE(newest.get());
        CHECK(newest.error() == ToolScanFailure::DirectoryMissing);
    }
}

TEST_CASE ("validate_managed_toolchain_path", "[toolchainpaths]")
{
    MockFilesystem fs;
    MockExecutableLocator locator;

    SECTION ("the cross compiler toolchain yields its directory")
    {
        const auto& tool = builtin("arm-none-eabi");
        const auto base = get_tool_base_path(tool, XPM_ROOT);
        fs.add_directory(base, "11.3.1-1.1.2");
        fs.add_directory(base, "12.2.1-1.2.1");
        const Path bin = base / "12.2.1-1.2.1/.content/bin";
        locator.resolutions.emplace((bin / "arm-none-eabi-gcc").native(), bin / "arm-none-eabi-gcc");

        BufferedDiagnosticContext context{null_sink};
        const auto result = validate_managed_toolchain_path(context, fs, locator, tool, XPM_ROOT);
        CHECK(result.kind == ToolPathKind::Found);
        CHECK(result.path == bin);
        CHECK(context.empty());
        CHECK(locator.queries == std::vector<std::string>{(bin / "arm-none-eabi-gcc").native()});
    }

    SECTION ("other tools yield the resolved executable")
    {
        const auto& tool = builtin("openocd");
        const auto base = get_tool_base_path(tool, XPM_ROOT);
        fs.add_directory(base, "0.12.0-1");
        const auto executable = base / "0.12.0-1/.content/bin/openocd";
        locator.resolutions.emplace(executable.native(), "/resolved/openocd");

        BufferedDiagnosticContext quiet{null_sink};
        const auto result = validate_managed_toolchain_path(quiet, fs, locator, tool, XPM_ROOT);
        CHECK(result.kind == ToolPathKind::Found);
        CHECK(result.path == Path{"/resolved/openocd"});
        REQUIRE(result.get() != nullptr);
        CHECK(*result.get() == Path{"/resolved/openocd"});
    }

    SECTION ("an executable missing from the newest version")
    {
        const auto& tool = builtin("make");
        const auto base = get_tool_base_path(tool, XPM_ROOT);
        fs.add_directory(base, "4.4.1-1");

        BufferedDiagnosticContext context{null_sink};
        const auto result = validate_managed_toolchain_path(context, fs, locator, tool, XPM_ROOT);
        CHECK(result.kind == ToolPathKind::NotFound);
        CHECK(result.path.empty());
        CHECK(result.get() == nullptr);
        CHECK_THAT(context.to_string(), Catch::Contains("make was not found at"));
    }

    SECTION ("no installation at all")
    {
        BufferedDiagnosticContext quiet{null_sink};
        const auto result = validate_managed_toolchain_path(quiet, fs, locator, builtin("openocd"), XPM_ROOT);
        CHECK(result.kind == ToolPathKind::NotFound);
        CHECK(locator.queries.empty());
    }

    SECTION ("no package name")
    {
        BufferedDiagnosticContext context{null_sink};
        const auto result = validate_managed_toolchain_path(context, fs, locator, make_tool("custom", ""), XPM_ROOT);
        CHECK(result.kind == ToolPathKind::Invalid);
        CHECK(context.errors.size() == 1);
    }
}

TEST_CASE ("validate_cross_compiler_path", "[toolchainpaths]")
{
    MockExecutableLocator locator;

    SECTION ("the compiler itself yields its directory")
    {
        locator.resolutions.emplace("arm-none-eabi-gcc", "/opt/gcc-arm/bin/arm-none-eabi-gcc");
        const auto result = validate_cross_compiler_path(locator, "arm-none-eabi-gcc");
        CHECK(result.kind == ToolPathKind::Found);
        CHECK(result.path == Path{"/opt/gcc-arm/bin"});
    }

    SECTION ("a directory containing the compiler is returned as given")
    {
        locator.resolutions.emplace("/opt/gcc-arm/bin/arm-none-eabi-gcc", "/opt/gcc-arm/bin/arm-none-eabi-gcc");
        const auto result = validate_cross_compiler_path(locator, "/opt/gcc-arm/lib/../bin/");
        CHECK(result.kind == ToolPathKind::Found);
        CHECK(result.path == Path{"/opt/gcc-arm/lib/../bin/"});
        CHECK(locator.queries ==
              std::vector<std::string>{"/opt/gcc-arm/lib/../bin/", "/opt/gcc-arm/bin/arm-none-eabi-gcc"});
    }

    SECTION ("nothing resolves")
    {
        const auto result = validate_cross_compiler_path(locator, "/opt/nothing");
        CHECK(result.kind == ToolPathKind::NotFound);
        CHECK(locator.queries.size() == 2);
    }

    SECTION ("empty input")
    {
        CHECK(validate_cross_compiler_path(locator, "").kind == ToolPathKind::Invalid);
        CHECK(locator.queries.empty());
    }
}

TEST_CASE ("resolve_tool_path", "[toolchainpaths]")
{
    MockExecutableLocator locator;
    auto definition = make_tool("tool", "tool");
    definition.other_command_names = {"a", "b"};

    SECTION ("the raw path wins")
    {
        locator.resolutions.emplace("/opt/tool", "/opt/tool");
        locator.resolutions.emplace("/opt/tool/tool", "/opt/tool/tool");
        CHECK(resolve_tool_path(locator, "/opt/tool", definition).path == Path{"/opt/tool"});
        CHECK(locator.queries.size() == 1);
    }

    SECTION ("then the standard command")
    {
        locator.resolutions.emplace("/opt/tool/tool", "/opt/tool/tool");
        locator.resolutions.emplace("/opt/tool/a", "/opt/tool/a");
        CHECK(resolve_tool_path(locator, "/opt/tool", definition).path == Path{"/opt/tool/tool"});
    }

    SECTION ("alternates with both resolving")
    {
        locator.resolutions.emplace("/opt/tool/a", "a");
        locator.resolutions.emplace("/opt/tool/b", "b");

        const auto first = resolve_tool_path(locator, "/opt/tool", definition);
        CHECK(first.kind == ToolPathKind::Found);
        CHECK(first.path == Path{"a"});

        const auto last = resolve_tool_path(locator, "/opt/tool", definition, AlternateCommandPolicy::LastMatch);
        CHECK(last.kind == ToolPathKind::Found);
        CHECK(last.path == Path{"b"});
    }

    SECTION ("the last match survives a later miss")
    {
        definition.other_command_names = {"a", "b", "c"};
        locator.resolutions.emplace("/opt/tool/b", "b");
        const auto result = resolve_tool_path(locator, "/opt/tool", definition, AlternateCommandPolicy::LastMatch);
        CHECK(result.kind == ToolPathKind::Found);
        CHECK(result.path == Path{"b"});
        CHECK(locator.queries.back() == "/opt/tool/c");
    }

    SECTION ("nothing resolves")
    {
        const auto result = resolve_tool_path(locator, "/opt/tool", definition);
        CHECK(result.kind == ToolPathKind::NotFound);
        CHECK(locator.queries ==
              std::vector<std::string>{"/opt/tool", "/opt/tool/tool", "/opt/tool/a", "/opt/tool/b"});
    }

    SECTION ("empty input")
    {
        CHECK(resolve_tool_path(locator, "", definition).kind == ToolPathKind::Invalid);
        CHECK(locator.queries.empty());
    }
}

TEST_CASE ("tool path enums format", "[toolchainpaths]")
{
    CHECK(fmt::format("{}", ToolScanFailure::DirectoryMissing) == "DirectoryMissing");
    CHECK(fmt::format("{}", ToolScanFailure::NoVersionFound) == "NoVersionFound");
    CHECK(fmt::format("{}", ToolPathKind::Invalid) == "Invalid");
}
