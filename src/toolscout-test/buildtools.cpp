#include <toolscout-test/util.h>

#include <toolscout/buildtools.h>

using namespace toolscout;

TEST_CASE ("builtin tool definitions", "[buildtools]")
{
    const auto& definitions = get_builtin_tool_definitions();
    REQUIRE(definitions.size() == 3);

    const auto arm = find_builtin_tool_definition("arm-none-eabi");
    REQUIRE(arm != nullptr);
    CHECK(arm->package_name == "arm-none-eabi-gcc");
    CHECK(arm->installed_path_suffix == ".content/bin");
    CHECK(arm->standard_command_name == "arm-none-eabi-gcc");
    CHECK(arm->other_command_names ==
          std::vector<std::string>{"arm-none-eabi-g++", "arm-none-eabi-objcopy", "arm-none-eabi-size"});
    CHECK(is_cross_compiler_toolchain(*arm));

    const auto openocd = find_builtin_tool_definition("openocd");
    REQUIRE(openocd != nullptr);
    CHECK(openocd->package_name == "openocd");
    CHECK(openocd->standard_command_name == "openocd");
    CHECK(openocd->other_command_names.empty());
    CHECK_FALSE(is_cross_compiler_toolchain(*openocd));

    const auto make = find_builtin_tool_definition("make");
    REQUIRE(make != nullptr);
    CHECK(make->package_name == "windows-build-tools");
    CHECK(make->other_command_names == std::vector<std::string>{"mingw32-make", "gmake"});
    CHECK_FALSE(is_cross_compiler_toolchain(*make));
}

TEST_CASE ("find_builtin_tool_definition is exact", "[buildtools]")
{
    CHECK(find_builtin_tool_definition("gdb") == nullptr);
    CHECK(find_builtin_tool_definition("") == nullptr);
    CHECK(find_builtin_tool_definition("Make") == nullptr);
    CHECK(find_builtin_tool_definition("arm-none-eabi-gcc") == nullptr);
}
