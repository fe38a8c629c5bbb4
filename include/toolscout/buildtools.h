#pragma once

#include <toolscout/base/stringview.h>

#include <string>
#include <vector>

namespace toolscout
{
    namespace BuildTools
    {
        static constexpr StringLiteral ARM_NONE_EABI = "arm-none-eabi";
        static constexpr StringLiteral OPENOCD = "openocd";
        static constexpr StringLiteral MAKE = "make";

        // The compiler looked up inside a user supplied cross compiler directory.
        static constexpr StringLiteral CROSS_COMPILER_COMMAND = "arm-none-eabi-gcc";
    }

    // The xpm package directory holding every installed version of a tool.
    static constexpr StringLiteral XPACKS_DEV_TOOLS_DIRECTORY = "@xpack-dev-tools";

    struct BuildToolDefinition
    {
        std::string name;
        // xpm package name; empty when the tool is never installed through xpm
        std::string package_name;
        // relative path from a version directory to the directory holding the executables
        std::string installed_path_suffix;
        std::string standard_command_name;
        std::vector<std::string> other_command_names;
    };

    // The cross compiler toolchain is consumed as a directory rather than as a single executable.
    bool is_cross_compiler_toolchain(const BuildToolDefinition& tool) noexcept;

    const std::vector<BuildToolDefinition>& get_builtin_tool_definitions();
    const BuildToolDefinition* find_builtin_tool_definition(StringView name);
}
