#include <toolscout/buildtools.h>

namespace toolscout
{
    bool is_cross_compiler_toolchain(const BuildToolDefinition& tool) noexcept
    {
        return tool.name == BuildTools::ARM_NONE_EABI;
    }

    const std::vector<BuildToolDefinition>& get_builtin_tool_definitions()
    {
        static const std::vector<BuildToolDefinition> definitions{
            BuildToolDefinition{BuildTools::ARM_NONE_EABI.to_string(),
                                "arm-none-eabi-gcc",
                                ".content/bin",
                                BuildTools::CROSS_COMPILER_COMMAND.to_string(),
                                {"arm-none-eabi-g++", "arm-none-eabi-objcopy", "arm-none-eabi-size"}},
            BuildToolDefinition{BuildTools::OPENOCD.to_string(), "openocd", ".content/bin", "openocd", {}},
            BuildToolDefinition{
                BuildTools::MAKE.to_string(), "windows-build-tools", ".content/bin", "make", {"mingw32-make", "gmake"}},
        };

        return definitions;
    }

    const BuildToolDefinition* find_builtin_tool_definition(StringView name)
    {
        for (auto&& definition : get_builtin_tool_definitions())
        {
            if (definition.name == name)
            {
                return &definition;
            }
        }

        return nullptr;
    }
}
