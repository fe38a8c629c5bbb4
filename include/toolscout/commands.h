#pragma once

#include <toolscout/base/cmd-parser.h>
#include <toolscout/base/files.h>
#include <toolscout/base/optional.h>
#include <toolscout/base/path.h>
#include <toolscout/base/stringview.h>

#include <toolscout/buildtools.h>
#include <toolscout/executablelocator.h>
#include <toolscout/toolchainpaths.h>

#include <string>
#include <vector>

namespace toolscout
{
    // Each command consumes the rest of `args` and terminates the process.
    using CommandFn = void (*)(CmdParser& args, const ReadOnlyFilesystem& fs);

    struct CommandRegistration
    {
        StringLiteral name;
        CommandFn function;
    };

    const std::vector<CommandRegistration>& get_commands();
    const CommandRegistration* choose_command(StringView command_name);

    static constexpr StringLiteral EnvironmentVariableXpmRoot = "TOOLSCOUT_XPM_ROOT";
    static constexpr StringLiteral EnvironmentVariableDebug = "TOOLSCOUT_DEBUG";

    // Prefers the --xpm-root value and falls back to TOOLSCOUT_XPM_ROOT. An empty value counts as absent.
    Optional<Path> get_xpm_root(const Optional<std::string>& xpm_root_option);

    // One line per definition: name, package, suffix, standard command, then alternates.
    std::string format_tool_definition(const BuildToolDefinition& definition);

    // --last-alternate-match keeps the last alternate command that resolves instead of the first.
    AlternateCommandPolicy alternate_command_policy(bool last_alternate_match) noexcept;

    // What `check` validates: the cross compiler accepts its executable or its directory, every other tool goes
    // through resolve_tool_path.
    ToolPathResult check_tool_path(const ExecutableLocator& locator,
                                   const BuildToolDefinition& tool,
                                   StringView candidate,
                                   AlternateCommandPolicy policy);

    [[noreturn]] void command_managed_and_exit(CmdParser& args, const ReadOnlyFilesystem& fs);
    [[noreturn]] void command_newest_and_exit(CmdParser& args, const ReadOnlyFilesystem& fs);
    [[noreturn]] void command_check_and_exit(CmdParser& args, const ReadOnlyFilesystem& fs);
    [[noreturn]] void command_list_and_exit(CmdParser& args, const ReadOnlyFilesystem& fs);
    [[noreturn]] void command_help_and_exit(CmdParser& args, const ReadOnlyFilesystem& fs);
}
