#include <toolscout/base/checks.h>
#include <toolscout/base/diagnostics.h>
#include <toolscout/base/message_sinks.h>
#include <toolscout/base/strings.h>
#include <toolscout/base/system.debug.h>
#include <toolscout/base/system.h>

#include <toolscout/commands.h>
#include <toolscout/executablelocator.h>
#include <toolscout/toolchainpaths.h>

#include <utility>

namespace
{
    using namespace toolscout;

    constexpr StringLiteral OPTION_XPM_ROOT = "xpm-root";
    constexpr StringLiteral SWITCH_LAST_ALTERNATE_MATCH = "last-alternate-match";

    const BuildToolDefinition& get_tool_definition_or_exit(StringView tool_name)
    {
        if (const auto definition = find_builtin_tool_definition(tool_name))
        {
            return *definition;
        }

        Checks::msg_exit_with_error(TOOLSCOUT_LINE_INFO, msgUnknownTool, msg::tool_name = tool_name);
    }

    Path get_xpm_root_or_exit(const Optional<std::string>& xpm_root_option)
    {
        auto maybe_xpm_root = get_xpm_root(xpm_root_option);
        if (const auto xpm_root = maybe_xpm_root.get())
        {
            return std::move(*xpm_root);
        }

        Checks::msg_exit_with_error(
            TOOLSCOUT_LINE_INFO, msgXpmRootRequired, msg::env_var = EnvironmentVariableXpmRoot);
    }

    // status lines from the resolver are only interesting while debugging
    MessageSink& status_sink() { return Debug::g_debugging ? stderr_sink : null_sink; }

    [[noreturn]] void print_path_and_exit(const Path& path)
    {
        msg::write_unlocalized_text_to_stdout(Color::none, Strings::concat(path, '\n'));
        Checks::exit_success(TOOLSCOUT_LINE_INFO);
    }

    // Parses the options shared by managed and newest, then their single tool argument.
    std::pair<const BuildToolDefinition*, Path> parse_tool_and_xpm_root(CmdParser& args, StringView command_name)
    {
        Optional<std::string> xpm_root_option;
        args.parse_option(OPTION_XPM_ROOT, xpm_root_option);
        const auto positional = args.consume_remaining_args(command_name, 1);
        args.exit_with_errors(msg::format(msgUsageText));
        const auto& tool = get_tool_definition_or_exit(positional[0]);
        return {&tool, get_xpm_root_or_exit(xpm_root_option)};
    }
}

namespace toolscout
{
    const std::vector<CommandRegistration>& get_commands()
    {
        static const std::vector<CommandRegistration> commands{
            {"managed", command_managed_and_exit},
            {"newest", command_newest_and_exit},
            {"check", command_check_and_exit},
            {"list", command_list_and_exit},
            {"help", command_help_and_exit},
        };

        return commands;
    }

    const CommandRegistration* choose_command(StringView command_name)
    {
        for (auto&& registration : get_commands())
        {
            if (registration.name == command_name)
            {
                return &registration;
            }
        }

        return nullptr;
    }

    Optional<Path> get_xpm_root(const Optional<std::string>& xpm_root_option)
    {
        if (const auto from_option = xpm_root_option.get())
        {
            if (!from_option->empty())
            {
                return Path{*from_option};
            }
        }

        auto from_environment = get_environment_variable(EnvironmentVariableXpmRoot);
        if (const auto xpm_root = from_environment.get())
        {
            if (!xpm_root->empty())
            {
                Debug::println("Using xpm root from ", EnvironmentVariableXpmRoot, ": ", *xpm_root);
                return Path{std::move(*xpm_root)};
            }
        }

        return nullopt;
    }

    std::string format_tool_definition(const BuildToolDefinition& definition)
    {
        auto result = Strings::concat(definition.name,
                                      ": package ",
                                      definition.package_name,
                                      ", command ",
                                      definition.installed_path_suffix,
                                      '/',
                                      definition.standard_command_name);
        if (!definition.other_command_names.empty())
        {
            Strings::append(result,
                            " (alternates: ",
                            Strings::join(", ", definition.other_command_names),
                            ')');
        }

        return result;
    }

    AlternateCommandPolicy alternate_command_policy(bool last_alternate_match) noexcept
    {
        return last_alternate_match ? AlternateCommandPolicy::LastMatch : AlternateCommandPolicy::FirstMatch;
    }

    ToolPathResult check_tool_path(const ExecutableLocator& locator,
                                   const BuildToolDefinition& tool,
                                   StringView candidate,
                                   AlternateCommandPolicy policy)
    {
        if (is_cross_compiler_toolchain(tool))
        {
            return validate_cross_compiler_path(locator, candidate);
        }

        return resolve_tool_path(locator, candidate, tool, policy);
    }

    void command_managed_and_exit(CmdParser& args, const ReadOnlyFilesystem& fs)
    {
        const auto parsed = parse_tool_and_xpm_root(args, "managed");
        const auto& tool = *parsed.first;
        BufferedDiagnosticContext context{status_sink()};
        const PathExecutableLocator locator{fs};
        const auto result = validate_managed_toolchain_path(context, fs, locator, tool, parsed.second);
        if (const auto path = result.get())
        {
            print_path_and_exit(*path);
        }

        context.print_to(stderr_sink);
        Checks::exit_fail(TOOLSCOUT_LINE_INFO);
    }

    void command_newest_and_exit(CmdParser& args, const ReadOnlyFilesystem& fs)
    {
        const auto parsed = parse_tool_and_xpm_root(args, "newest");
        const auto& tool = *parsed.first;
        BufferedDiagnosticContext context{status_sink()};
        const auto maybe_newest = find_newest_tool_version(context, fs, tool, parsed.second);
        if (const auto newest = maybe_newest.get())
        {
            msg::println(msgNewestToolVersion,
                         msg::tool_name = tool.name,
                         msg::version = *newest,
                         msg::path = get_tool_base_path(tool, parsed.second) / newest->source_name);
            Checks::exit_success(TOOLSCOUT_LINE_INFO);
        }

        context.print_to(stderr_sink);
        Checks::exit_fail(TOOLSCOUT_LINE_INFO);
    }

    void command_check_and_exit(CmdParser& args, const ReadOnlyFilesystem& fs)
    {
        bool last_alternate_match = false;
        args.parse_switch(SWITCH_LAST_ALTERNATE_MATCH, last_alternate_match);
        const auto positional = args.consume_remaining_args("check", 2);
        args.exit_with_errors(msg::format(msgUsageText));

        const auto& tool = get_tool_definition_or_exit(positional[0]);
        const auto& candidate = positional[1];
        const PathExecutableLocator locator{fs};
        Debug::println("Checking ", tool.name, " at ", candidate);
        const auto result =
            check_tool_path(locator, tool, candidate, alternate_command_policy(last_alternate_match));
        switch (result.kind)
        {
            case ToolPathKind::Found: print_path_and_exit(result.path);
            case ToolPathKind::NotFound:
                msg::println_error(msgToolExecutableNotFound, msg::tool_name = tool.name, msg::path = candidate);
                break;
            case ToolPathKind::Invalid: msg::println_error(msgEmptyToolPath, msg::tool_name = tool.name); break;
            default: Checks::unreachable(TOOLSCOUT_LINE_INFO);
        }

        Checks::exit_fail(TOOLSCOUT_LINE_INFO);
    }

    void command_list_and_exit(CmdParser& args, const ReadOnlyFilesystem&)
    {
        args.enforce_no_remaining_args("list");
        args.exit_with_errors(msg::format(msgUsageText));
        msg::println(msgAvailableTools);
        for (auto&& definition : get_builtin_tool_definitions())
        {
            msg::write_unlocalized_text_to_stdout(Color::none,
                                                  Strings::concat("  ", format_tool_definition(definition), '\n'));
        }

        Checks::exit_success(TOOLSCOUT_LINE_INFO);
    }

    void command_help_and_exit(CmdParser& args, const ReadOnlyFilesystem&)
    {
        args.enforce_no_remaining_args("help");
        args.exit_with_errors(msg::format(msgUsageText));
        msg::println(msgUsageText);
        Checks::exit_success(TOOLSCOUT_LINE_INFO);
    }
}
