#include <toolscout/base/diagnostics.h>
#include <toolscout/base/system.debug.h>

#include <toolscout/toolchainpaths.h>

#include <utility>

namespace toolscout
{
    StringLiteral to_string_literal(ToolScanFailure failure) noexcept
    {
        switch (failure)
        {
            case ToolScanFailure::DirectoryMissing: return "DirectoryMissing";
            case ToolScanFailure::NoVersionFound: return "NoVersionFound";
            default: Checks::unreachable(TOOLSCOUT_LINE_INFO);
        }
    }

    StringLiteral to_string_literal(ToolPathKind kind) noexcept
    {
        switch (kind)
        {
            case ToolPathKind::Found: return "Found";
            case ToolPathKind::NotFound: return "NotFound";
            case ToolPathKind::Invalid: return "Invalid";
            default: Checks::unreachable(TOOLSCOUT_LINE_INFO);
        }
    }

    ToolPathResult ToolPathResult::found(Path path) { return ToolPathResult{ToolPathKind::Found, std::move(path)}; }
    ToolPathResult ToolPathResult::not_found() { return ToolPathResult{ToolPathKind::NotFound, Path{}}; }
    ToolPathResult ToolPathResult::invalid() { return ToolPathResult{ToolPathKind::Invalid, Path{}}; }

    Optional<std::string> check_settings_path_validity(StringView candidate)
    {
        if (candidate.empty())
        {
            return nullopt;
        }

        return candidate.to_string();
    }

    Path get_tool_base_path(const BuildToolDefinition& tool, const Path& xpm_root)
    {
        return xpm_root / XPACKS_DEV_TOOLS_DIRECTORY / tool.package_name;
    }

    Optional<std::vector<DirectoryEntry>> get_tool_version_folders(DiagnosticContext& context,
                                                                   const ReadOnlyFilesystem& fs,
                                                                   const BuildToolDefinition& tool,
                                                                   const Path& xpm_root)
    {
        if (tool.package_name.empty())
        {
            context.report_error(msgMissingPackageName, msg::tool_name = tool.name);
            return nullopt;
        }

        const auto base_path = get_tool_base_path(tool, xpm_root);
        context.statusln(msg::format(msgScanningToolVersions, msg::path = base_path));
        std::error_code ec;
        auto entries = fs.read_directory(base_path, ec);
        if (ec)
        {
            context.report_error(msgToolDirectoryMissing, msg::path = base_path, msg::error_msg = ec.message());
            return nullopt;
        }

        return entries;
    }

    ExpectedT<XpmToolVersion, ToolScanFailure> find_newest_tool_version(DiagnosticContext& context,
                                                                        const ReadOnlyFilesystem& fs,
                                                                        const BuildToolDefinition& tool,
                                                                        const Path& xpm_root)
    {
        const auto maybe_entries = get_tool_version_folders(context, fs, tool, xpm_root);
        const auto entries = maybe_entries.get();
        if (!entries)
        {
            return ToolScanFailure::DirectoryMissing;
        }

        Optional<XpmToolVersion> newest;
        for (auto&& entry : *entries)
        {
            if (entry.type != FileType::directory)
            {
                Debug::println("skipping ", entry.name, " because it is ", entry.type);
                continue;
            }

            auto candidate = parse_xpm_version(entry.name);
            if (!is_real_version(candidate))
            {
                context.statusln(msg::format(msgSkippingVersionDirectory, msg::path = entry.name));
            }

            newest = newer_version(newest, candidate);
        }

        if (auto found = newest.get())
        {
            if (is_real_version(*found))
            {
                Debug::println("newest ", tool.name, " is ", found->source_name);
                return std::move(*found);
            }
        }

        context.report_error(msgNoToolFound, msg::tool_name = tool.name, msg::path = get_tool_base_path(tool, xpm_root));
        return ToolScanFailure::NoVersionFound;
    }

    ToolPathResult validate_managed_toolchain_path(DiagnosticContext& context,
                                                   const ReadOnlyFilesystem& fs,
                                                   const ExecutableLocator& locator,
                                                   const BuildToolDefinition& tool,
                                                   const Path& xpm_root)
    {
        if (tool.package_name.empty())
        {
            context.report_error(msgMissingPackageName, msg::tool_name = tool.name);
            return ToolPathResult::invalid();
        }

        auto maybe_newest = find_newest_tool_version(context, fs, tool, xpm_root);
        const auto newest = maybe_newest.get();
        if (!newest)
        {
            return ToolPathResult::not_found();
        }

        auto tool_directory = get_tool_base_path(tool, xpm_root) / newest->source_name;
        if (!tool.installed_path_suffix.empty())
        {
            tool_directory /= tool.installed_path_suffix;
        }

        const auto executable = tool_directory / tool.standard_command_name;
        context.statusln(msg::format(msgResolvingToolPath, msg::tool_name = tool.name, msg::path = executable));
        auto resolved = locator.locate(executable);
        if (!resolved)
        {
            context.report_error(msgToolExecutableNotFound, msg::tool_name = tool.name, msg::path = executable);
            return ToolPathResult::not_found();
        }

        if (is_cross_compiler_toolchain(tool))
        {
            return ToolPathResult::found(std::move(tool_directory));
        }

        return ToolPathResult::found(std::move(resolved).value_or_exit(TOOLSCOUT_LINE_INFO));
    }

    ToolPathResult validate_cross_compiler_path(const ExecutableLocator& locator, StringView candidate)
    {
        if (!check_settings_path_validity(candidate))
        {
            return ToolPathResult::invalid();
        }

        const auto direct = locator.locate(candidate);
        if (auto executable = direct.get())
        {
            Debug::println(candidate, " is the cross compiler itself");
            return ToolPathResult::found(Path{executable->parent_path()});
        }

        const auto in_directory = (Path{candidate} / BuildTools::CROSS_COMPILER_COMMAND).lexically_normal();
        if (locator.locate(in_directory))
        {
            Debug::println(candidate, " contains ", BuildTools::CROSS_COMPILER_COMMAND);
            return ToolPathResult::found(Path{candidate});
        }

        return ToolPathResult::not_found();
    }

    ToolPathResult resolve_tool_path(const ExecutableLocator& locator,
                                     StringView candidate,
                                     const BuildToolDefinition& definition,
                                     AlternateCommandPolicy policy)
    {
        if (!check_settings_path_validity(candidate))
        {
            return ToolPathResult::invalid();
        }

        if (auto direct = locator.locate(candidate))
        {
            return ToolPathResult::found(std::move(direct).value_or_exit(TOOLSCOUT_LINE_INFO));
        }

        const Path directory{candidate};
        if (!definition.standard_command_name.empty())
        {
            if (auto standard = locator.locate(directory / definition.standard_command_name))
            {
                return ToolPathResult::found(std::move(standard).value_or_exit(TOOLSCOUT_LINE_INFO));
            }
        }

        auto result = ToolPathResult::not_found();
        for (auto&& command_name : definition.other_command_names)
        {
            auto alternate = locator.locate(directory / command_name);
            if (!alternate)
            {
                continue;
            }

            Debug::println(definition.name, ": alternate command ", command_name, " resolved to ", *alternate.get());
            result = ToolPathResult::found(std::move(alternate).value_or_exit(TOOLSCOUT_LINE_INFO));
            if (policy == AlternateCommandPolicy::FirstMatch)
            {
                break;
            }
        }

        return result;
    }
}
