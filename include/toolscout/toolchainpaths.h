#pragma once

#include <toolscout/base/diagnostics.h>
#include <toolscout/base/expected.h>
#include <toolscout/base/files.h>
#include <toolscout/base/optional.h>
#include <toolscout/base/path.h>
#include <toolscout/base/stringview.h>

#include <toolscout/buildtools.h>
#include <toolscout/executablelocator.h>
#include <toolscout/xpmversion.h>

#include <string>
#include <vector>

namespace toolscout
{
    enum class ToolScanFailure
    {
        // the tool has no package name, or its package directory could not be listed
        DirectoryMissing,
        // the package directory was listed but held no real version directory
        NoVersionFound,
    };

    StringLiteral to_string_literal(ToolScanFailure failure) noexcept;

    enum class ToolPathKind
    {
        Found,
        NotFound,
        // no lookup could even be attempted, for example because the input was empty
        Invalid,
    };

    StringLiteral to_string_literal(ToolPathKind kind) noexcept;

    struct ToolPathResult
    {
        ToolPathKind kind;
        Path path; // empty unless kind == ToolPathKind::Found

        static ToolPathResult found(Path path);
        static ToolPathResult not_found();
        static ToolPathResult invalid();

        const Path* get() const noexcept { return kind == ToolPathKind::Found ? &path : nullptr; }
    };

    enum class AlternateCommandPolicy
    {
        // stop at the first alternate command that resolves
        FirstMatch,
        // try every alternate and keep the last one that resolved
        LastMatch,
    };

    // Returns the candidate unchanged when it is usable as a configured path.
    Optional<std::string> check_settings_path_validity(StringView candidate);

    Path get_tool_base_path(const BuildToolDefinition& tool, const Path& xpm_root);

    Optional<std::vector<DirectoryEntry>> get_tool_version_folders(DiagnosticContext& context,
                                                                   const ReadOnlyFilesystem& fs,
                                                                   const BuildToolDefinition& tool,
                                                                   const Path& xpm_root);

    // Considers only directories. Each failure is also reported to `context`.
    ExpectedT<XpmToolVersion, ToolScanFailure> find_newest_tool_version(DiagnosticContext& context,
                                                                        const ReadOnlyFilesystem& fs,
                                                                        const BuildToolDefinition& tool,
                                                                        const Path& xpm_root);

    // Resolves the standard command of the newest managed installation. The cross compiler toolchain yields the
    // directory containing its executables instead of the executable itself.
    ToolPathResult validate_managed_toolchain_path(DiagnosticContext& context,
                                                   const ReadOnlyFilesystem& fs,
                                                   const ExecutableLocator& locator,
                                                   const BuildToolDefinition& tool,
                                                   const Path& xpm_root);

    // Accepts either the compiler executable, yielding its directory, or a directory containing the compiler,
    // yielding the directory as given.
    ToolPathResult validate_cross_compiler_path(const ExecutableLocator& locator, StringView candidate);

    // Tries `candidate` itself, then `candidate`/standard command, then `candidate`/each alternate command.
    ToolPathResult resolve_tool_path(const ExecutableLocator& locator,
                                     StringView candidate,
                                     const BuildToolDefinition& definition,
                                     AlternateCommandPolicy policy = AlternateCommandPolicy::FirstMatch);
}

TOOLSCOUT_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(toolscout::ToolScanFailure);
TOOLSCOUT_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(toolscout::ToolPathKind);
